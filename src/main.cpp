#include <iostream>
#include <string>
#include <chrono>
#include <memory>
#include <stdexcept>

#include "core/ChunkCoordinator.hpp"
#include "core/FileChunkStore.hpp"
#include "server/wserver.hpp"
#include "server/endpoint.hpp"
#include "server/ServerConfig.hpp"
#include "server/UploadHandler.hpp"
#include "const/rest_enums.hpp"
#include <nlohmann/json.hpp>

using namespace chunkdrop;

namespace {

void print_usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [--config FILE] [--bind ADDR] [--root DIR] [port]" << std::endl;
}

// Config file first, command line flags on top
server::ServerConfig load_config(int argc, char** argv)
{
    std::string config_file, bind, root, port;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(std::string(flag) + " needs a value");
            return argv[++i];
        };

        if (arg == "--config") config_file = value("--config");
        else if (arg == "--bind") bind = value("--bind");
        else if (arg == "--root") root = value("--root");
        else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("unknown option " + arg);
        else if (port.empty()) port = arg;
        else throw std::invalid_argument("unexpected argument " + arg);
    }

    server::ServerConfig config = config_file.empty()
        ? server::ServerConfig()
        : server::ServerConfig::fromFile(config_file);

    nlohmann::json overrides = nlohmann::json::object();
    if (!bind.empty()) overrides["bind"] = bind;
    if (!root.empty()) overrides["root"] = root;
    if (!port.empty()) {
        if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) {
            throw std::invalid_argument("port must be a number, got '" + port + "'");
        }
        overrides["port"] = std::stoi(port);
    }
    config.apply(overrides);
    config.validate();
    return config;
}

} // namespace

int main(int argc, char** argv)
{
    server::ServerConfig config;
    try {
        config = load_config(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        core::FileChunkStore store(config.chunkDirectory(), config.readQuantum);
        store.ensureDirectory();
        if (config.staleChunkSeconds > 0) {
            store.purgeOlderThan(std::chrono::seconds(config.staleChunkSeconds));
        }

        core::ChunkCoordinator chunks(store, config.root, config.maxChunks);
        server::UploadHandler uploadHandler(config, chunks);

        auto server = std::make_shared<server::wServer>(config);

        server::endpoint chunk_ep(
            [&uploadHandler](const http::Request& request, core::BodyReader& body) {
                return server::UploadHandler::toApiResponse(uploadHandler.handleChunk(request, body));
            },
            HttpRequest::POST,
            "/upload_chunk"
        );
        server->add_endpoint(chunk_ep);

        server::endpoint finalize_ep(
            [&uploadHandler](const http::Request& request, core::BodyReader&) {
                return server::UploadHandler::toApiResponse(uploadHandler.handleFinalize(request));
            },
            HttpRequest::POST,
            "/finalize_upload"
        );
        server->add_endpoint(finalize_ep);

        server::endpoint status_ep(
            [&uploadHandler](const http::Request& request, core::BodyReader&) {
                return server::UploadHandler::toApiResponse(uploadHandler.handleStatus(request));
            },
            HttpRequest::GET,
            "/upload_status"
        );
        server->add_endpoint(status_ep);

        server::endpoint abort_ep(
            [&uploadHandler](const http::Request& request, core::BodyReader&) {
                return server::UploadHandler::toApiResponse(uploadHandler.handleAbort(request));
            },
            HttpRequest::POST,
            "/abort_upload"
        );
        server->add_endpoint(abort_ep);

        // Form uploads may target any directory below the root
        server::endpoint form_ep(
            [&uploadHandler](const http::Request& request, core::BodyReader& body) {
                return server::UploadHandler::toResultPage(uploadHandler.handleMultipart(request, body),
                                                           request.header("referer"));
            },
            HttpRequest::POST,
            "/"
        );
        server->set_fallback(form_ep);
        server->add_endpoint(form_ep);

        server->run();
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
