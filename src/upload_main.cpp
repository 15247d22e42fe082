#include <iostream>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "client/ChunkUploader.hpp"
#include "core/ByteUnits.hpp"
#include "config.hpp"

using namespace chunkdrop;

namespace {

void print_usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [--chunk-size MIB] [--retries N] [--no-crc] URL FILE..." << std::endl;
}

int parse_number(const std::string& flag, const std::string& value)
{
    if (value.empty() || value.size() > 6 || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    return std::stoi(value);
}

} // namespace

int main(int argc, char** argv)
{
    std::uint64_t chunk_size = defaults::kClientChunkSize;
    int retries = defaults::kClientRetries;
    bool send_crc = true;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };

            if (arg == "--chunk-size") {
                int mib = parse_number(arg, value());
                if (mib == 0) throw std::invalid_argument("--chunk-size must be positive");
                chunk_size = static_cast<std::uint64_t>(mib) * 1024 * 1024;
            }
            else if (arg == "--retries") retries = parse_number(arg, value());
            else if (arg == "--no-crc") send_crc = false;
            else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("unknown option " + arg);
            else positional.push_back(arg);
        }
        if (positional.size() < 2) {
            throw std::invalid_argument("need a server URL and at least one file");
        }
    }
    catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int failures = 0;
    client::ChunkUploader uploader(positional[0], chunk_size, retries, send_crc);
    for (size_t i = 1; i < positional.size(); ++i)
    {
        try {
            client::UploadReport report = uploader.upload(positional[i]);
            std::cout << report.filename << ": " << report.message << " ("
                      << report.chunks << " chunk(s), " << core::formatBytes(report.bytes);
            if (report.retries > 0) std::cout << ", " << report.retries << " retried";
            std::cout << ")" << std::endl;
        }
        catch (const std::exception& e) {
            std::cerr << positional[i] << ": " << e.what() << std::endl;
            ++failures;
        }
    }

    curl_global_cleanup();
    return failures == 0 ? 0 : 1;
}
