#include "server/wserver.hpp"
#include "server/endpoint.hpp"
#include "server/SocketByteSource.hpp"
#include "core/UploadError.hpp"
#include "http/QueryString.hpp"
#include "config.hpp"

#include <poll.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chunkdrop {
namespace server {

namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

// Closing with unread body bytes makes the kernel send RST, which can destroy the
// response before the peer reads it. Half-close instead and swallow what still
// arrives, up to `limit` bytes or until the linger deadline.
void linger_drain(tcp::socket& socket, std::uint64_t limit)
{
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
    socket.non_blocking(true, ec);
    if (ec) return;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(defaults::kLingerMillis);
    std::vector<char> scratch(defaults::kReadQuantum);

    while (limit > 0)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;

        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(limit, scratch.size()));
        std::size_t got = socket.read_some(asio::buffer(scratch.data(), want), ec);
        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            pollfd pfd{socket.native_handle(), POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left)) <= 0) break;
            continue;
        }
        if (ec) break;
        limit -= got;
    }
}

}

wServer::wServer(const ServerConfig& config): acceptor_(io_context_), config_(config) {}


void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

void wServer::set_fallback(const endpoint& ep)
{
    fallback_ = ep;
}


void wServer::run()
{
    tcp::endpoint endpoint(asio::ip::make_address(config_.bind), config_.port);
    acceptor_ = tcp::acceptor(io_context_, endpoint);

    const std::string host = (config_.bind.empty() || config_.bind == "0.0.0.0") ? "localhost" : config_.bind;
    std::cout << "Serving HTTP on " << host << " port " << config_.port
              << " (http://" << host << ":" << config_.port << "/) ..." << std::endl;

    while (true)
    {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            std::cerr << "[server] accept failed: " << ec.message() << std::endl;
            continue;
        }

        std::thread(&wServer::serve, this, std::move(socket)).detach();
    }
}


http::Response wServer::dispatch(const http::Request& request, core::BodyReader& body) const
{
    const endpoint* ep = nullptr;

    auto it = handlers_.find(request.path);
    if (it != handlers_.end()) {
        if (it->second.get_rest_type() != request.method) {
            return http::Response::methodNotAllowed();
        }
        ep = &it->second;
    }
    else if (fallback_ && fallback_->get_rest_type() == request.method) {
        ep = &*fallback_;
    }
    else {
        return http::Response::notFound();
    }

    try {
        return ep->get_handler()(request, body);
    }
    catch (const std::exception& e) {
        std::cerr << "[server] handler for " << request.path << " threw: " << e.what() << std::endl;
        return http::Response::text(500, std::string("Internal Server Error: ") + e.what());
    }
}


void wServer::serve(tcp::socket socket)
{
    auto trim = [](std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
        s = s.substr(a, b - a);
    };
    auto tolower_inplace = [](std::string& s) {
        for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    };
    auto write_response = [&socket](const http::Response& response) {
        std::ostringstream head;
        head << "HTTP/1.1 " << response.status << " " << http::statusText(response.status) << "\r\n";
        head << "Server: " << CHUNKDROP_SERVER_NAME << "\r\n";
        head << "Content-Length: " << response.body.size() << "\r\n";
        head << "Content-Type: " << response.contentType << "\r\n";
        head << "Connection: close\r\n\r\n";
        const std::string head_str = head.str();

        std::vector<asio::const_buffer> buffers;
        buffers.push_back(asio::buffer(head_str));
        buffers.push_back(asio::buffer(response.body));

        boost::system::error_code ec;
        asio::write(socket, buffers, ec);
        if (ec) {
            std::cerr << "[server] write failed: " << ec.message() << std::endl;
        }
    };

    // Early refusals: the body, if any, was never read
    auto reject = [&](const http::Response& response) {
        write_response(response);
        linger_drain(socket, defaults::kMaxDrainBytes);
    };

    boost::system::error_code peer_ec;
    const auto peer = socket.remote_endpoint(peer_ec);
    const std::string client = peer_ec ? std::string("unknown") : peer.address().to_string();

    try {
        asio::streambuf buf(config_.maxHeaderBytes);
        boost::system::error_code ec;
        asio::read_until(socket, buf, "\r\n\r\n", ec);
        if (ec) {
            if (ec == asio::error::not_found) {
                reject(http::Response::text(431, "Request header block too large"));
            } else if (ec != asio::error::eof) {
                std::cerr << "[server] failed reading request from " << client << ": " << ec.message() << std::endl;
            }
            return;
        }

        std::istream request_stream(&buf);

        std::string method, target, version;
        request_stream >> method >> target >> version;

        std::string dummy;
        std::getline(request_stream, dummy);

        if (target.empty() || version.rfind("HTTP/", 0) != 0) {
            reject(http::Response::text(400, "Malformed request line"));
            return;
        }

        http::Request request;
        try {
            request.method = from_string(method);
        }
        catch (const std::invalid_argument& e) {
            std::cerr << "[server] " << client << ": " << e.what() << std::endl;
            reject(http::Response::text(501, "Not Implemented"));
            return;
        }

        request.target = target;
        std::string query;
        http::splitTarget(target, request.path, query);
        request.query = http::parseQuery(query);

        std::string header_line;
        while (std::getline(request_stream, header_line))
        {
            if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
            if (header_line.empty()) break;

            auto colon = header_line.find(':');
            if (colon == std::string::npos) continue;

            std::string name = header_line.substr(0, colon);
            std::string value = header_line.substr(colon + 1);
            trim(name); trim(value);
            tolower_inplace(name);
            request.headers.emplace(name, value);
        }

        const std::string content_length = request.header("content-length");
        if (!content_length.empty()) {
            if (content_length.find_first_not_of("0123456789") != std::string::npos || content_length.size() > 19) {
                reject(http::Response::text(400, "Invalid Content-Length"));
                return;
            }
            request.contentLength = std::stoull(content_length);
            request.hasContentLength = true;
        }

        std::string transfer_encoding = request.header("transfer-encoding");
        tolower_inplace(transfer_encoding);
        if (!transfer_encoding.empty() && transfer_encoding != "identity") {
            reject(http::Response::text(411, "Transfer-Encoding is not supported, send Content-Length"));
            return;
        }
        if ((request.method == HttpRequest::POST || request.method == HttpRequest::PUT) && !request.hasContentLength) {
            reject(http::Response::text(411, "Content-Length required"));
            return;
        }

        std::string expect = request.header("expect");
        tolower_inplace(expect);
        if (expect == "100-continue") {
            asio::write(socket, asio::buffer(std::string("HTTP/1.1 100 Continue\r\n\r\n")), ec);
            if (ec) {
                std::cerr << "[server] failed to send 100 Continue to " << client << ": " << ec.message() << std::endl;
                return;
            }
        }

        SocketByteSource source(socket, buf);
        core::BodyReader body(source, request.contentLength);

        http::Response response = dispatch(request, body);

        if (!body.exhausted()) {
            if (body.remaining() <= defaults::kMaxDrainBytes) {
                try {
                    body.discard(defaults::kMaxDrainBytes);
                }
                catch (const core::UploadError& e) {
                    std::cerr << "[server] " << client << ": " << e.what() << std::endl;
                }
            } else {
                std::cerr << "[server] " << client << ": answering with "
                          << body.remaining() << " unread body bytes" << std::endl;
            }
        }

        std::cout << "[server] " << client << " \"" << to_string(request.method) << " " << target << "\" "
                  << response.status << std::endl;

        write_response(response);

        if (!body.exhausted()) {
            // Bytes still parked in `buf` already left the kernel
            linger_drain(socket, body.remaining() - std::min<std::uint64_t>(body.remaining(), buf.size()));
        } else {
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
        socket.close(ec);
    }
    catch (const std::exception& e) {
        std::cerr << "[server] connection from " << client << " failed: " << e.what() << std::endl;
    }
}

} // namespace server
} // namespace chunkdrop
