#pragma once
#include <boost/asio.hpp>
#include <optional>
#include <unordered_map>
#include <iostream>
#include <string>
#include "const/rest_enums.hpp"
#include "server/endpoint.hpp"
#include "server/ServerConfig.hpp"

namespace chunkdrop {
namespace server {

// Blocking HTTP/1.1 server, one thread per connection, one request per connection.
class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unordered_map<std::string, endpoint> handlers_;
  std::optional<endpoint> fallback_;
  ServerConfig config_;
public:
    explicit wServer(const ServerConfig& config);
    void add_endpoint(const endpoint& ep);

    // Serves requests whose path has no endpoint of its own, if the method matches
    void set_fallback(const endpoint& ep);

    void run();

    // Answers the one request on an accepted connection, then closes it
    void serve(boost::asio::ip::tcp::socket socket);

private:
    http::Response dispatch(const http::Request& request, core::BodyReader& body) const;
};

} // namespace server
} // namespace chunkdrop
