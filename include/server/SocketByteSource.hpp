#pragma once

#include <boost/asio.hpp>

#include "core/ByteStream.hpp"

namespace chunkdrop {
namespace server {

// Body bytes of one connection: whatever read_until() buffered past the headers, then the socket.
class SocketByteSource : public core::ByteSource {
public:
    SocketByteSource(boost::asio::ip::tcp::socket& socket, boost::asio::streambuf& buffered)
        : socket_(socket), buffered_(buffered) {}

    std::size_t readSome(char* dst, std::size_t n) override;

private:
    boost::asio::ip::tcp::socket& socket_;
    boost::asio::streambuf& buffered_;
};

} // namespace server
} // namespace chunkdrop
