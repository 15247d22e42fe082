#include "server/SocketByteSource.hpp"

#include <algorithm>
#include <iostream>

namespace chunkdrop {
namespace server {

namespace asio = boost::asio;

std::size_t SocketByteSource::readSome(char* dst, std::size_t n) {
    if (n == 0) return 0;

    if (buffered_.size() > 0) {
        std::size_t take = asio::buffer_copy(asio::buffer(dst, std::min(n, buffered_.size())),
                                             buffered_.data());
        buffered_.consume(take);
        return take;
    }

    boost::system::error_code ec;
    std::size_t got = socket_.read_some(asio::buffer(dst, n), ec);
    if (ec) {
        // A closed connection is the only cancellation signal; the reader reports truncation
        if (ec != asio::error::eof) {
            std::cerr << "[server] read error: " << ec.message() << std::endl;
        }
        return 0;
    }
    return got;
}

} // namespace server
} // namespace chunkdrop
