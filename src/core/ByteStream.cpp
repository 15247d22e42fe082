#include "core/ByteStream.hpp"
#include "core/UploadError.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace chunkdrop {
namespace core {

namespace {
    constexpr std::size_t kFillSize = 16 * 1024;
}

BodyReader::BodyReader(ByteSource& source, std::uint64_t contentLength)
    : source_(source), length_(contentLength), remaining_(contentLength), unread_(contentLength) {}

std::size_t BodyReader::fill() {
    if (unread_ == 0) return 0;

    if (pendingPos_ > 0) {
        pending_.erase(0, pendingPos_);
        pendingPos_ = 0;
    }

    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(unread_, kFillSize));
    const std::size_t old = pending_.size();
    pending_.resize(old + want);
    const std::size_t got = source_.readSome(&pending_[old], want);
    pending_.resize(old + got);

    if (got == 0) {
        throw UploadError(ErrorKind::Truncation,
                          "truncated body: connection closed after " +
                          std::to_string(length_ - unread_) + " of " +
                          std::to_string(length_) + " bytes");
    }
    unread_ -= got;
    return got;
}

bool BodyReader::readLine(std::string& line, std::size_t maxLen) {
    line.clear();
    std::size_t scanned = 0;

    for (;;) {
        const char* begin = pending_.data() + pendingPos_;
        const std::size_t avail = buffered();

        const void* nl = std::memchr(begin + scanned, '\n', avail - scanned);
        if (nl != nullptr) {
            const std::size_t len = static_cast<std::size_t>(static_cast<const char*>(nl) - begin) + 1;
            if (len > maxLen) {
                throw UploadError(ErrorKind::Protocol,
                                  "line exceeds " + std::to_string(maxLen) + " bytes");
            }
            line.assign(begin, len);
            pendingPos_ += len;
            remaining_ -= len;
            return true;
        }

        scanned = avail;
        if (avail > maxLen) {
            throw UploadError(ErrorKind::Protocol,
                              "line exceeds " + std::to_string(maxLen) + " bytes");
        }

        if (unread_ == 0) {
            if (avail == 0) return false;
            // Last line of the body without a terminator
            line.assign(begin, avail);
            pendingPos_ += avail;
            remaining_ -= avail;
            return true;
        }

        fill();
    }
}

std::size_t BodyReader::read(char* dst, std::size_t n) {
    if (remaining_ == 0 || n == 0) return 0;
    n = static_cast<std::size_t>(std::min<std::uint64_t>(n, remaining_));

    if (buffered() > 0) {
        const std::size_t take = std::min(n, buffered());
        std::memcpy(dst, pending_.data() + pendingPos_, take);
        pendingPos_ += take;
        remaining_ -= take;
        if (pendingPos_ == pending_.size()) {
            pending_.clear();
            pendingPos_ = 0;
        }
        return take;
    }

    // Nothing buffered: remaining_ == unread_
    const std::size_t got = source_.readSome(dst, n);
    if (got == 0) {
        throw UploadError(ErrorKind::Truncation,
                          "truncated body: connection closed after " +
                          std::to_string(length_ - unread_) + " of " +
                          std::to_string(length_) + " bytes");
    }
    unread_ -= got;
    remaining_ -= got;
    return got;
}

std::uint64_t BodyReader::discard(std::uint64_t limit) {
    char scratch[kFillSize];
    std::uint64_t skipped = 0;
    while (skipped < limit && remaining_ > 0) {
        const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(limit - skipped, sizeof(scratch)));
        skipped += read(scratch, want);
    }
    return skipped;
}

std::size_t StringSource::readSome(char* dst, std::size_t n) {
    std::size_t take = std::min(n, data_.size() - pos_);
    if (maxRead_ > 0) take = std::min(take, maxRead_);
    std::memcpy(dst, data_.data() + pos_, take);
    pos_ += take;
    return take;
}

FileSink::FileSink(const std::filesystem::path& path) : path_(path) {
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw UploadError(ErrorKind::Storage,
                          "cannot create destination " + path_.string() +
                          " (" + std::strerror(errno) + ")");
    }
}

void FileSink::write(const char* data, std::size_t n) {
    out_.write(data, static_cast<std::streamsize>(n));
    if (!out_) {
        throw UploadError(ErrorKind::Storage, "write failed on " + path_.string());
    }
    written_ += n;
}

void FileSink::flush() {
    out_.flush();
    if (!out_) {
        throw UploadError(ErrorKind::Storage, "flush failed on " + path_.string());
    }
}

void FileSink::close() {
    if (!out_.is_open()) return;
    out_.close();
    if (out_.fail()) {
        throw UploadError(ErrorKind::Storage, "close failed on " + path_.string());
    }
}

} // namespace core
} // namespace chunkdrop
