#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

namespace chunkdrop {
namespace core {

/**
 * Forward-only source of request body bytes (a socket, or a string in tests).
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * Read up to n bytes into dst.
     * @return Bytes read; 0 only when the peer has nothing more to send
     */
    virtual std::size_t readSome(char* dst, std::size_t n) = 0;
};

/**
 * Append-only destination for extracted or assembled bytes.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const char* data, std::size_t n) = 0;
    virtual void flush() {}
};

/**
 * Position within a request body plus the bytes still expected from it.
 * Never pulls more than the declared Content-Length from the source.
 */
class BodyReader {
public:
    BodyReader(ByteSource& source, std::uint64_t contentLength);

    std::uint64_t length() const { return length_; }
    std::uint64_t remaining() const { return remaining_; }
    std::uint64_t consumed() const { return length_ - remaining_; }
    bool exhausted() const { return remaining_ == 0; }

    /**
     * Read one line, terminator included.
     * @param maxLen Longest accepted line; a longer one is a ProtocolError
     * @return false when the body ended before any byte of a new line
     */
    bool readLine(std::string& line, std::size_t maxLen);

    // Returns 0 once the declared length is consumed; throws TruncationError
    // when the peer closes first.
    std::size_t read(char* dst, std::size_t n);

    // Skips at most limit bytes of what is left; returns how many were skipped.
    std::uint64_t discard(std::uint64_t limit);

private:
    std::size_t fill();
    std::size_t buffered() const { return pending_.size() - pendingPos_; }

    ByteSource& source_;
    std::uint64_t length_;
    std::uint64_t remaining_;  // not yet handed to the caller
    std::uint64_t unread_;     // not yet pulled from the source
    std::string pending_;
    std::size_t pendingPos_ = 0;
};

class StringSource : public ByteSource {
public:
    // maxRead caps each readSome() call, 0 means unlimited
    explicit StringSource(std::string data, std::size_t maxRead = 0)
        : data_(std::move(data)), maxRead_(maxRead) {}

    std::size_t readSome(char* dst, std::size_t n) override;

private:
    std::string data_;
    std::size_t pos_ = 0;
    std::size_t maxRead_;
};

class StringSink : public ByteSink {
public:
    void write(const char* data, std::size_t n) override { data_.append(data, n); }
    const std::string& data() const { return data_; }

private:
    std::string data_;
};

/**
 * Binary file opened with truncation. Open and write failures are StorageErrors.
 */
class FileSink : public ByteSink {
public:
    explicit FileSink(const std::filesystem::path& path);

    void write(const char* data, std::size_t n) override;
    void flush() override;
    void close();

    const std::filesystem::path& path() const { return path_; }
    std::uint64_t written() const { return written_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::uint64_t written_ = 0;
};

} // namespace core
} // namespace chunkdrop
