#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkdrop {
namespace core {

using ChunkIndex = std::uint32_t;

enum class ErrorKind {
    Validation,        // missing or malformed request parameter
    Protocol,          // multipart framing violated
    IncompleteUpload,  // finalize before every chunk arrived
    Storage,           // filesystem open/write/delete failure
    Truncation,        // peer closed before Content-Length bytes arrived
    Integrity,         // chunk checksum mismatch
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::IncompleteUpload: return "IncompleteUploadError";
        case ErrorKind::Storage: return "StorageError";
        case ErrorKind::Truncation: return "TruncationError";
        case ErrorKind::Integrity: return "IntegrityError";
        default: return "UnknownError";
    }
}

/**
 * Failure raised by the ingestion engine. The request handler turns it
 * into an outcome value, it never crosses the HTTP boundary as an exception.
 */
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * Finalize found gaps. Carries the indices the client still has to send.
 */
class IncompleteUploadError : public UploadError {
public:
    explicit IncompleteUploadError(std::vector<ChunkIndex> missing)
        : UploadError(ErrorKind::IncompleteUpload, describe(missing)),
          missing_(std::move(missing)) {}

    const std::vector<ChunkIndex>& missing() const { return missing_; }

    // "Missing chunks: [1, 4]"
    static std::string describe(const std::vector<ChunkIndex>& missing) {
        std::string out = "Missing chunks: [";
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) out += ", ";
            out += std::to_string(missing[i]);
        }
        out += "]";
        return out;
    }

private:
    std::vector<ChunkIndex> missing_;
};

} // namespace core
} // namespace chunkdrop
