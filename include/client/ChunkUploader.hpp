#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "core/UploadError.hpp"

namespace chunkdrop {
namespace client {

struct ChunkSpan {
    core::ChunkIndex index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

// Splits fileSize bytes into chunkSize pieces; an empty file still gets one empty chunk
std::vector<ChunkSpan> planChunks(std::uint64_t fileSize, std::uint64_t chunkSize);

struct UploadReport {
    std::string filename;
    std::uint64_t bytes = 0;
    core::ChunkIndex chunks = 0;
    int retries = 0;
    std::string message;
};

struct HttpReply {
    long status = 0;
    std::string body;
};

/**
 * Sends one local file to a chunkdrop server with the chunked protocol:
 * every chunk to /upload_chunk, then /finalize_upload. A 409 from finalize
 * triggers one repair round driven by /upload_status.
 */
class ChunkUploader {
public:
    explicit ChunkUploader(const std::string& baseUrl,
                           std::uint64_t chunkSize = defaults::kClientChunkSize,
                           int retries = defaults::kClientRetries,
                           bool sendCrc = true);

    /**
     * @throws std::runtime_error when a chunk keeps failing or the server rejects the upload
     */
    UploadReport upload(const std::filesystem::path& file);

    std::string chunkUrl(const std::string& filename, core::ChunkIndex index, core::ChunkIndex total,
                         std::optional<std::uint32_t> crc) const;
    std::string finalizeUrl(const std::string& filename, core::ChunkIndex total) const;
    std::string statusUrl(const std::string& filename, core::ChunkIndex total) const;

    // "missing" array of an /upload_status reply
    static std::vector<core::ChunkIndex> parseMissing(const std::string& statusJson);

    static std::string escape(const std::string& value);

private:
    std::string baseUrl_;
    std::uint64_t chunkSize_;
    int retries_;
    bool sendCrc_;

    HttpReply httpPost(const std::string& url, const std::string& body) const;
    HttpReply httpGet(const std::string& url) const;

    // Returns the number of retries it took
    int sendChunk(const std::filesystem::path& file, const std::string& filename,
                  const ChunkSpan& span, core::ChunkIndex total);
};

} // namespace client
} // namespace chunkdrop
