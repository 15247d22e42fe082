#pragma once

#include <cstddef>
#include <cstdint>

#define CHUNKDROP_SERVER_NAME "chunkdrop/1.0"

namespace chunkdrop {
namespace defaults {

constexpr const char* kBindAddress = "0.0.0.0";
constexpr std::uint16_t kPort = 8000;

// Hidden directory under the server root holding in-flight chunk blobs
constexpr const char* kChunkDirectory = ".chunks";

constexpr std::size_t kReadQuantum = 64 * 1024;            // 64 KiB per socket read
constexpr std::size_t kFlushThreshold = 50 * 1024 * 1024;  // 50 MiB before a forced flush
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxPartHeaderLine = 8 * 1024;
constexpr std::size_t kMaxPartHeaderLines = 32;

// Blob names carry a 4-digit index: 0000..9999
constexpr std::uint32_t kMaxChunks = 10000;
constexpr int kChunkIndexWidth = 4;

// Body bytes drained after a handler stops reading early
constexpr std::uint64_t kMaxDrainBytes = 1024 * 1024;

// How long a half-closed connection keeps swallowing an unwanted body after the response
constexpr int kLingerMillis = 10 * 1000;

// Client side: stay below a 100 MB proxy body limit
constexpr std::uint64_t kClientChunkSize = 90ULL * 1024 * 1024;
constexpr int kClientRetries = 3;

} // namespace defaults
} // namespace chunkdrop
