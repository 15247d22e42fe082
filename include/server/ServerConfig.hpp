#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "config.hpp"

namespace chunkdrop {
namespace server {

struct ServerConfig {
    std::string bind = defaults::kBindAddress;
    std::uint16_t port = defaults::kPort;
    std::filesystem::path root = std::filesystem::current_path();
    std::string chunkDir = defaults::kChunkDirectory;
    std::size_t readQuantum = defaults::kReadQuantum;
    std::size_t flushThreshold = defaults::kFlushThreshold;
    std::uint32_t maxChunks = defaults::kMaxChunks;
    std::size_t maxHeaderBytes = defaults::kMaxHeaderBytes;
    std::uint64_t staleChunkSeconds = 0;  // 0 disables the startup sweep

    std::filesystem::path chunkDirectory() const { return root / chunkDir; }

    // Overlay keys present in j. Unknown keys are ignored, wrong types throw.
    void apply(const nlohmann::json& j);

    // Throws std::invalid_argument naming the first bad setting
    void validate() const;

    nlohmann::json toJson() const;

    static ServerConfig fromFile(const std::filesystem::path& path);
};

} // namespace server
} // namespace chunkdrop
