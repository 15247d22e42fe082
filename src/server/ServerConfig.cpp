#include "server/ServerConfig.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chunkdrop {
namespace server {

namespace {
    template <typename T>
    void readKey(const nlohmann::json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        try {
            out = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
        }
    }
}

void ServerConfig::apply(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    readKey(j, "bind", bind);
    int portValue = port;
    readKey(j, "port", portValue);
    if (portValue < 1 || portValue > 65535) {
        throw std::invalid_argument("config key 'port': " + std::to_string(portValue) + " is out of range");
    }
    port = static_cast<std::uint16_t>(portValue);
    readKey(j, "chunk_dir", chunkDir);
    readKey(j, "read_quantum", readQuantum);
    readKey(j, "flush_threshold", flushThreshold);
    readKey(j, "max_chunks", maxChunks);
    readKey(j, "max_header_bytes", maxHeaderBytes);
    readKey(j, "stale_chunk_seconds", staleChunkSeconds);

    std::string rootStr;
    readKey(j, "root", rootStr);
    if (!rootStr.empty()) root = rootStr;
}

void ServerConfig::validate() const {
    if (port == 0) {
        throw std::invalid_argument("port must be in 1..65535");
    }
    if (readQuantum == 0) {
        throw std::invalid_argument("read_quantum must be positive");
    }
    if (flushThreshold < readQuantum) {
        throw std::invalid_argument("flush_threshold must be at least read_quantum");
    }
    if (maxChunks == 0 || maxChunks > defaults::kMaxChunks) {
        throw std::invalid_argument("max_chunks must be between 1 and " + std::to_string(defaults::kMaxChunks));
    }
    if (maxHeaderBytes < 1024) {
        throw std::invalid_argument("max_header_bytes must be at least 1024");
    }
    if (chunkDir.empty() || chunkDir == "." || chunkDir == ".." ||
        chunkDir.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("chunk_dir must be a single directory name");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw std::invalid_argument("root '" + root.string() + "' is not a directory");
    }
}

nlohmann::json ServerConfig::toJson() const {
    nlohmann::json j;
    j["bind"] = bind;
    j["port"] = port;
    j["root"] = root.string();
    j["chunk_dir"] = chunkDir;
    j["read_quantum"] = readQuantum;
    j["flush_threshold"] = flushThreshold;
    j["max_chunks"] = maxChunks;
    j["max_header_bytes"] = maxHeaderBytes;
    j["stale_chunk_seconds"] = staleChunkSeconds;
    return j;
}

ServerConfig ServerConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid JSON in " + path.string() + ": " + e.what());
    }

    ServerConfig config;
    config.apply(j);
    std::cout << "[server] loaded config from " << path.string() << std::endl;
    return config;
}

} // namespace server
} // namespace chunkdrop
