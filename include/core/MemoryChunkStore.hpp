#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/ChunkStore.hpp"

namespace chunkdrop {
namespace core {

// Chunk store kept in process memory. Used by tests and for small deployments.
class MemoryChunkStore : public ChunkStore {
public:
    StoredChunk put(const std::string& filename, ChunkIndex index, BodyReader& body,
                    std::optional<std::uint32_t> expectedCrc) override;
    std::set<ChunkIndex> listPresent(const std::string& filename, ChunkIndex total) const override;
    AssembleResult assemble(const std::string& filename, ChunkIndex total, ByteSink& sink) override;
    std::size_t purge(const std::string& filename) override;
    std::size_t purgeOlderThan(std::chrono::seconds maxAge) override;

    // Number of blobs held for every filename together
    std::size_t size() const;

    // Back-date every blob, lets tests exercise purgeOlderThan()
    void age(std::chrono::seconds by);

private:
    struct Blob {
        std::string data;
        std::chrono::steady_clock::time_point written;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<ChunkIndex, Blob>> blobs_;
};

} // namespace core
} // namespace chunkdrop
