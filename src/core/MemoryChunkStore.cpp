#include "core/MemoryChunkStore.hpp"
#include "config.hpp"

#include <iomanip>
#include <sstream>

namespace chunkdrop {
namespace core {

StoredChunk MemoryChunkStore::put(const std::string& filename, ChunkIndex index, BodyReader& body,
                                  std::optional<std::uint32_t> expectedCrc) {
    StringSink sink;
    StoredChunk stored = copyBody(body, sink, defaults::kReadQuantum);

    if (expectedCrc && *expectedCrc != stored.crc32) {
        std::ostringstream ss;
        ss << "CRC-32 mismatch for chunk " << index << " of " << filename << ": expected "
           << std::hex << std::setw(8) << std::setfill('0') << *expectedCrc
           << ", received " << std::setw(8) << stored.crc32;
        throw UploadError(ErrorKind::Integrity, ss.str());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[filename][index] = Blob{sink.data(), std::chrono::steady_clock::now()};
    return stored;
}

std::set<ChunkIndex> MemoryChunkStore::listPresent(const std::string& filename, ChunkIndex total) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<ChunkIndex> present;
    auto it = blobs_.find(filename);
    if (it == blobs_.end()) return present;

    for (const auto& entry : it->second) {
        if (entry.first < total) present.insert(entry.first);
    }
    return present;
}

AssembleResult MemoryChunkStore::assemble(const std::string& filename, ChunkIndex total, ByteSink& sink) {
    AssembleResult result;
    result.missing = missingIndices(listPresent(filename, total), total);
    if (!result.complete()) return result;

    for (ChunkIndex i = 0; i < total; ++i) {
        std::string data;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& chunks = blobs_[filename];
            auto it = chunks.find(i);
            if (it == chunks.end()) {
                throw UploadError(ErrorKind::Storage,
                                  "chunk " + std::to_string(i) + " of " + filename + " vanished during assembly");
            }
            data.swap(it->second.data);
            chunks.erase(it);
            if (chunks.empty()) blobs_.erase(filename);
        }
        sink.write(data.data(), data.size());
        result.bytesWritten += data.size();
    }
    sink.flush();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        blobs_.erase(filename);
    }
    return result;
}

std::size_t MemoryChunkStore::purge(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(filename);
    if (it == blobs_.end()) return 0;
    std::size_t removed = it->second.size();
    blobs_.erase(it);
    return removed;
}

std::size_t MemoryChunkStore::purgeOlderThan(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = std::chrono::steady_clock::now() - maxAge;
    std::size_t removed = 0;

    for (auto file = blobs_.begin(); file != blobs_.end();) {
        auto& chunks = file->second;
        for (auto it = chunks.begin(); it != chunks.end();) {
            if (it->second.written < cutoff) {
                it = chunks.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (chunks.empty()) file = blobs_.erase(file);
        else ++file;
    }
    return removed;
}

std::size_t MemoryChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& file : blobs_) n += file.second.size();
    return n;
}

void MemoryChunkStore::age(std::chrono::seconds by) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& file : blobs_) {
        for (auto& chunk : file.second) chunk.second.written -= by;
    }
}

} // namespace core
} // namespace chunkdrop
