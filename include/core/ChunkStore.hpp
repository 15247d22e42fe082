#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/ByteStream.hpp"
#include "core/UploadError.hpp"

namespace chunkdrop {
namespace core {

// "<filename>.chunk_<index zero-padded to 4 digits>"
std::string chunkBlobName(const std::string& filename, ChunkIndex index);

// Index encoded in a blob name for filename, or nullopt if the name is not one of its blobs.
std::optional<ChunkIndex> parseChunkBlobName(const std::string& filename, const std::string& blobName);

// Indices in [0, total) absent from present, ascending.
std::vector<ChunkIndex> missingIndices(const std::set<ChunkIndex>& present, ChunkIndex total);

struct AssembleResult {
    std::uint64_t bytesWritten = 0;
    std::vector<ChunkIndex> missing;

    bool complete() const { return missing.empty(); }
};

struct StoredChunk {
    std::uint64_t bytes = 0;
    std::uint32_t crc32 = 0;
};

/**
 * Owner of in-flight chunk blobs between receipt and finalization.
 * Completeness is inferred from which blobs exist, there is no manifest.
 */
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    /**
     * Persist the remaining body as chunk index of filename, replacing any earlier blob.
     * @param expectedCrc When set, a body with another CRC-32 is rejected (IntegrityError)
     *                    and the previous blob, if any, is kept
     */
    virtual StoredChunk put(const std::string& filename, ChunkIndex index, BodyReader& body,
                            std::optional<std::uint32_t> expectedCrc) = 0;

    virtual std::set<ChunkIndex> listPresent(const std::string& filename, ChunkIndex total) const = 0;

    /**
     * Append chunks 0..total-1 to sink, deleting each blob right after it is copied.
     * Nothing is written when a chunk is missing; the result then lists the gaps.
     */
    virtual AssembleResult assemble(const std::string& filename, ChunkIndex total, ByteSink& sink) = 0;

    // Removes every blob of filename. Returns how many were removed.
    virtual std::size_t purge(const std::string& filename) = 0;

    // Removes blobs of any filename not written within maxAge.
    virtual std::size_t purgeOlderThan(std::chrono::seconds maxAge) = 0;

protected:
    // Streams what is left of body into sink and checksums it on the way.
    static StoredChunk copyBody(BodyReader& body, ByteSink& sink, std::size_t quantum);
};

} // namespace core
} // namespace chunkdrop
