#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "core/ByteStream.hpp"
#include "core/ChunkStore.hpp"
#include "core/FilenameLocks.hpp"

namespace chunkdrop {
namespace core {

struct ChunkRequest {
    std::string filename;
    ChunkIndex index = 0;
    ChunkIndex total = 0;
    std::optional<std::uint32_t> crc32;
};

struct FinalizeRequest {
    std::string filename;
    ChunkIndex total = 0;
};

struct ChunkReceipt {
    ChunkIndex index = 0;
    ChunkIndex total = 0;
    std::uint64_t bytes = 0;
    std::uint32_t crc32 = 0;
};

struct AssembledFile {
    std::filesystem::path path;
    std::uint64_t bytes = 0;
    ChunkIndex chunks = 0;
};

struct UploadProgress {
    std::set<ChunkIndex> present;
    std::vector<ChunkIndex> missing;

    bool complete() const { return missing.empty(); }
};

/**
 * Chunked-upload protocol: receive chunks, report progress, reassemble.
 *
 * Receives for the same filename run concurrently; the store decides which
 * retransmission wins. Finalize and abort hold a per-filename lock so the
 * check-assemble-delete sequence never interleaves with itself.
 */
class ChunkCoordinator {
public:
    ChunkCoordinator(ChunkStore& store, const std::filesystem::path& destinationRoot,
                     ChunkIndex maxChunks = defaults::kMaxChunks);

    ChunkReceipt receive(const ChunkRequest& request, BodyReader& body);

    /**
     * Concatenate every chunk of the file into destinationRoot/filename.
     * @throws IncompleteUploadError listing the absent indices; nothing is written then
     */
    AssembledFile finalize(const FinalizeRequest& request);

    UploadProgress progress(const std::string& filename, ChunkIndex total) const;

    // Drops every stored chunk of filename
    std::size_t abort(const std::string& filename);

    std::filesystem::path destinationFor(const std::string& filename) const;

private:
    void checkTotal(ChunkIndex total) const;

    ChunkStore& store_;
    std::filesystem::path root_;
    ChunkIndex maxChunks_;
    FilenameLocks locks_;
};

} // namespace core
} // namespace chunkdrop
