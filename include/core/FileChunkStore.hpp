#pragma once

#include <filesystem>
#include <string>

#include "config.hpp"
#include "core/ChunkStore.hpp"

namespace chunkdrop {
namespace core {

/**
 * Chunk blobs as plain files in one private directory.
 * A blob is written to a temporary name and renamed into place, so a
 * half-received chunk never shows up as present.
 */
class FileChunkStore : public ChunkStore {
public:
    explicit FileChunkStore(const std::filesystem::path& directory,
                            std::size_t quantum = defaults::kReadQuantum);

    StoredChunk put(const std::string& filename, ChunkIndex index, BodyReader& body,
                    std::optional<std::uint32_t> expectedCrc) override;
    std::set<ChunkIndex> listPresent(const std::string& filename, ChunkIndex total) const override;
    AssembleResult assemble(const std::string& filename, ChunkIndex total, ByteSink& sink) override;
    std::size_t purge(const std::string& filename) override;
    std::size_t purgeOlderThan(std::chrono::seconds maxAge) override;

    // Full path of the blob for (filename, index)
    std::filesystem::path blobPath(const std::string& filename, ChunkIndex index) const;

    const std::filesystem::path& directory() const { return directory_; }

    // Creates the chunk directory if needed
    void ensureDirectory() const;

private:
    std::filesystem::path directory_;
    std::size_t quantum_;

    // Unique sibling name the blob is written under before the rename
    std::filesystem::path temporaryPath(const std::filesystem::path& blob) const;

    void removeBlob(const std::filesystem::path& blob) const;
};

} // namespace core
} // namespace chunkdrop
