#include "core/ChunkCoordinator.hpp"
#include "core/ByteUnits.hpp"
#include "core/UploadTarget.hpp"

#include <iostream>

namespace chunkdrop {
namespace core {

ChunkCoordinator::ChunkCoordinator(ChunkStore& store, const std::filesystem::path& destinationRoot,
                                   ChunkIndex maxChunks)
    : store_(store), root_(destinationRoot), maxChunks_(maxChunks) {}

void ChunkCoordinator::checkTotal(ChunkIndex total) const {
    if (total == 0) {
        throw UploadError(ErrorKind::Validation, "total must be a positive integer");
    }
    if (total > maxChunks_) {
        throw UploadError(ErrorKind::Validation,
                          "total " + std::to_string(total) + " exceeds the limit of " +
                          std::to_string(maxChunks_) + " chunks");
    }
}

std::filesystem::path ChunkCoordinator::destinationFor(const std::string& filename) const {
    return UploadTarget::resolve(root_, root_, filename).path();
}

ChunkReceipt ChunkCoordinator::receive(const ChunkRequest& request, BodyReader& body) {
    const std::string name = UploadTarget::sanitizeFilename(request.filename);
    checkTotal(request.total);
    if (request.index >= request.total) {
        throw UploadError(ErrorKind::Validation,
                          "chunk " + std::to_string(request.index) + " out of range for total " +
                          std::to_string(request.total));
    }

    StoredChunk stored = store_.put(name, request.index, body, request.crc32);

    std::cout << "[chunks] Received chunk " << request.index + 1 << "/" << request.total
              << " for " << name << " (" << formatBytes(stored.bytes) << ")" << std::endl;

    ChunkReceipt receipt;
    receipt.index = request.index;
    receipt.total = request.total;
    receipt.bytes = stored.bytes;
    receipt.crc32 = stored.crc32;
    return receipt;
}

AssembledFile ChunkCoordinator::finalize(const FinalizeRequest& request) {
    const std::string name = UploadTarget::sanitizeFilename(request.filename);
    checkTotal(request.total);
    const std::filesystem::path destination = destinationFor(name);

    auto guard = locks_.lock(name);

    std::vector<ChunkIndex> missing = missingIndices(store_.listPresent(name, request.total), request.total);
    if (!missing.empty()) {
        std::cerr << "[chunks] finalize of " << name << " refused: "
                  << IncompleteUploadError::describe(missing) << std::endl;
        throw IncompleteUploadError(std::move(missing));
    }

    FileSink sink(destination);
    AssembleResult result = store_.assemble(name, request.total, sink);
    sink.close();
    if (!result.complete()) {
        throw IncompleteUploadError(std::move(result.missing));
    }

    std::cout << "[chunks] Successfully assembled " << name << " ("
              << formatBytes(result.bytesWritten) << ")" << std::endl;

    AssembledFile file;
    file.path = destination;
    file.bytes = result.bytesWritten;
    file.chunks = request.total;
    return file;
}

UploadProgress ChunkCoordinator::progress(const std::string& filename, ChunkIndex total) const {
    const std::string name = UploadTarget::sanitizeFilename(filename);
    checkTotal(total);

    UploadProgress progress;
    progress.present = store_.listPresent(name, total);
    progress.missing = missingIndices(progress.present, total);
    return progress;
}

std::size_t ChunkCoordinator::abort(const std::string& filename) {
    const std::string name = UploadTarget::sanitizeFilename(filename);
    auto guard = locks_.lock(name);
    return store_.purge(name);
}

} // namespace core
} // namespace chunkdrop
