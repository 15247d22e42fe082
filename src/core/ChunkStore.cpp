#include "core/ChunkStore.hpp"
#include "config.hpp"

#include <boost/crc.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace chunkdrop {
namespace core {

namespace {
    const std::string kChunkMarker = ".chunk_";
}

std::string chunkBlobName(const std::string& filename, ChunkIndex index) {
    std::ostringstream ss;
    ss << filename << kChunkMarker
       << std::setw(defaults::kChunkIndexWidth) << std::setfill('0') << index;
    return ss.str();
}

std::optional<ChunkIndex> parseChunkBlobName(const std::string& filename, const std::string& blobName) {
    const std::string prefix = filename + kChunkMarker;
    if (blobName.size() <= prefix.size() || blobName.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string digits = blobName.substr(prefix.size());
    if (digits.size() < static_cast<size_t>(defaults::kChunkIndexWidth) || digits.size() > 9) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return static_cast<ChunkIndex>(std::stoul(digits));
}

std::vector<ChunkIndex> missingIndices(const std::set<ChunkIndex>& present, ChunkIndex total) {
    std::vector<ChunkIndex> missing;
    for (ChunkIndex i = 0; i < total; ++i) {
        if (present.find(i) == present.end()) missing.push_back(i);
    }
    return missing;
}

StoredChunk ChunkStore::copyBody(BodyReader& body, ByteSink& sink, std::size_t quantum) {
    boost::crc_32_type crc;
    std::vector<char> buf(quantum);
    StoredChunk stored;

    for (;;) {
        std::size_t n = body.read(buf.data(), buf.size());
        if (n == 0) break;
        crc.process_bytes(buf.data(), n);
        sink.write(buf.data(), n);
        stored.bytes += n;
    }
    sink.flush();

    stored.crc32 = crc.checksum();
    return stored;
}

} // namespace core
} // namespace chunkdrop
