#include "core/FileChunkStore.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>
#include <vector>

namespace chunkdrop {
namespace core {

namespace fs = std::filesystem;

namespace {
    const std::string kTempMarker = ".part-";

    // "<blob>.part-<token>" -> "<blob>", anything else unchanged
    std::string stripTemporarySuffix(const std::string& name) {
        auto pos = name.rfind(kTempMarker);
        if (pos == std::string::npos) return name;
        for (size_t i = pos + kTempMarker.size(); i < name.size(); ++i) {
            char c = name[i];
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return name;
        }
        return name.substr(0, pos);
    }

    bool looksLikeBlob(const std::string& name) {
        auto pos = name.rfind(".chunk_");
        if (pos == std::string::npos || pos + 7 == name.size()) return false;
        for (size_t i = pos + 7; i < name.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
        }
        return true;
    }
}

FileChunkStore::FileChunkStore(const fs::path& directory, std::size_t quantum)
    : directory_(directory), quantum_(quantum == 0 ? defaults::kReadQuantum : quantum) {}

fs::path FileChunkStore::blobPath(const std::string& filename, ChunkIndex index) const {
    return directory_ / chunkBlobName(filename, index);
}

void FileChunkStore::ensureDirectory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot create chunk directory " + directory_.string() + " (" + ec.message() + ")");
    }
}

fs::path FileChunkStore::temporaryPath(const fs::path& blob) const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dis;

    std::ostringstream ss;
    ss << blob.filename().string() << kTempMarker << millis << "_"
       << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return blob.parent_path() / ss.str();
}

void FileChunkStore::removeBlob(const fs::path& blob) const {
    std::error_code ec;
    fs::remove(blob, ec);
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot delete chunk " + blob.string() + " (" + ec.message() + ")");
    }
}

StoredChunk FileChunkStore::put(const std::string& filename, ChunkIndex index, BodyReader& body,
                                std::optional<std::uint32_t> expectedCrc) {
    ensureDirectory();

    const fs::path blob = blobPath(filename, index);
    const fs::path tmp = temporaryPath(blob);

    StoredChunk stored;
    try {
        FileSink sink(tmp);
        stored = copyBody(body, sink, quantum_);
        sink.close();
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    std::error_code ec;
    if (expectedCrc && *expectedCrc != stored.crc32) {
        fs::remove(tmp, ec);
        std::ostringstream ss;
        ss << "CRC-32 mismatch for chunk " << index << " of " << filename << ": expected "
           << std::hex << std::setw(8) << std::setfill('0') << *expectedCrc
           << ", received " << std::setw(8) << stored.crc32;
        throw UploadError(ErrorKind::Integrity, ss.str());
    }

    fs::rename(tmp, blob, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw UploadError(ErrorKind::Storage,
                          "cannot store chunk " + blob.string() + " (" + ec.message() + ")");
    }
    return stored;
}

std::set<ChunkIndex> FileChunkStore::listPresent(const std::string& filename, ChunkIndex total) const {
    std::set<ChunkIndex> present;
    for (ChunkIndex i = 0; i < total; ++i) {
        std::error_code ec;
        fs::path blob = blobPath(filename, i);
        if (fs::exists(blob, ec)) {
            present.insert(i);
        } else if (ec) {
            throw UploadError(ErrorKind::Storage,
                              "cannot stat chunk " + blob.string() + " (" + ec.message() + ")");
        }
    }
    return present;
}

AssembleResult FileChunkStore::assemble(const std::string& filename, ChunkIndex total, ByteSink& sink) {
    AssembleResult result;
    result.missing = missingIndices(listPresent(filename, total), total);
    if (!result.complete()) return result;

    std::vector<char> buf(quantum_);
    for (ChunkIndex i = 0; i < total; ++i) {
        const fs::path blob = blobPath(filename, i);
        {
            std::ifstream in(blob, std::ios::binary);
            if (!in) {
                throw UploadError(ErrorKind::Storage,
                                  "cannot open chunk " + blob.string() + " (" + std::strerror(errno) + ")");
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                std::streamsize got = in.gcount();
                if (got > 0) {
                    sink.write(buf.data(), static_cast<std::size_t>(got));
                    result.bytesWritten += static_cast<std::uint64_t>(got);
                }
            }
            if (in.bad()) {
                throw UploadError(ErrorKind::Storage, "read failed on chunk " + blob.string());
            }
        }
        // Per-chunk cleanup: a crash mid-assembly leaves only uncopied chunks behind
        removeBlob(blob);
    }
    sink.flush();

    // Blobs at or past `total` belong to an older session with a larger total
    std::error_code ec;
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (parseChunkBlobName(filename, it->path().filename().string())) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot list chunk directory " + directory_.string() + " (" + ec.message() + ")");
    }
    for (const auto& blob : stale) {
        removeBlob(blob);
    }
    if (!stale.empty()) {
        std::cout << "[chunks] removed " << stale.size() << " stale chunk(s) of " << filename
                  << " beyond total " << total << std::endl;
    }
    return result;
}

std::size_t FileChunkStore::purge(const std::string& filename) {
    std::error_code ec;
    if (!fs::exists(directory_, ec)) return 0;

    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (parseChunkBlobName(filename, stripTemporarySuffix(name))) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot list chunk directory " + directory_.string() + " (" + ec.message() + ")");
    }

    for (const auto& blob : doomed) {
        removeBlob(blob);
    }
    if (!doomed.empty()) {
        std::cout << "[chunks] purged " << doomed.size() << " chunk(s) of " << filename << std::endl;
    }
    return doomed.size();
}

std::size_t FileChunkStore::purgeOlderThan(std::chrono::seconds maxAge) {
    std::error_code ec;
    if (!fs::exists(directory_, ec)) return 0;

    const auto cutoff = fs::file_time_type::clock::now() - maxAge;
    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!looksLikeBlob(stripTemporarySuffix(name))) continue;

        std::error_code timeEc;
        auto written = fs::last_write_time(it->path(), timeEc);
        if (!timeEc && written < cutoff) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        throw UploadError(ErrorKind::Storage,
                          "cannot list chunk directory " + directory_.string() + " (" + ec.message() + ")");
    }

    for (const auto& blob : doomed) {
        removeBlob(blob);
    }
    std::cout << "[chunks] swept " << doomed.size() << " stale chunk(s) from "
              << directory_.string() << std::endl;
    return doomed.size();
}

} // namespace core
} // namespace chunkdrop
