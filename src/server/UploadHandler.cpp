#include "server/UploadHandler.hpp"
#include "server/ResultPage.hpp"
#include "core/ByteUnits.hpp"
#include "core/UploadTarget.hpp"
#include "http/MultipartExtractor.hpp"
#include "http/MultipartParser.hpp"
#include "http/QueryString.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <vector>

namespace chunkdrop {
namespace server {

using core::ErrorKind;
using core::UploadError;

namespace {
    // Strict non-negative decimal, at most 9 digits
    core::ChunkIndex parseCount(const std::string& value, const char* key) {
        if (value.empty() || value.size() > 9) {
            throw UploadError(ErrorKind::Validation, std::string(key) + " must be a non-negative integer");
        }
        for (char c : value) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw UploadError(ErrorKind::Validation,
                                  std::string(key) + " must be a non-negative integer, got '" + value + "'");
            }
        }
        return static_cast<core::ChunkIndex>(std::stoul(value));
    }

    std::uint32_t parseCrc(const std::string& value) {
        if (value.empty() || value.size() > 8) {
            throw UploadError(ErrorKind::Validation, "crc32 must be 1 to 8 hexadecimal digits");
        }
        for (char c : value) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                throw UploadError(ErrorKind::Validation, "crc32 must be hexadecimal, got '" + value + "'");
            }
        }
        return static_cast<std::uint32_t>(std::stoul(value, nullptr, 16));
    }

    void requireParams(const http::Request& request, const std::vector<const char*>& keys) {
        std::string missing;
        for (const char* key : keys) {
            if (request.hasQuery(key)) continue;
            if (!missing.empty()) missing += ", ";
            missing += key;
        }
        if (!missing.empty()) {
            throw UploadError(ErrorKind::Validation, "Missing required parameters: " + missing);
        }
    }
}

int UploadOutcome::httpStatus() const {
    if (ok) return 200;
    switch (kind) {
        case ErrorKind::Validation: return 400;
        case ErrorKind::Protocol: return 400;
        case ErrorKind::Truncation: return 400;
        case ErrorKind::Integrity: return 422;
        case ErrorKind::IncompleteUpload: return 409;
        case ErrorKind::Storage: return 500;
        default: return 500;
    }
}

UploadOutcome UploadOutcome::success(const std::string& detail, nlohmann::json payload) {
    UploadOutcome outcome;
    outcome.ok = true;
    outcome.detail = detail;
    outcome.payload = std::move(payload);
    return outcome;
}

UploadOutcome UploadOutcome::failure(ErrorKind kind, const std::string& detail) {
    UploadOutcome outcome;
    outcome.ok = false;
    outcome.kind = kind;
    outcome.detail = detail;
    return outcome;
}

UploadHandler::UploadHandler(const ServerConfig& config, core::ChunkCoordinator& chunks)
    : config_(config), chunks_(chunks) {}

template <typename Fn>
UploadOutcome UploadHandler::guarded(const char* action, Fn&& fn) {
    try {
        return fn();
    } catch (const core::IncompleteUploadError& e) {
        UploadOutcome outcome = UploadOutcome::failure(e.kind(), e.what());
        outcome.payload["missing"] = e.missing();
        return outcome;
    } catch (const UploadError& e) {
        std::cerr << "[upload] " << action << " failed: " << core::to_string(e.kind())
                  << ": " << e.what() << std::endl;
        return UploadOutcome::failure(e.kind(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[upload] " << action << " failed: " << e.what() << std::endl;
        return UploadOutcome::failure(ErrorKind::Storage, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[upload] " << action << " failed: " << e.what() << std::endl;
        return UploadOutcome::failure(ErrorKind::Storage, std::string("Error ") + action + ": " + e.what());
    }
}

core::ChunkRequest UploadHandler::parseChunkRequest(const http::Request& request) {
    requireParams(request, {"chunk", "total", "filename"});

    core::ChunkRequest chunk;
    chunk.filename = request.getQuery("filename");
    chunk.index = parseCount(request.getQuery("chunk"), "chunk");
    chunk.total = parseCount(request.getQuery("total"), "total");
    if (request.hasQuery("crc32")) {
        chunk.crc32 = parseCrc(request.getQuery("crc32"));
    }
    return chunk;
}

core::FinalizeRequest UploadHandler::parseFinalizeRequest(const http::Request& request) {
    requireParams(request, {"filename", "total"});

    core::FinalizeRequest finalize;
    finalize.filename = request.getQuery("filename");
    finalize.total = parseCount(request.getQuery("total"), "total");
    return finalize;
}

UploadOutcome UploadHandler::handleMultipart(const http::Request& request, core::BodyReader& body) {
    return guarded("uploading file", [&]() {
        http::ContentType contentType = http::MultipartParser::parseContentType(request.header("content-type"));
        if (!contentType.isMultipartFormData()) {
            throw UploadError(ErrorKind::Protocol, "Content-Type is not multipart/form-data");
        }
        if (contentType.boundary.empty()) {
            throw UploadError(ErrorKind::Protocol, "Content-Type header doesn't contain boundary");
        }

        std::cout << "[multipart] Starting upload processing. Total size: "
                  << core::formatBytes(request.contentLength) << std::endl;

        http::ExtractorLimits limits;
        limits.readQuantum = config_.readQuantum;
        limits.flushThreshold = config_.flushThreshold;
        http::MultipartExtractor extractor(contentType.boundary, limits);
        http::FilePart part = extractor.readPartHeaders(body);

        std::filesystem::path directory =
            core::UploadTarget::translatePath(config_.root, http::urlDecode(request.path, false));
        if (core::UploadTarget::isWithin(directory, config_.chunkDirectory())) {
            throw UploadError(ErrorKind::Validation, "uploads into the chunk area are not allowed");
        }
        core::UploadTarget target =
            core::UploadTarget::resolve(config_.root, directory, core::UploadTarget::baseName(part.filename));

        std::cout << "[multipart] Processing file: " << target.filename() << std::endl;

        core::FileSink sink(target.path());
        std::uint64_t written = extractor.extractPayload(body, sink);
        sink.close();

        std::cout << "[multipart] Successfully uploaded: " << target.filename()
                  << " (" << core::formatBytes(written) << ")" << std::endl;

        std::error_code ec;
        std::filesystem::path relative =
            target.path().lexically_relative(std::filesystem::weakly_canonical(config_.root, ec));

        nlohmann::json payload;
        payload["files"] = nlohmann::json::array();
        payload["files"].push_back({
            {"name", target.filename()},
            {"path", relative.generic_string()},
            {"bytes", written}
        });
        return UploadOutcome::success("'" + target.filename() + "' (" + core::formatBytes(written) + ")",
                                      payload);
    });
}

UploadOutcome UploadHandler::handleChunk(const http::Request& request, core::BodyReader& body) {
    return guarded("uploading chunk", [&]() {
        core::ChunkRequest chunk = parseChunkRequest(request);
        core::ChunkReceipt receipt = chunks_.receive(chunk, body);

        nlohmann::json payload;
        payload["filename"] = chunk.filename;
        payload["chunk"] = receipt.index;
        payload["total"] = receipt.total;
        payload["bytes"] = receipt.bytes;
        char crc[9];
        std::snprintf(crc, sizeof(crc), "%08x", receipt.crc32);
        payload["crc32"] = crc;

        return UploadOutcome::success("Chunk " + std::to_string(receipt.index + 1) + "/" +
                                      std::to_string(receipt.total) + " uploaded successfully",
                                      payload);
    });
}

UploadOutcome UploadHandler::handleFinalize(const http::Request& request) {
    return guarded("finalizing upload", [&]() {
        core::FinalizeRequest finalize = parseFinalizeRequest(request);
        core::AssembledFile file = chunks_.finalize(finalize);

        nlohmann::json payload;
        payload["filename"] = finalize.filename;
        payload["bytes"] = file.bytes;
        payload["chunks"] = file.chunks;

        return UploadOutcome::success("File " + finalize.filename + " uploaded successfully (" +
                                      core::formatBytes(file.bytes) + ")",
                                      payload);
    });
}

UploadOutcome UploadHandler::handleStatus(const http::Request& request) {
    return guarded("reading upload status", [&]() {
        core::FinalizeRequest query = parseFinalizeRequest(request);
        core::UploadProgress progress = chunks_.progress(query.filename, query.total);

        nlohmann::json payload;
        payload["filename"] = query.filename;
        payload["total"] = query.total;
        payload["present"] = std::vector<core::ChunkIndex>(progress.present.begin(), progress.present.end());
        payload["missing"] = progress.missing;
        payload["complete"] = progress.complete();

        return UploadOutcome::success(std::to_string(progress.present.size()) + "/" +
                                      std::to_string(query.total) + " chunks present",
                                      payload);
    });
}

UploadOutcome UploadHandler::handleAbort(const http::Request& request) {
    return guarded("aborting upload", [&]() {
        requireParams(request, {"filename"});
        std::string filename = request.getQuery("filename");
        std::size_t removed = chunks_.abort(filename);

        nlohmann::json payload;
        payload["filename"] = filename;
        payload["removed"] = removed;
        return UploadOutcome::success("Removed " + std::to_string(removed) + " chunk(s) of " + filename,
                                      payload);
    });
}

http::Response UploadHandler::toApiResponse(const UploadOutcome& outcome) {
    if (!outcome.ok) {
        return http::Response::text(outcome.httpStatus(), outcome.detail);
    }
    nlohmann::json body = outcome.payload;
    body["status"] = "success";
    body["message"] = outcome.detail;
    return http::Response::json(200, body);
}

http::Response UploadHandler::toResultPage(const UploadOutcome& outcome, const std::string& referer) {
    return http::Response::html(outcome.httpStatus(), renderResultPage(outcome.ok, outcome.detail, referer));
}

} // namespace server
} // namespace chunkdrop
