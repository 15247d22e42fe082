#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "core/ByteStream.hpp"
#include "core/ChunkCoordinator.hpp"
#include "core/UploadError.hpp"
#include "http/Request.hpp"
#include "server/ServerConfig.hpp"

namespace chunkdrop {
namespace server {

/**
 * Result of one ingestion request as reported back to the HTTP layer
 */
struct UploadOutcome {
    bool ok = true;
    core::ErrorKind kind = core::ErrorKind::Validation;  // only meaningful when !ok
    std::string detail;
    nlohmann::json payload = nlohmann::json::object();

    int httpStatus() const;

    static UploadOutcome success(const std::string& detail, nlohmann::json payload = nlohmann::json::object());
    static UploadOutcome failure(core::ErrorKind kind, const std::string& detail);
};

class UploadHandler {
public:
    UploadHandler(const ServerConfig& config, core::ChunkCoordinator& chunks);

    // POST <any path>, multipart/form-data with one file part
    UploadOutcome handleMultipart(const http::Request& request, core::BodyReader& body);

    // POST /upload_chunk?chunk=&total=&filename=[&crc32=]
    UploadOutcome handleChunk(const http::Request& request, core::BodyReader& body);

    // POST /finalize_upload?filename=&total=
    UploadOutcome handleFinalize(const http::Request& request);

    // GET /upload_status?filename=&total=
    UploadOutcome handleStatus(const http::Request& request);

    // POST /abort_upload?filename=
    UploadOutcome handleAbort(const http::Request& request);

    // Typed query parameters, ValidationError on anything missing or malformed
    static core::ChunkRequest parseChunkRequest(const http::Request& request);
    static core::FinalizeRequest parseFinalizeRequest(const http::Request& request);

    // JSON on success, plain text error otherwise
    static http::Response toApiResponse(const UploadOutcome& outcome);

    // HTML result page for form uploads
    static http::Response toResultPage(const UploadOutcome& outcome, const std::string& referer);

private:
    const ServerConfig& config_;
    core::ChunkCoordinator& chunks_;

    template <typename Fn>
    UploadOutcome guarded(const char* action, Fn&& fn);
};

} // namespace server
} // namespace chunkdrop
