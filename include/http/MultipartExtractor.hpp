#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "core/ByteStream.hpp"

namespace chunkdrop {
namespace http {

struct ExtractorLimits {
    std::size_t readQuantum = defaults::kReadQuantum;
    std::size_t flushThreshold = defaults::kFlushThreshold;
    std::size_t maxHeaderLine = defaults::kMaxPartHeaderLine;
    std::size_t maxHeaderLines = defaults::kMaxPartHeaderLines;
};

/**
 * Headers of the file part
 */
struct FilePart {
    std::string fieldName;
    std::string filename;      // as sent by the client, not yet sanitized
    std::string contentType;
};

/**
 * Streams the single file part of a multipart/form-data body into a sink.
 *
 * Usage is two-phase so the caller can pick the destination from the
 * part headers before any payload byte is read:
 *
 *     MultipartExtractor extractor(boundary);
 *     FilePart part = extractor.readPartHeaders(body);
 *     core::FileSink sink(targetFor(part.filename));
 *     extractor.extractPayload(body, sink);
 *
 * Memory use is bounded by the flush threshold plus one read quantum.
 */
class MultipartExtractor {
public:
    /**
     * @param boundary Boundary token from the Content-Type header, without the leading "--"
     * @throws UploadError ProtocolError for an empty or malformed boundary
     */
    explicit MultipartExtractor(const std::string& boundary, ExtractorLimits limits = {});

    /**
     * Consume the opening delimiter line and the first part's headers.
     * @throws UploadError ProtocolError "missing initial boundary" or "no filename"
     */
    FilePart readPartHeaders(core::BodyReader& body);

    /**
     * Copy the part payload to sink, stopping at the next delimiter.
     * The CRLF (or bare LF) before the delimiter is not payload.
     * @return Bytes written to sink
     */
    std::uint64_t extractPayload(core::BodyReader& body, core::ByteSink& sink);

    const std::string& delimiter() const { return delimiter_; }

    // Bytes held back at each flush so a delimiter is never split across writes
    std::size_t retainedTail() const { return delimiter_.size() + 2; }

private:
    std::string delimiter_;  // "--" + boundary
    ExtractorLimits limits_;
};

} // namespace http
} // namespace chunkdrop
