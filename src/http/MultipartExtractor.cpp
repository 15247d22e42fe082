#include "http/MultipartExtractor.hpp"
#include "http/MultipartParser.hpp"
#include "core/UploadError.hpp"

#include <iostream>
#include <vector>

namespace chunkdrop {
namespace http {

using core::ErrorKind;
using core::UploadError;

namespace {
    void stripLineEnd(std::string& line) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    }

    // Length of data once a CRLF or LF right before end is dropped
    std::size_t withoutTrailingBreak(const std::string& data, std::size_t end) {
        if (end >= 2 && data[end - 2] == '\r' && data[end - 1] == '\n') return end - 2;
        if (end >= 1 && data[end - 1] == '\n') return end - 1;
        return end;
    }
}

MultipartExtractor::MultipartExtractor(const std::string& boundary, ExtractorLimits limits)
    : delimiter_("--" + boundary), limits_(limits) {
    if (!MultipartParser::isValidBoundary(boundary)) {
        throw UploadError(ErrorKind::Protocol, "invalid multipart boundary '" + boundary + "'");
    }
    if (limits_.readQuantum == 0) limits_.readQuantum = defaults::kReadQuantum;
    if (limits_.flushThreshold <= retainedTail()) limits_.flushThreshold = retainedTail() + 1;
}

FilePart MultipartExtractor::readPartHeaders(core::BodyReader& body) {
    std::string line;
    bool gotLine = false;
    try {
        gotLine = body.readLine(line, limits_.maxHeaderLine);
    } catch (const UploadError& e) {
        if (e.kind() != ErrorKind::Protocol) throw;
    }
    if (!gotLine) {
        throw UploadError(ErrorKind::Protocol, "missing initial boundary");
    }
    stripLineEnd(line);
    MultipartParser::trim(line);
    if (line != delimiter_) {
        throw UploadError(ErrorKind::Protocol, "missing initial boundary");
    }

    FilePart part;
    ContentDisposition disposition;
    bool terminated = false;

    for (std::size_t count = 0; count <= limits_.maxHeaderLines; ++count) {
        if (!body.readLine(line, limits_.maxHeaderLine)) break;
        stripLineEnd(line);
        if (line.empty()) {
            terminated = true;
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        MultipartParser::trim(name);
        MultipartParser::trim(value);
        MultipartParser::toLower(name);

        if (name == "content-disposition") {
            disposition = MultipartParser::parseContentDisposition(value);
        } else if (name == "content-type") {
            part.contentType = value;
        }
    }

    if (!terminated) {
        throw UploadError(ErrorKind::Protocol, "part headers are not terminated by a blank line");
    }
    if (disposition.name != "file" || !disposition.hasFilename || disposition.filename.empty()) {
        throw UploadError(ErrorKind::Protocol, "no filename in the file part");
    }

    part.fieldName = disposition.name;
    part.filename = disposition.filename;
    return part;
}

std::uint64_t MultipartExtractor::extractPayload(core::BodyReader& body, core::ByteSink& sink) {
    const std::size_t keep = retainedTail();
    std::vector<char> quantum(limits_.readQuantum);
    std::string buffer;
    std::size_t scanFrom = 0;
    std::uint64_t written = 0;

    while (!body.exhausted()) {
        std::size_t n = body.read(quantum.data(), quantum.size());
        if (n == 0) break;
        buffer.append(quantum.data(), n);

        std::size_t pos = buffer.find(delimiter_, scanFrom);
        if (pos != std::string::npos) {
            std::size_t end = withoutTrailingBreak(buffer, pos);
            sink.write(buffer.data(), end);
            sink.flush();
            written += end;
            return written;
        }

        if (buffer.size() > limits_.flushThreshold) {
            std::size_t out = buffer.size() - keep;
            sink.write(buffer.data(), out);
            written += out;
            buffer.erase(0, out);
        }

        // Only the last delimiter-1 bytes can still be the start of a delimiter
        scanFrom = buffer.size() >= delimiter_.size() ? buffer.size() - delimiter_.size() + 1 : 0;
    }

    // Declared length consumed without a closing delimiter
    std::cerr << "[multipart] body ended without a closing boundary after "
              << body.consumed() << " bytes" << std::endl;
    std::size_t end = withoutTrailingBreak(buffer, buffer.size());
    sink.write(buffer.data(), end);
    sink.flush();
    written += end;
    return written;
}

} // namespace http
} // namespace chunkdrop
