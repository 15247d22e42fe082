#pragma once

#include <string>

namespace chunkdrop {
namespace http {

/**
 * Media type and parameters of a Content-Type header value
 */
struct ContentType {
    std::string mediaType;  // lowercased, e.g. "multipart/form-data"
    std::string boundary;   // empty when absent

    bool isMultipartFormData() const { return mediaType == "multipart/form-data"; }
};

/**
 * Attributes of a part's Content-Disposition header
 */
struct ContentDisposition {
    std::string type;       // "form-data"
    std::string name;       // form field name
    std::string filename;   // original filename as sent
    bool hasFilename = false;
};

/**
 * Header-level helpers for multipart/form-data
 */
class MultipartParser {
public:
    /**
     * Parse a Content-Type header value
     * @param value e.g. "multipart/form-data; boundary=----abc"
     */
    static ContentType parseContentType(const std::string& value);

    /**
     * Parse a Content-Disposition header value
     * @param value e.g. "form-data; name=\"file\"; filename=\"a.bin\""
     */
    static ContentDisposition parseContentDisposition(const std::string& value);

    // RFC 2046: 1 to 70 characters, no trailing space
    static bool isValidBoundary(const std::string& boundary);

    static void trim(std::string& s);
    static void toLower(std::string& s);

private:
    static std::string unquote(const std::string& value);
};

} // namespace http
} // namespace chunkdrop
