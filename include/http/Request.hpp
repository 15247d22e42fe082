#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "const/rest_enums.hpp"

namespace chunkdrop {
namespace http {

/**
 * HTTP request line and headers. The body is read separately through a BodyReader.
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string target;                                    // Raw request target
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    std::unordered_map<std::string, std::string> headers;  // Lowercased names
    std::uint64_t contentLength = 0;
    bool hasContentLength = false;

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        return query.find(key) != query.end();
    }

    std::string header(const std::string& lowercaseName, const std::string& defaultValue = "") const {
        auto it = headers.find(lowercaseName);
        return it != headers.end() ? it->second : defaultValue;
    }
};

inline const char* statusText(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "OK";
    }
}

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    static Response json(int status, const nlohmann::json& body) {
        return {status, "application/json", body.dump()};
    }

    static Response text(int status, const std::string& message) {
        return {status, "text/plain; charset=utf-8", message};
    }

    static Response html(int status, const std::string& page) {
        return {status, "text/html; charset=utf-8", page};
    }

    static Response notFound(const std::string& message = "Not Found") {
        return text(404, message);
    }

    static Response methodNotAllowed() {
        return text(405, "Method Not Allowed");
    }
};

} // namespace http
} // namespace chunkdrop
