#include "http/MultipartParser.hpp"

#include <cctype>
#include <vector>

namespace chunkdrop {
namespace http {

namespace {
    // Split on ';' outside of double quotes
    std::vector<std::string> splitParameters(const std::string& value) {
        std::vector<std::string> tokens;
        std::string current;
        bool quoted = false;
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '"') quoted = !quoted;
            if (c == ';' && !quoted) {
                tokens.push_back(current);
                current.clear();
                continue;
            }
            current += c;
        }
        tokens.push_back(current);
        return tokens;
    }
}

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string MultipartParser::unquote(const std::string& value) {
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return value;
    }
    // Browsers percent-encode quotes and send backslashes verbatim, so no unescaping
    return value.substr(1, value.size() - 2);
}

ContentType MultipartParser::parseContentType(const std::string& value) {
    ContentType ct;
    std::vector<std::string> tokens = splitParameters(value);

    ct.mediaType = tokens.front();
    trim(ct.mediaType);
    toLower(ct.mediaType);

    for (size_t i = 1; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        trim(token);
        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (key == "boundary") {
            ct.boundary = unquote(val);
            break;
        }
    }
    return ct;
}

ContentDisposition MultipartParser::parseContentDisposition(const std::string& value) {
    ContentDisposition cd;
    std::vector<std::string> tokens = splitParameters(value);

    cd.type = tokens.front();
    trim(cd.type);
    toLower(cd.type);

    for (size_t i = 1; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        trim(token);
        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (key == "name") {
            cd.name = unquote(val);
        } else if (key == "filename") {
            cd.filename = unquote(val);
            cd.hasFilename = true;
        }
    }
    return cd;
}

bool MultipartParser::isValidBoundary(const std::string& boundary) {
    if (boundary.empty() || boundary.size() > 70) return false;
    if (boundary.back() == ' ') return false;
    for (char c : boundary) {
        if (c == '\r' || c == '\n' || c == '\0') return false;
    }
    return true;
}

} // namespace http
} // namespace chunkdrop
