#include "http/QueryString.hpp"

namespace chunkdrop {
namespace http {

namespace {
    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string urlDecode(const std::string& value, bool plusAsSpace) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

std::unordered_map<std::string, std::string> parseQuery(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;

        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;

        std::string key = urlDecode(pair.substr(0, eq), true);
        std::string value = urlDecode(pair.substr(eq + 1), true);
        if (value.empty()) continue;
        params.emplace(key, value);
    }
    return params;
}

void splitTarget(const std::string& target, std::string& path, std::string& query) {
    std::string rest = target;
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);

    auto qm = rest.find('?');
    if (qm == std::string::npos) {
        path = rest;
        query.clear();
    } else {
        path = rest.substr(0, qm);
        query = rest.substr(qm + 1);
    }
}

} // namespace http
} // namespace chunkdrop
