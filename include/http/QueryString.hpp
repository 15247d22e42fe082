#pragma once

#include <string>
#include <unordered_map>

namespace chunkdrop {
namespace http {

/**
 * Percent-decode a URL component.
 * @param plusAsSpace Decode '+' as a space (query strings, not paths)
 */
std::string urlDecode(const std::string& value, bool plusAsSpace);

/**
 * Parse "a=1&b=x%20y" into a map. The first occurrence of a key wins and
 * keys with blank values are left out.
 */
std::unordered_map<std::string, std::string> parseQuery(const std::string& query);

/**
 * Split a request target into its path and query, dropping any fragment.
 */
void splitTarget(const std::string& target, std::string& path, std::string& query);

} // namespace http
} // namespace chunkdrop
