#pragma once

#include <string>

namespace chunkdrop {
namespace server {

std::string htmlEscape(const std::string& text);

// "Upload Result Page" with Success!/Failed!, the detail and a Back link
std::string renderResultPage(bool ok, const std::string& detail, const std::string& referer);

} // namespace server
} // namespace chunkdrop
