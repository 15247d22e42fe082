#include "server/ResultPage.hpp"

#include <sstream>

namespace chunkdrop {
namespace server {

std::string htmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string renderResultPage(bool ok, const std::string& detail, const std::string& referer) {
    std::ostringstream page;
    page << "<!DOCTYPE html>\n"
         << "<html>\n<title>Upload Result Page</title>\n"
         << "<style type=\"text/css\">\n"
         << "* {font-family: Helvetica; font-size: 16px; }\n"
         << "a { text-decoration: none; }\n"
         << "</style>\n"
         << "<body>\n<h2>Upload Result Page</h2>\n<hr>\n"
         << (ok ? "<strong>Success!</strong>" : "<strong>Failed!</strong>")
         << "<br><br>" << htmlEscape(detail)
         << "<br><br><a href=\"" << htmlEscape(referer.empty() ? "/" : referer) << "\">"
         << "<button>Back</button></a>\n"
         << "</body>\n</html>\n";
    return page.str();
}

} // namespace server
} // namespace chunkdrop
