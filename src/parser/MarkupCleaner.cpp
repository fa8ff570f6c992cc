#include "parser/MarkupCleaner.hpp"
#include <glib.h>
#include <regex>

namespace TableScrape {

std::string cleanMalformedMarkup(const std::string& html) {
    if (html.empty()) return html;

    static const std::regex splitTable(R"(<table([^>]*?)></table\s+([^>]*?)>)",
                                       std::regex::ECMAScript | std::regex::icase);
    static const std::regex selfClosingCell(R"(<(td|th)\b([^>]*?)/>)",
                                            std::regex::ECMAScript | std::regex::icase);
    static const std::regex doubledTableEnd(R"(</table>(?:\s*</table>)+)",
                                            std::regex::ECMAScript | std::regex::icase);

    std::string cleaned = std::regex_replace(html, splitTable, "<table$1 $2>");
    cleaned = std::regex_replace(cleaned, selfClosingCell, "<$1$2></$1>");
    cleaned = std::regex_replace(cleaned, doubledTableEnd, "</table>");

    if (cleaned.size() != html.size()) {
        g_debug("Cleaned malformed markup: %zu -> %zu bytes", html.size(), cleaned.size());
    }
    return cleaned;
}

}
