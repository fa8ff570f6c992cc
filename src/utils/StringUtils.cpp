#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace TableScrape {

namespace {

// Length of the whitespace sequence starting at pos, 0 if none.
size_t leadingSpace(const std::string& s, size_t pos) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    if (std::isspace(c)) return 1;
    if (c == 0xC2 && pos + 1 < s.size() && static_cast<unsigned char>(s[pos + 1]) == 0xA0) return 2;
    return 0;
}

// Length of the whitespace sequence ending just before end, 0 if none.
size_t trailingSpace(const std::string& s, size_t end) {
    unsigned char c = static_cast<unsigned char>(s[end - 1]);
    if (std::isspace(c)) return 1;
    if (c == 0xA0 && end >= 2 && static_cast<unsigned char>(s[end - 2]) == 0xC2) return 2;
    return 0;
}

}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end) {
        size_t n = leadingSpace(text, start);
        if (n == 0) break;
        start += n;
    }
    while (end > start) {
        size_t n = trailingSpace(text, end);
        if (n == 0 || end - n < start) break;
        end -= n;
    }
    return text.substr(start, end - start);
}

bool isBlank(const std::string& text) {
    return trim(text).empty();
}

std::string toLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}
