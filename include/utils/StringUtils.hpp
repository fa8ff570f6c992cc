#pragma once
#include <string>

namespace TableScrape {

// Strips ASCII whitespace and U+00A0 (no-break space) from both ends.
std::string trim(const std::string& text);
bool isBlank(const std::string& text);
std::string toLower(const std::string& text);

}
