#pragma once
#include "parser/TableData.hpp"
#include <string>

namespace TableScrape {

std::string escapeHtml(const std::string& text);

// Minimal table markup: header row in <thead> (when present), data rows in
// <tbody>. Extracting the output again yields the same headers and rows.
std::string renderHtmlTable(const TableData& table);

bool writeHtmlTable(const TableData& table, const std::string& path);

}
