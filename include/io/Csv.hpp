#pragma once
#include "parser/TableData.hpp"
#include <string>
#include <vector>

namespace TableScrape {

// Pads short rows with empty strings and truncates long rows to the header
// width. Rows are left untouched when the table has no header.
void rectangularize(TableData& table);

std::string formatCsvRow(const Row& row);

// Writes the rectangularized table, header row first. Refuses (returns false)
// to write a table with neither headers nor rows.
bool writeCsv(const TableData& table, const std::string& path);

std::vector<Row> parseCsv(const std::string& text);

// Throws std::runtime_error when the file cannot be read.
std::vector<Row> readCsvFile(const std::string& path);

}
