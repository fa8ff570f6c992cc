#pragma once
#include "parser/TableData.hpp"
#include <string>

namespace TableScrape {

struct StatusCounts {
    int na = 0;
    int no = 0;
};

// Counts "N/A" and "No" in a status column. Tables without a header row use
// their first data row as the header.
class ComplianceCounter {
public:
    explicit ComplianceCounter(std::string column = "Enabled");

    // Throws std::runtime_error when the table is empty or has no such column.
    StatusCounts count(const TableData& table) const;

    static std::string toJson(const StatusCounts& counts);
    static std::string errorJson(const std::string& message);

private:
    std::string column_;
};

}
