#pragma once
#include <string>
#include <vector>

namespace TableScrape {

using Row = std::vector<std::string>;

// One extracted table. Both sequences empty means no usable table was found.
struct TableData {
    std::vector<std::string> headers;
    std::vector<Row> rows;

    bool empty() const { return headers.empty() && rows.empty(); }
};

}
