#include "io/Csv.hpp"
#include <glib.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TableScrape {

void rectangularize(TableData& table) {
    if (table.headers.empty()) return;
    const size_t width = table.headers.size();
    for (auto& row : table.rows) {
        row.resize(width);
    }
}

std::string formatCsvRow(const Row& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        const std::string& cell = row[i];
        bool needQuotes = cell.find_first_of(",\"\r\n") != std::string::npos;
        if (needQuotes) {
            line += '"';
            for (char ch : cell) {
                if (ch == '"') line += '"';
                line += ch;
            }
            line += '"';
        } else {
            line += cell;
        }
        if (i + 1 < row.size()) line += ',';
    }
    return line;
}

bool writeCsv(const TableData& table, const std::string& path) {
    if (table.empty()) {
        g_warning("No table data to save to %s", path.c_str());
        return false;
    }

    TableData rect = table;
    rectangularize(rect);

    std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!ofs) {
        g_warning("Could not open %s for writing", path.c_str());
        return false;
    }
    if (!rect.headers.empty()) ofs << formatCsvRow(rect.headers) << "\n";
    for (const auto& row : rect.rows) ofs << formatCsvRow(row) << "\n";
    ofs.close();
    if (!ofs) {
        g_warning("Error while writing %s", path.c_str());
        return false;
    }

    g_info("Saved %zu rows to %s", rect.rows.size(), path.c_str());
    return true;
}

std::vector<Row> parseCsv(const std::string& text) {
    std::vector<Row> rows;
    Row row;
    std::string field;
    bool inQuotes = false;
    bool rowStarted = false;

    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
        case '"':
            inQuotes = true;
            rowStarted = true;
            break;
        case ',':
            row.push_back(std::move(field));
            field.clear();
            rowStarted = true;
            break;
        case '\r':
            break;
        case '\n':
            if (rowStarted || !field.empty()) {
                row.push_back(std::move(field));
                rows.push_back(std::move(row));
            }
            field.clear();
            row.clear();
            rowStarted = false;
            break;
        default:
            field += c;
            rowStarted = true;
            break;
        }
    }
    if (rowStarted || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<Row> readCsvFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) throw std::runtime_error("Cannot open CSV file: " + path);
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return parseCsv(buffer.str());
}

}
