#include "io/HtmlTableWriter.hpp"
#include <glib.h>
#include <fstream>

namespace TableScrape {

std::string escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string renderHtmlTable(const TableData& table) {
    std::string html = "<table>\n";
    if (!table.headers.empty()) {
        html += "<thead><tr>";
        for (const auto& h : table.headers) html += "<th>" + escapeHtml(h) + "</th>";
        html += "</tr></thead>\n";
    }
    html += "<tbody>\n";
    for (const auto& row : table.rows) {
        html += "<tr>";
        for (const auto& cell : row) html += "<td>" + escapeHtml(cell) + "</td>";
        html += "</tr>\n";
    }
    html += "</tbody>\n</table>\n";
    return html;
}

bool writeHtmlTable(const TableData& table, const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        g_warning("Could not open %s for writing", path.c_str());
        return false;
    }
    ofs << renderHtmlTable(table);
    ofs.close();
    if (!ofs) {
        g_warning("Error while writing %s", path.c_str());
        return false;
    }
    g_info("Wrote HTML table to %s", path.c_str());
    return true;
}

}
