#pragma once
#include "parser/TableData.hpp"
#include "services/ContactEnricher.hpp"
#include <string>

namespace TableScrape {

enum class ProcessStatus {
    Success,
    NoTableData,
    Failed
};

struct ProcessOptions {
    int targetTable = 1;
    std::string outputCsv = "extracted_table.csv";
    std::string outputHtml;     // empty: no HTML rendering
    std::string contactFile;    // empty: no enrichment
};

// Report HTML -> table -> CSV, with optional contact enrichment and HTML
// re-rendering. Enrichment problems are logged but never fail the export.
class ReportProcessor {
public:
    explicit ReportProcessor(ProcessOptions options);

    // HTML of the first widget in a report JSON document.
    // Throws std::runtime_error when the file or the field is missing.
    static std::string loadReportHtml(const std::string& jsonPath);

    ProcessStatus processHtml(const std::string& html);
    ProcessStatus processHtmlFile(const std::string& htmlPath);
    ProcessStatus processJsonFile(const std::string& jsonPath);

    // Table as extracted, before enrichment.
    const TableData& table() const { return table_; }
    const EnrichStats& enrichStats() const { return stats_; }

private:
    ProcessStatus exportTable();

    ProcessOptions options_;
    TableData table_;
    EnrichStats stats_;
};

const char* processStatusName(ProcessStatus status);

}
