#pragma once
#include "parser/CellContent.hpp"
#include "parser/TableData.hpp"
#include <libxml/HTMLparser.h>
#include <stdexcept>
#include <string>

namespace TableScrape {

// The HTML tokenizer could not continue; no partial result is available.
class MalformedInputError : public std::runtime_error {
public:
    explicit MalformedInputError(const std::string& what) : std::runtime_error(what) {}
};

// Streams an HTML document through the libxml2 SAX push parser and rebuilds
// one table from the tag events.
//
// The table occurrence to extract is 1-based. When the targeted occurrence
// closes without a header or any data row, the target moves on to the next
// occurrence, so the first non-empty table at or after the requested index is
// returned. Once a table with content closes the tokenizer is stopped.
//
// Each instance owns its parser context and state; use one per thread.
class TableExtractor {
public:
    explicit TableExtractor(int targetTable = 1);
    ~TableExtractor();

    TableExtractor(const TableExtractor&) = delete;
    TableExtractor& operator=(const TableExtractor&) = delete;

    // Throws MalformedInputError when the tokenizer gives up.
    TableData extract(const std::string& html);

    int tablesSeen() const { return tableCount_; }
    int targetTable() const { return targetTable_; }

private:
    enum class CellKind { None, Header, Data };

    struct StructuralState {
        bool inTargetTable = false;
        bool inHeaderRegion = false;
        bool inBodyRegion = false;
        bool inRow = false;
        CellKind cell = CellKind::None;
        int nestedTables = 0;   // <table> elements open inside the target
    };

    static void onStartElement(void* ctx, const xmlChar* name, const xmlChar** atts);
    static void onEndElement(void* ctx, const xmlChar* name);
    static void onCharacters(void* ctx, const xmlChar* ch, int len);

    void startElement(const std::string& tag);
    void endElement(const std::string& tag);
    void characters(const std::string& text);

    bool startStructural(const std::string& tag);
    bool endStructural(const std::string& tag);

    void openTable();
    void closeTable();
    void openRow();
    void closeRow();
    void openCell(CellKind kind);
    void closeCell();
    bool isHeaderRow() const;
    void cleanup();

    htmlParserCtxtPtr ctxt_;
    int requestedTable_;
    int targetTable_;
    int tableCount_;
    bool finished_;
    StructuralState state_;
    CellContent cell_;
    Row currentRow_;
    TableData table_;
};

// Cleans the markup and extracts the first non-empty table at or after the
// 1-based targetTable. Returns an empty TableData when there is none.
TableData extractTable(const std::string& html, int targetTable = 1);

}
