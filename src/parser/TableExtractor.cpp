#include "parser/TableExtractor.hpp"
#include "parser/MarkupCleaner.hpp"
#include "utils/StringUtils.hpp"
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <glib.h>
#include <algorithm>
#include <cstring>
#include <limits>

namespace TableScrape {

namespace {

bool isBlankRow(const Row& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) { return isBlank(cell); });
}

}

TableExtractor::TableExtractor(int targetTable)
    : ctxt_(nullptr),
      requestedTable_(targetTable < 1 ? 1 : targetTable),
      targetTable_(requestedTable_),
      tableCount_(0),
      finished_(false) {
    xmlInitParser();
}

TableExtractor::~TableExtractor() { cleanup(); }

void TableExtractor::cleanup() {
    if (ctxt_) { htmlFreeParserCtxt(ctxt_); ctxt_ = nullptr; }
}

TableData TableExtractor::extract(const std::string& html) {
    cleanup();
    targetTable_ = requestedTable_;
    tableCount_ = 0;
    finished_ = false;
    state_ = StructuralState{};
    cell_ = CellContent{};
    currentRow_.clear();
    table_ = TableData{};

    if (html.empty()) return table_;
    if (html.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw MalformedInputError("document of " + std::to_string(html.size()) +
                                  " bytes exceeds the tokenizer input limit");
    }

    htmlSAXHandler sax;
    std::memset(&sax, 0, sizeof(sax));
    sax.startElement = onStartElement;
    sax.endElement = onEndElement;
    sax.characters = onCharacters;
    sax.ignorableWhitespace = onCharacters;

    ctxt_ = htmlCreatePushParserCtxt(&sax, this, nullptr, 0, nullptr, XML_CHAR_ENCODING_UTF8);
    if (!ctxt_) throw MalformedInputError("could not create HTML parser context");

    // Implied <html>/<body> stay enabled: without them the parser stops
    // reporting events once the first top-level element closes.
    int unsupported = htmlCtxtUseOptions(ctxt_, HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                                HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (unsupported != 0) g_debug("Parser ignored option bits 0x%x", unsupported);

    int rc = htmlParseChunk(ctxt_, html.data(), static_cast<int>(html.size()), 1);
    if (rc != 0 && !finished_) g_debug("Recovered from markup errors (last error code %d)", rc);

    // disableSAX is also set by our own xmlStopParser(); only an unrequested
    // halt means the tokenizer gave up.
    if (ctxt_->disableSAX != 0 && !finished_) {
        std::string reason = "tokenizer halted";
        const xmlError* err = xmlCtxtGetLastError(ctxt_);
        if (err && err->message) reason = trim(err->message);
        cleanup();
        throw MalformedInputError("HTML input could not be parsed: " + reason);
    }
    cleanup();

    if (!finished_ && state_.inTargetTable) {
        g_debug("Document ended inside table #%d", tableCount_);
        closeTable();
    }
    return table_;
}

void TableExtractor::onStartElement(void* ctx, const xmlChar* name, const xmlChar** /*atts*/) {
    if (!ctx || !name) return;
    static_cast<TableExtractor*>(ctx)->startElement(reinterpret_cast<const char*>(name));
}

void TableExtractor::onEndElement(void* ctx, const xmlChar* name) {
    if (!ctx || !name) return;
    static_cast<TableExtractor*>(ctx)->endElement(reinterpret_cast<const char*>(name));
}

void TableExtractor::onCharacters(void* ctx, const xmlChar* ch, int len) {
    if (!ctx || !ch || len <= 0) return;
    static_cast<TableExtractor*>(ctx)->characters(std::string(reinterpret_cast<const char*>(ch), len));
}

void TableExtractor::startElement(const std::string& tag) {
    if (finished_) return;
    if (tag == "table") {
        openTable();
        return;
    }
    if (!state_.inTargetTable) return;
    if (state_.nestedTables == 0 && startStructural(tag)) return;
    if (state_.cell != CellKind::None && CellContent::isMeaningfulTag(tag)) cell_.openElement(tag);
}

void TableExtractor::endElement(const std::string& tag) {
    if (finished_ || !state_.inTargetTable) return;
    if (tag == "table") {
        if (state_.nestedTables > 0) {
            --state_.nestedTables;
            return;
        }
        closeTable();
        return;
    }
    if (state_.nestedTables == 0 && endStructural(tag)) return;
    if (state_.cell != CellKind::None && CellContent::isMeaningfulTag(tag)) cell_.closeElement(tag);
}

void TableExtractor::characters(const std::string& text) {
    if (finished_ || state_.cell == CellKind::None) return;
    cell_.appendText(text);
}

bool TableExtractor::startStructural(const std::string& tag) {
    if (tag == "thead") {
        state_.inHeaderRegion = true;
    } else if (tag == "tbody") {
        state_.inBodyRegion = true;
    } else if (tag == "tr") {
        openRow();
    } else if (tag == "th" && state_.inRow) {
        openCell(CellKind::Header);
    } else if (tag == "td" && state_.inRow) {
        openCell(CellKind::Data);
    } else {
        return false;
    }
    return true;
}

bool TableExtractor::endStructural(const std::string& tag) {
    if (tag == "thead") {
        state_.inHeaderRegion = false;
    } else if (tag == "tbody") {
        state_.inBodyRegion = false;
    } else if (tag == "tr") {
        if (state_.inRow) closeRow();
    } else if (tag == "th") {
        if (state_.cell == CellKind::Header) closeCell();
    } else if (tag == "td") {
        if (state_.cell == CellKind::Data) closeCell();
    } else {
        return false;
    }
    return true;
}

void TableExtractor::openTable() {
    if (state_.inTargetTable) {
        ++state_.nestedTables;
        return;
    }
    ++tableCount_;
    if (tableCount_ == targetTable_) {
        state_ = StructuralState{};
        state_.inTargetTable = true;
        g_debug("Found start of table #%d", tableCount_);
    }
}

void TableExtractor::closeTable() {
    if (state_.inRow) closeRow();
    state_ = StructuralState{};

    if (table_.empty()) {
        g_debug("Table #%d has no content, looking for the next table", tableCount_);
        ++targetTable_;
        return;
    }

    g_debug("Table #%d closed with %zu headers and %zu rows",
            tableCount_, table_.headers.size(), table_.rows.size());
    finished_ = true;
    if (ctxt_) xmlStopParser(ctxt_);
}

void TableExtractor::openRow() {
    if (state_.inRow) closeRow();
    state_.inRow = true;
    currentRow_.clear();
}

void TableExtractor::closeRow() {
    if (state_.cell != CellKind::None) closeCell();
    state_.inRow = false;

    Row row;
    row.swap(currentRow_);
    if (row.empty() || isBlankRow(row)) {
        g_debug("Skipping row without content");
        return;
    }

    if (isHeaderRow() && table_.headers.empty()) {
        table_.headers = std::move(row);
        g_debug("Captured header row with %zu cells", table_.headers.size());
    } else {
        table_.rows.push_back(std::move(row));
    }
}

void TableExtractor::openCell(CellKind kind) {
    if (state_.cell != CellKind::None) closeCell();
    state_.cell = kind;
    cell_ = CellContent{};
}

void TableExtractor::closeCell() {
    currentRow_.push_back(cell_.resolve());
    state_.cell = CellKind::None;
    cell_ = CellContent{};
}

bool TableExtractor::isHeaderRow() const {
    return state_.inHeaderRegion || (table_.headers.empty() && !state_.inBodyRegion);
}

TableData extractTable(const std::string& html, int targetTable) {
    if (html.empty()) {
        g_warning("No HTML content provided for table extraction");
        return TableData{};
    }

    std::string cleaned = cleanMalformedMarkup(html);
    TableExtractor extractor(targetTable);
    TableData table = extractor.extract(cleaned);

    if (extractor.tablesSeen() == 0) {
        g_warning("No table found in HTML content");
    } else if (table.empty()) {
        g_warning("No table with content at or after #%d (%d table(s) in document)",
                  targetTable, extractor.tablesSeen());
    } else {
        g_info("Extracted table #%d with %zu headers and %zu rows",
               extractor.targetTable(), table.headers.size(), table.rows.size());
    }
    return table;
}

}
