#include "services/ReportProcessor.hpp"
#include "io/Csv.hpp"
#include "io/HtmlTableWriter.hpp"
#include "parser/TableExtractor.hpp"
#include <json-glib/json-glib.h>
#include <stdexcept>

namespace TableScrape {

ReportProcessor::ReportProcessor(ProcessOptions options) : options_(std::move(options)) {}

std::string ReportProcessor::loadReportHtml(const std::string& jsonPath) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, jsonPath.c_str(), &error)) {
        std::string reason = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        g_object_unref(parser);
        throw std::runtime_error("Error reading JSON file " + jsonPath + ": " + reason);
    }

    std::string problem;
    std::string html;
    JsonNode* root = json_parser_get_root(parser);
    JsonObject* obj = (root && JSON_NODE_HOLDS_OBJECT(root)) ? json_node_get_object(root) : nullptr;
    JsonNode* widgetsNode = (obj && json_object_has_member(obj, "widgets"))
        ? json_object_get_member(obj, "widgets") : nullptr;

    if (!widgetsNode || !JSON_NODE_HOLDS_ARRAY(widgetsNode) ||
        json_array_get_length(json_node_get_array(widgetsNode)) == 0) {
        problem = "No 'widgets' array found in JSON or widgets array is empty";
    } else {
        JsonNode* widget = json_array_get_element(json_node_get_array(widgetsNode), 0);
        JsonObject* wobj = JSON_NODE_HOLDS_OBJECT(widget) ? json_node_get_object(widget) : nullptr;
        JsonNode* content = (wobj && json_object_has_member(wobj, "content"))
            ? json_object_get_member(wobj, "content") : nullptr;
        if (!content) {
            problem = "No 'content' field found in first widget";
        } else if (JSON_NODE_HOLDS_VALUE(content) && json_node_get_value_type(content) == G_TYPE_STRING) {
            const char* text = json_node_get_string(content);
            html = text ? text : "";
            if (html.empty()) problem = "No HTML content found in JSON";
        } else {
            problem = "The 'content' field of the first widget is not a string";
        }
    }
    g_object_unref(parser);

    if (!problem.empty()) throw std::runtime_error(problem);
    g_debug("Loaded %zu bytes of HTML from %s", html.size(), jsonPath.c_str());
    return html;
}

ProcessStatus ReportProcessor::processHtml(const std::string& html) {
    table_ = TableData{};
    stats_ = EnrichStats{};
    try {
        table_ = extractTable(html, options_.targetTable);
    } catch (const MalformedInputError& e) {
        g_critical("%s", e.what());
        return ProcessStatus::Failed;
    }
    if (table_.empty()) {
        g_warning("No table data extracted from HTML");
        return ProcessStatus::NoTableData;
    }
    return exportTable();
}

ProcessStatus ReportProcessor::processHtmlFile(const std::string& htmlPath) {
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(htmlPath.c_str(), &contents, &length, &error)) {
        g_critical("Could not read %s: %s", htmlPath.c_str(), error ? error->message : "unknown error");
        if (error) g_error_free(error);
        return ProcessStatus::Failed;
    }
    std::string html(contents, length);
    g_free(contents);
    g_info("Processing HTML file %s", htmlPath.c_str());
    return processHtml(html);
}

ProcessStatus ReportProcessor::processJsonFile(const std::string& jsonPath) {
    g_info("Processing JSON report file %s", jsonPath.c_str());
    std::string html;
    try {
        html = loadReportHtml(jsonPath);
    } catch (const std::runtime_error& e) {
        g_critical("%s", e.what());
        return ProcessStatus::Failed;
    }
    return processHtml(html);
}

ProcessStatus ReportProcessor::exportTable() {
    TableData output = table_;
    rectangularize(output);

    if (!options_.contactFile.empty()) {
        ContactEnricher enricher(ContactEnricher::loadContacts(options_.contactFile));
        if (!enricher.enrich(output, &stats_)) {
            g_warning("Failed to enrich table with contact information, exporting it unchanged");
            output = table_;
            rectangularize(output);
        }
    }

    if (!writeCsv(output, options_.outputCsv)) return ProcessStatus::Failed;

    if (!options_.outputHtml.empty() && !writeHtmlTable(output, options_.outputHtml)) {
        return ProcessStatus::Failed;
    }
    return ProcessStatus::Success;
}

const char* processStatusName(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Success: return "success";
    case ProcessStatus::NoTableData: return "no table data";
    case ProcessStatus::Failed: return "failed";
    }
    return "unknown";
}

}
