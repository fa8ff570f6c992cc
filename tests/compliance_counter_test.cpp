#include "services/ComplianceCounter.hpp"
#include "parser/TableExtractor.hpp"

#include <gtest/gtest.h>
#include <json-glib/json-glib.h>

using TableScrape::ComplianceCounter;
using TableScrape::StatusCounts;
using TableScrape::TableData;

namespace {

// Reads an integer member back from generated JSON.
gint64 memberOf(const std::string& json, const char* name) {
    JsonParser* parser = json_parser_new();
    gint64 value = -1;
    if (json_parser_load_from_data(parser, json.c_str(), -1, nullptr)) {
        JsonObject* obj = json_node_get_object(json_parser_get_root(parser));
        if (json_object_has_member(obj, name)) value = json_object_get_int_member(obj, name);
    }
    g_object_unref(parser);
    return value;
}

}

TEST(ComplianceCounterTest, CountsStatusesInEnabledColumn) {
    const std::string html =
        "<table><thead><tr><th>Control</th><th>Enabled</th></tr></thead><tbody>"
        "<tr><td>A</td><td><span data-macro-name=\"status\">N/A</span></td></tr>"
        "<tr><td>B</td><td><span>No</span></td></tr>"
        "<tr><td>C</td><td>Yes</td></tr>"
        "<tr><td>D</td><td> No </td></tr>"
        "<tr><td>E</td></tr>"
        "</tbody></table>";

    StatusCounts counts = ComplianceCounter().count(TableScrape::extractTable(html));
    EXPECT_EQ(counts.na, 1);
    EXPECT_EQ(counts.no, 2);
}

TEST(ComplianceCounterTest, UsesFirstRowWhenTableHasNoHeader) {
    TableData table;
    table.rows = {{"Name", "Enabled"}, {"x", "N/A"}, {"y", "N/A"}, {"z", "No"}};
    StatusCounts counts = ComplianceCounter().count(table);
    EXPECT_EQ(counts.na, 2);
    EXPECT_EQ(counts.no, 1);
}

TEST(ComplianceCounterTest, MissingColumnOrTableThrows) {
    TableData table;
    table.headers = {"Name", "enabled"};
    table.rows = {{"x", "No"}};
    EXPECT_THROW(ComplianceCounter().count(table), std::runtime_error);
    EXPECT_THROW(ComplianceCounter().count(TableData{}), std::runtime_error);
}

TEST(ComplianceCounterTest, CustomColumnName) {
    TableData table;
    table.headers = {"Status"};
    table.rows = {{"No"}, {"No"}};
    EXPECT_EQ(ComplianceCounter("Status").count(table).no, 2);
}

TEST(ComplianceCounterTest, SerializesCountsAndErrors) {
    StatusCounts counts;
    counts.na = 3;
    counts.no = 4;
    std::string json = ComplianceCounter::toJson(counts);
    EXPECT_EQ(memberOf(json, "na"), 3);
    EXPECT_EQ(memberOf(json, "no"), 4);

    std::string error = ComplianceCounter::errorJson("bad \"input\"");
    JsonParser* parser = json_parser_new();
    ASSERT_TRUE(json_parser_load_from_data(parser, error.c_str(), -1, nullptr));
    JsonObject* obj = json_node_get_object(json_parser_get_root(parser));
    EXPECT_STREQ(json_object_get_string_member(obj, "error"), "bad \"input\"");
    g_object_unref(parser);
}
