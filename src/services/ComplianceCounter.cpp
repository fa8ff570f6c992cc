#include "services/ComplianceCounter.hpp"
#include "utils/StringUtils.hpp"
#include <json-glib/json-glib.h>
#include <algorithm>
#include <stdexcept>

namespace TableScrape {

namespace {

std::string generate(JsonBuilder* builder) {
    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* gen = json_generator_new();
    json_generator_set_root(gen, root);
    gchar* text = json_generator_to_data(gen, nullptr);
    std::string out = text ? text : "";
    g_free(text);
    g_object_unref(gen);
    json_node_unref(root);
    return out;
}

}

ComplianceCounter::ComplianceCounter(std::string column) : column_(std::move(column)) {}

StatusCounts ComplianceCounter::count(const TableData& table) const {
    if (table.empty()) throw std::runtime_error("Could not find table in HTML content.");

    const Row* header = &table.headers;
    size_t firstData = 0;
    if (header->empty()) {
        header = &table.rows.front();
        firstData = 1;
    }

    auto it = std::find(header->begin(), header->end(), column_);
    if (it == header->end()) {
        throw std::runtime_error("Could not find '" + column_ + "' column header in the table.");
    }
    size_t col = static_cast<size_t>(it - header->begin());

    StatusCounts counts;
    for (size_t r = firstData; r < table.rows.size(); ++r) {
        const Row& row = table.rows[r];
        if (row.size() <= col) continue;
        std::string value = trim(row[col]);
        if (value == "N/A") {
            ++counts.na;
        } else if (value == "No") {
            ++counts.no;
        }
    }
    g_info("Column '%s': %d N/A, %d No", column_.c_str(), counts.na, counts.no);
    return counts;
}

std::string ComplianceCounter::toJson(const StatusCounts& counts) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "na");
    json_builder_add_int_value(builder, counts.na);
    json_builder_set_member_name(builder, "no");
    json_builder_add_int_value(builder, counts.no);
    json_builder_end_object(builder);
    std::string out = generate(builder);
    g_object_unref(builder);
    return out;
}

std::string ComplianceCounter::errorJson(const std::string& message) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "error");
    json_builder_add_string_value(builder, message.c_str());
    json_builder_end_object(builder);
    std::string out = generate(builder);
    g_object_unref(builder);
    return out;
}

}
