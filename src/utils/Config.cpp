#include "utils/Config.hpp"
#include "utils/StringUtils.hpp"
#include <json-glib/json-glib.h>

namespace TableScrape {

namespace {

std::string stringMember(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return fallback;
    const char* value = json_node_get_string(node);
    return value ? value : fallback;
}

gint64 intMember(JsonObject* obj, const char* name, gint64 fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_INT64) return fallback;
    return json_node_get_int(node);
}

bool boolMember(JsonObject* obj, const char* name, bool fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_BOOLEAN) return fallback;
    return json_node_get_boolean(node);
}

JsonObject* objectMember(JsonObject* obj, const char* name) {
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode* node = json_object_get_member(obj, name);
    return JSON_NODE_HOLDS_OBJECT(node) ? json_node_get_object(node) : nullptr;
}

JsonArray* arrayMember(JsonObject* obj, const char* name) {
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode* node = json_object_get_member(obj, name);
    return JSON_NODE_HOLDS_ARRAY(node) ? json_node_get_array(node) : nullptr;
}

}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

void Config::reset() {
    logLevel_ = LogLevel::Info;
    targetTable_ = 1;
    outputCsv_ = "extracted_table.csv";
    contactFile_.clear();
    reportDelaySeconds_ = 2;
    http_ = HttpSettings{};
    reports_.clear();
}

std::string Config::getConfigPath() const {
    return std::string(g_get_user_config_dir()) + "/tablescrape/config.json";
}

bool Config::load(const std::string& path) {
    reset();

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        g_warning("Could not read config %s: %s", path.c_str(), error ? error->message : "unknown error");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("Config %s is not a JSON object", path.c_str());
        g_object_unref(parser);
        return false;
    }

    JsonObject* obj = json_node_get_object(root);

    logLevel_ = Logger::parseLevel(stringMember(obj, "logLevel", "info"), LogLevel::Info);
    targetTable_ = static_cast<int>(intMember(obj, "targetTable", 1));
    if (targetTable_ < 1) targetTable_ = 1;
    outputCsv_ = stringMember(obj, "outputCsv", outputCsv_);
    contactFile_ = stringMember(obj, "contactFile", "");
    reportDelaySeconds_ = static_cast<int>(intMember(obj, "reportDelaySeconds", 2));
    if (reportDelaySeconds_ < 0) reportDelaySeconds_ = 0;

    if (JsonObject* http = objectMember(obj, "http")) {
        http_.userAgent = stringMember(http, "userAgent", http_.userAgent);
        http_.timeoutSeconds = static_cast<long>(intMember(http, "timeout", http_.timeoutSeconds));
        http_.verifyPeer = boolMember(http, "sslVerify", true);
        http_.proxy = stringMember(http, "proxy", "");
        http_.userToken = stringMember(http, "userToken", "");
        http_.cookie = stringMember(http, "cookie", "");
    }

    if (JsonArray* reports = arrayMember(obj, "reports")) {
        guint len = json_array_get_length(reports);
        for (guint i = 0; i < len; i++) {
            JsonNode* node = json_array_get_element(reports, i);
            if (!JSON_NODE_HOLDS_OBJECT(node)) continue;
            JsonObject* rep = json_node_get_object(node);

            ReportConfig r;
            std::string index = std::to_string(i + 1);
            r.name = stringMember(rep, "name", "Report" + index);
            r.url = trim(stringMember(rep, "url", ""));
            r.payload = stringMember(rep, "payload", "");
            r.outputJson = stringMember(rep, "outputJson", "report" + index + "_output.json");
            r.outputCsv = stringMember(rep, "outputCsv", "report" + index + "_extracted_table.csv");
            r.targetTable = static_cast<int>(intMember(rep, "targetTable", targetTable_));
            if (r.targetTable < 1) r.targetTable = 1;

            if (r.url.empty()) {
                g_warning("Skipping %s - missing URL", r.name.c_str());
                continue;
            }
            reports_.push_back(r);
            g_debug("Loaded configuration for %s", r.name.c_str());
        }
    }

    g_object_unref(parser);
    return true;
}

void Config::applyEnvironment() {
    if (const char* token = g_getenv("TABLESCRAPE_USER_TOKEN")) http_.userToken = token;
    if (const char* cookie = g_getenv("TABLESCRAPE_COOKIE")) http_.cookie = cookie;
    if (const char* proxy = g_getenv("TABLESCRAPE_PROXY")) http_.proxy = proxy;
    if (const char* verify = g_getenv("TABLESCRAPE_SSL_VERIFY")) {
        http_.verifyPeer = toLower(trim(verify)) != "false";
    }
    if (!http_.verifyPeer) g_warning("SSL certificate verification is DISABLED");
}

LogLevel Config::getLogLevel() const { return logLevel_; }

int Config::getTargetTable() const { return targetTable_; }

void Config::setTargetTable(int index) { targetTable_ = index < 1 ? 1 : index; }

std::string Config::getOutputCsv() const { return outputCsv_; }

void Config::setOutputCsv(const std::string& path) { outputCsv_ = path; }

std::string Config::getContactFile() const { return contactFile_; }

void Config::setContactFile(const std::string& path) { contactFile_ = path; }

int Config::getReportDelaySeconds() const { return reportDelaySeconds_; }

HttpSettings Config::getHttpSettings() const { return http_; }

std::vector<ReportConfig> Config::getReports() const { return reports_; }

}
