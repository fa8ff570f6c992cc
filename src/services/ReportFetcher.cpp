#include "services/ReportFetcher.hpp"
#include <json-glib/json-glib.h>

namespace TableScrape {

ReportFetcher::ReportFetcher(const HttpSettings& settings) : settings_(settings) {
    client_.setUserAgent(settings_.userAgent);
    client_.setTimeout(settings_.timeoutSeconds);
    client_.setVerifyPeer(settings_.verifyPeer);
    client_.setProxy(settings_.proxy);
}

HttpClient::HeaderList ReportFetcher::buildHeaders(const ReportConfig& report, const HttpSettings& settings) {
    HttpClient::HeaderList headers = {
        "Content-Type: application/x-www-form-urlencoded; charset=UTF-8",
        "Accept: application/json, text/plain, */*",
        "Referer: " + report.url,
        "X-Requested-With: XMLHttpRequest",
    };
    if (!settings.userToken.empty()) headers.push_back("X-UserToken: " + settings.userToken);
    if (!settings.cookie.empty()) headers.push_back("Cookie: " + settings.cookie);
    return headers;
}

std::string ReportFetcher::textPathFor(const std::string& jsonPath) {
    const std::string ext = ".json";
    if (jsonPath.size() >= ext.size() &&
        jsonPath.compare(jsonPath.size() - ext.size(), ext.size(), ext) == 0) {
        return jsonPath.substr(0, jsonPath.size() - ext.size()) + ".txt";
    }
    return jsonPath + ".txt";
}

bool ReportFetcher::saveResponse(const std::string& body, const std::string& jsonPath, std::string* savedPath) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;
    bool isJson = json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error) &&
                  json_parser_get_root(parser) != nullptr;
    if (error) {
        g_debug("Response is not JSON: %s", error->message);
        g_error_free(error);
        error = nullptr;
    }

    if (isJson) {
        JsonGenerator* gen = json_generator_new();
        json_generator_set_root(gen, json_parser_get_root(parser));
        json_generator_set_pretty(gen, TRUE);
        json_generator_set_indent(gen, 4);
        bool written = json_generator_to_file(gen, jsonPath.c_str(), &error);
        g_object_unref(gen);
        g_object_unref(parser);
        if (!written) {
            g_warning("Could not write %s: %s", jsonPath.c_str(), error ? error->message : "unknown error");
            if (error) g_error_free(error);
            return false;
        }
        g_info("Saved JSON response to %s", jsonPath.c_str());
        if (savedPath) *savedPath = jsonPath;
        return true;
    }
    g_object_unref(parser);

    std::string txtPath = textPathFor(jsonPath);
    if (!g_file_set_contents(txtPath.c_str(), body.data(), static_cast<gssize>(body.size()), &error)) {
        g_warning("Could not write %s: %s", txtPath.c_str(), error ? error->message : "unknown error");
        if (error) g_error_free(error);
        return false;
    }
    g_warning("Response is not valid JSON, saved raw text to %s", txtPath.c_str());
    if (savedPath) *savedPath = txtPath;
    return false;
}

FetchResult ReportFetcher::fetch(const ReportConfig& report) {
    FetchResult result;
    g_info("Fetching %s from %s", report.name.c_str(), report.url.c_str());
    if (settings_.userToken.empty()) g_warning("No user token configured for %s", report.name.c_str());

    HttpClient::HeaderList headers = buildHeaders(report, settings_);
    g_debug("Report payload: %s", report.payload.c_str());

    HttpClient::Response response = report.payload.empty()
        ? client_.get(report.url, headers)
        : client_.post(report.url, report.payload, headers);

    if (!response.error.empty()) {
        g_warning("Request for %s failed: %s", report.name.c_str(), response.error.c_str());
        return result;
    }

    result.statusCode = response.statusCode;
    result.savedJson = saveResponse(response.body, report.outputJson, &result.savedPath);
    result.success = response.statusCode == 200;
    if (result.success) {
        g_info("Successfully fetched %s", report.name.c_str());
    } else {
        g_warning("Failed to fetch %s. Status code: %d", report.name.c_str(), response.statusCode);
    }
    return result;
}

}
