#pragma once
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include <string>

namespace TableScrape {

struct FetchResult {
    bool success = false;       // HTTP 200
    bool savedJson = false;     // response parsed as JSON and written to outputJson
    std::string savedPath;
    int statusCode = 0;
};

// Downloads report JSON from a report endpoint with an already issued user
// token and session cookie.
class ReportFetcher {
public:
    explicit ReportFetcher(const HttpSettings& settings);

    FetchResult fetch(const ReportConfig& report);

    static HttpClient::HeaderList buildHeaders(const ReportConfig& report, const HttpSettings& settings);

    // Writes a JSON body pretty-printed to jsonPath, anything else verbatim to
    // the matching .txt path. Returns true when the body was JSON.
    static bool saveResponse(const std::string& body, const std::string& jsonPath, std::string* savedPath);
    static std::string textPathFor(const std::string& jsonPath);

private:
    HttpSettings settings_;
    HttpClient client_;
};

}
