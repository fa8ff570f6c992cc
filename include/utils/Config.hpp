#pragma once
#include "utils/Logger.hpp"
#include <string>
#include <vector>

namespace TableScrape {

struct HttpSettings {
    std::string userAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36";
    long timeoutSeconds = 30;
    bool verifyPeer = true;
    std::string proxy;
    std::string userToken;
    std::string cookie;
};

struct ReportConfig {
    std::string name;
    std::string url;
    std::string payload;
    std::string outputJson;
    std::string outputCsv;
    int targetTable = 1;
};

class Config {
public:
    static Config& getInstance();

    // Resets to defaults, then reads the JSON file. Returns false when the
    // file is missing or not a JSON object; defaults stay in effect then.
    bool load(const std::string& path);
    // TABLESCRAPE_USER_TOKEN, TABLESCRAPE_COOKIE, TABLESCRAPE_PROXY,
    // TABLESCRAPE_SSL_VERIFY take precedence over the file.
    void applyEnvironment();
    void reset();

    std::string getConfigPath() const;

    LogLevel getLogLevel() const;
    int getTargetTable() const;
    void setTargetTable(int index);
    std::string getOutputCsv() const;
    void setOutputCsv(const std::string& path);
    std::string getContactFile() const;
    void setContactFile(const std::string& path);
    int getReportDelaySeconds() const;

    HttpSettings getHttpSettings() const;
    std::vector<ReportConfig> getReports() const;

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    LogLevel logLevel_;
    int targetTable_;
    std::string outputCsv_;
    std::string contactFile_;
    int reportDelaySeconds_;
    HttpSettings http_;
    std::vector<ReportConfig> reports_;
};

}
