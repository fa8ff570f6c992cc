#include "app/Application.hpp"
#include "parser/TableExtractor.hpp"
#include "services/ComplianceCounter.hpp"
#include "services/ReportFetcher.hpp"
#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <stdexcept>

namespace TableScrape {

namespace {
const gint kTableNotGiven = -1;
}

Application::Application()
    : configFile_(nullptr), outputCsv_(nullptr), outputHtml_(nullptr), jsonFile_(nullptr),
      contactFile_(nullptr), targetTable_(kTableNotGiven), fetch_(FALSE), compliance_(FALSE), verbose_(FALSE) {}

Application::~Application() {
    g_free(configFile_);
    g_free(outputCsv_);
    g_free(outputHtml_);
    g_free(jsonFile_);
    g_free(contactFile_);
}

int Application::exitCodeFor(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Success: return ExitOk;
    case ProcessStatus::NoTableData: return ExitNoData;
    case ProcessStatus::Failed: return ExitFailure;
    }
    return ExitFailure;
}

bool Application::parseArguments(int argc, char* argv[], std::string& errorMessage) {
    GOptionEntry entries[] = {
        { "config", 'c', 0, G_OPTION_ARG_FILENAME, &configFile_, "Configuration file", "FILE" },
        { "table", 't', 0, G_OPTION_ARG_INT, &targetTable_, "1-based table occurrence to extract", "N" },
        { "output", 'o', 0, G_OPTION_ARG_FILENAME, &outputCsv_, "CSV output file", "FILE" },
        { "html-output", 0, 0, G_OPTION_ARG_FILENAME, &outputHtml_, "Also write the table as HTML", "FILE" },
        { "process-json", 'j', 0, G_OPTION_ARG_FILENAME, &jsonFile_, "Read the HTML from a report JSON file", "FILE" },
        { "contacts", 0, 0, G_OPTION_ARG_FILENAME, &contactFile_, "AssignmentGroup contact mapping CSV", "FILE" },
        { "fetch", 0, 0, G_OPTION_ARG_NONE, &fetch_, "Fetch the configured reports", nullptr },
        { "compliance", 0, 0, G_OPTION_ARG_NONE, &compliance_, "Count N/A and No in the Enabled column", nullptr },
        { "verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose_, "Enable debug logging", nullptr },
        { nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr }
    };

    GOptionContext* context = g_option_context_new("[FILE.html] - extract an HTML table to CSV");
    g_option_context_add_main_entries(context, entries, nullptr);

    GError* error = nullptr;
    bool ok = g_option_context_parse(context, &argc, &argv, &error);
    g_option_context_free(context);
    if (!ok) {
        errorMessage = error ? error->message : "invalid arguments";
        if (error) g_error_free(error);
        return false;
    }

    if (argc > 2) {
        errorMessage = "only one HTML file may be given";
        return false;
    }
    if (argc == 2) htmlFile_ = argv[1];

    int sources = (htmlFile_.empty() ? 0 : 1) + (jsonFile_ ? 1 : 0) + (fetch_ ? 1 : 0);
    if (sources != 1) {
        errorMessage = "exactly one input is required: FILE.html, --process-json or --fetch";
        return false;
    }
    if (compliance_ && fetch_) {
        errorMessage = "--compliance cannot be combined with --fetch";
        return false;
    }
    if (targetTable_ != kTableNotGiven && targetTable_ < 1) {
        errorMessage = "--table must be 1 or greater";
        return false;
    }
    return true;
}

bool Application::loadConfig() {
    Config& config = Config::getInstance();
    if (configFile_) {
        if (!config.load(configFile_)) return false;
        g_info("Loaded configuration from %s", configFile_);
    } else {
        config.reset();
        std::string path = config.getConfigPath();
        if (g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
            if (config.load(path)) {
                g_info("Loaded configuration from %s", path.c_str());
            } else {
                g_warning("Ignoring unreadable configuration %s", path.c_str());
            }
        }
    }
    config.applyEnvironment();

    if (targetTable_ != kTableNotGiven) config.setTargetTable(targetTable_);
    if (outputCsv_) config.setOutputCsv(outputCsv_);
    if (contactFile_) config.setContactFile(contactFile_);
    return true;
}

ProcessOptions Application::buildOptions() const {
    const Config& config = Config::getInstance();
    ProcessOptions options;
    options.targetTable = config.getTargetTable();
    options.outputCsv = config.getOutputCsv();
    options.contactFile = config.getContactFile();
    if (outputHtml_) options.outputHtml = outputHtml_;
    return options;
}

int Application::run(int argc, char* argv[]) {
    Logger::init(LogLevel::Info);

    std::string errorMessage;
    if (!parseArguments(argc, argv, errorMessage)) {
        std::cerr << "tablescrape: " << errorMessage << std::endl;
        std::cerr << "Run 'tablescrape --help' to see a full list of available options." << std::endl;
        return ExitUsage;
    }

    if (!loadConfig()) return ExitFailure;
    Logger::setLevel(verbose_ ? LogLevel::Debug : Config::getInstance().getLogLevel());

    if (fetch_) return runFetch();
    if (compliance_) return runCompliance();
    return runSingle();
}

int Application::runSingle() {
    ReportProcessor processor(buildOptions());
    ProcessStatus status = jsonFile_ ? processor.processJsonFile(jsonFile_)
                                     : processor.processHtmlFile(htmlFile_);
    g_info("Processing finished: %s", processStatusName(status));
    return exitCodeFor(status);
}

int Application::runCompliance() {
    std::string html;
    try {
        if (jsonFile_) {
            html = ReportProcessor::loadReportHtml(jsonFile_);
        } else {
            gchar* contents = nullptr;
            gsize length = 0;
            GError* error = nullptr;
            if (!g_file_get_contents(htmlFile_.c_str(), &contents, &length, &error)) {
                std::string reason = error ? error->message : "unknown error";
                if (error) g_error_free(error);
                throw std::runtime_error("File not found at " + htmlFile_ + ": " + reason);
            }
            html.assign(contents, length);
            g_free(contents);
        }

        TableData table = extractTable(html, Config::getInstance().getTargetTable());
        StatusCounts counts = ComplianceCounter().count(table);
        std::cout << ComplianceCounter::toJson(counts) << std::endl;
        return ExitOk;
    } catch (const std::runtime_error& e) {
        g_critical("Compliance count failed: %s", e.what());
        std::cout << ComplianceCounter::errorJson(e.what()) << std::endl;
        return ExitFailure;
    }
}

int Application::runFetch() {
    const Config& config = Config::getInstance();
    std::vector<ReportConfig> reports = config.getReports();
    if (reports.empty()) {
        g_critical("No reports configured");
        return ExitFailure;
    }

    ReportFetcher fetcher(config.getHttpSettings());
    ProcessOptions base = buildOptions();
    int failures = 0;

    for (size_t i = 0; i < reports.size(); ++i) {
        const ReportConfig& report = reports[i];
        g_info("Processing report %zu/%zu: %s", i + 1, reports.size(), report.name.c_str());

        FetchResult result = fetcher.fetch(report);
        if (result.savedJson) {
            ProcessOptions options = base;
            options.targetTable = report.targetTable;
            options.outputCsv = report.outputCsv;
            ReportProcessor processor(options);
            ProcessStatus status = processor.processJsonFile(result.savedPath);
            if (status != ProcessStatus::Success) {
                g_warning("Failed to extract table data from %s: %s",
                          report.name.c_str(), processStatusName(status));
            }
        }

        if (result.success) {
            g_info("%s completed successfully", report.name.c_str());
        } else {
            g_warning("%s failed", report.name.c_str());
            ++failures;
        }

        if (i + 1 < reports.size() && config.getReportDelaySeconds() > 0) {
            g_debug("Waiting %d seconds before next report", config.getReportDelaySeconds());
            g_usleep(static_cast<gulong>(config.getReportDelaySeconds()) * G_USEC_PER_SEC);
        }
    }

    g_info("%zu of %zu reports fetched successfully", reports.size() - failures, reports.size());
    return failures == 0 ? ExitOk : ExitFailure;
}

} // namespace TableScrape
