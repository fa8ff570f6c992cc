#pragma once

#include "services/ReportProcessor.hpp"
#include <glib.h>
#include <string>

namespace TableScrape {

class Application {
public:
    enum ExitCode {
        ExitOk = 0,
        ExitFailure = 1,
        ExitUsage = 2,
        ExitNoData = 3
    };

    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run(int argc, char* argv[]);

    static int exitCodeFor(ProcessStatus status);

private:
    bool parseArguments(int argc, char* argv[], std::string& errorMessage);
    bool loadConfig();
    ProcessOptions buildOptions() const;

    int runSingle();
    int runCompliance();
    int runFetch();

    gchar* configFile_;
    gchar* outputCsv_;
    gchar* outputHtml_;
    gchar* jsonFile_;
    gchar* contactFile_;
    gint targetTable_;
    gboolean fetch_;
    gboolean compliance_;
    gboolean verbose_;
    std::string htmlFile_;
};

} // namespace TableScrape
