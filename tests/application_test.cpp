#include "app/Application.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>
#include <vector>

using TableScrape::Application;
using TableScrape::ProcessStatus;
using TableScrape::Testing::TempDir;

namespace {

int runWith(std::vector<std::string> args) {
    args.insert(args.begin(), "tablescrape");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(&arg[0]);
    argv.push_back(nullptr);

    Application app;
    return app.run(static_cast<int>(args.size()), argv.data());
}

const char* kTableHtml = "<table><tr><th>Name</th><th>Enabled</th></tr><tr><td>a</td><td>No</td></tr></table>";

}

TEST(ApplicationTest, ExitCodesForStatuses) {
    EXPECT_EQ(Application::exitCodeFor(ProcessStatus::Success), Application::ExitOk);
    EXPECT_EQ(Application::exitCodeFor(ProcessStatus::NoTableData), Application::ExitNoData);
    EXPECT_EQ(Application::exitCodeFor(ProcessStatus::Failed), Application::ExitFailure);
}

TEST(ApplicationTest, RequiresExactlyOneInput) {
    TempDir dir;
    std::string html = dir.write("page.html", kTableHtml);
    EXPECT_EQ(runWith({}), Application::ExitUsage);
    EXPECT_EQ(runWith({html, html}), Application::ExitUsage);
    EXPECT_EQ(runWith({"--fetch", html}), Application::ExitUsage);
    EXPECT_EQ(runWith({"--no-such-option"}), Application::ExitUsage);
    EXPECT_EQ(runWith({"-t", "0", html}), Application::ExitUsage);
}

TEST(ApplicationTest, ExtractsHtmlFileToCsv) {
    TempDir dir;
    std::string html = dir.write("page.html", kTableHtml);
    std::string csv = dir.file("out.csv");
    std::string htmlOut = dir.file("out.html");

    EXPECT_EQ(runWith({"-o", csv, "--html-output", htmlOut, html}), Application::ExitOk);
    EXPECT_EQ(TempDir::read(csv), "Name,Enabled\na,No\n");
    EXPECT_TRUE(TempDir::exists(htmlOut));
}

TEST(ApplicationTest, NoTableDataHasItsOwnExitCode) {
    TempDir dir;
    std::string html = dir.write("page.html", "<p>nothing here</p>");
    EXPECT_EQ(runWith({"-o", dir.file("out.csv"), html}), Application::ExitNoData);
}

TEST(ApplicationTest, MissingInputsFail) {
    TempDir dir;
    EXPECT_EQ(runWith({"-o", dir.file("out.csv"), dir.file("missing.html")}), Application::ExitFailure);
    EXPECT_EQ(runWith({"-c", dir.file("missing.json"), dir.write("page.html", kTableHtml)}),
              Application::ExitFailure);
}

TEST(ApplicationTest, ComplianceModePrintsCounts) {
    TempDir dir;
    std::string html = dir.write("page.html", kTableHtml);

    testing::internal::CaptureStdout();
    int rc = runWith({"--compliance", html});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, Application::ExitOk);
    EXPECT_NE(out.find("\"no\""), std::string::npos);

    testing::internal::CaptureStdout();
    rc = runWith({"--compliance", dir.write("empty.html", "<p>x</p>")});
    out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, Application::ExitFailure);
    EXPECT_NE(out.find("\"error\""), std::string::npos);
}
