#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "report/ReportSink.hpp"

using namespace slack_cleaner;

namespace {

RunResultRecord record(const std::string& id, const std::string& name, VerdictKind kind,
                       const std::string& reason, ActionTaken action,
                       std::optional<std::string> error = std::nullopt) {
    RunResultRecord r;
    r.channel_id = id;
    r.channel_name = name;
    r.verdict.kind = kind;
    r.verdict.reason = reason;
    r.action = action;
    r.error = std::move(error);
    return r;
}

std::vector<RunResultRecord> sample() {
    return {
        record("C1", "proj-x", VerdictKind::ArchiveByDomain, "all members match domains: acme.com",
               ActionTaken::Archived),
        record("C2", "general", VerdictKind::ArchiveByInactivity, "no activity for 90 days (threshold 30 days)",
               ActionTaken::Failed, std::string("permission (cant_archive_general)")),
        record("C3", "busy", VerdictKind::Keep, "last activity 1 day ago (threshold 30 days)",
               ActionTaken::None),
    };
}

} // namespace

TEST(CsvReport, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(CsvReport::escape_field("plain"), "plain");
    EXPECT_EQ(CsvReport::escape_field("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvReport::escape_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CsvReport::escape_field("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(CsvReport::escape_field(""), "");
}

TEST(CsvReport, WritesHeaderAndRows) {
    std::ostringstream out;
    CsvReport::write_to(out, sample());

    std::string expected =
        "channel_id,channel_name,verdict,action,reason\r\n"
        "C1,proj-x,archive_by_domain,archived,all members match domains: acme.com\r\n"
        "C2,general,archive_by_inactivity,failed,"
        "no activity for 90 days (threshold 30 days) (error: permission (cant_archive_general))\r\n"
        "C3,busy,keep,none,last activity 1 day ago (threshold 30 days)\r\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(CsvReport, WritesFileAndFailsOnBadPath) {
    const std::string path = ::testing::TempDir() + "slack_cleaner_report_test.csv";
    CsvReport(path).write(sample());

    std::ifstream f(path);
    std::string header;
    std::getline(f, header);
    EXPECT_EQ(header, "channel_id,channel_name,verdict,action,reason\r");
    f.close();
    std::remove(path.c_str());

    EXPECT_THROW(CsvReport("/nonexistent-dir/x/report.csv").write(sample()), std::runtime_error);
}

TEST(ConsoleReport, FormatsLinesAndSummary) {
    std::ostringstream out;
    ConsoleReport(out, true).write(sample());

    std::string text = out.str();
    EXPECT_NE(text.find("[ARCHIVED] #proj-x (C1) archive_by_domain: all members match domains: acme.com"),
              std::string::npos);
    EXPECT_NE(text.find("[FAILED] #general (C2)"), std::string::npos);
    EXPECT_NE(text.find("| error: permission (cant_archive_general)"), std::string::npos);
    EXPECT_NE(text.find("3 channels evaluated: 1 kept, 1 archived, 1 failed"), std::string::npos);
}

TEST(ConsoleReport, DryRunSummaryWording) {
    std::vector<RunResultRecord> records = {
        record("C1", "proj-x", VerdictKind::ArchiveByDomain, "r", ActionTaken::Simulated),
    };
    std::ostringstream out;
    ConsoleReport(out, false).write(records);
    EXPECT_NE(out.str().find("1 would be archived (dry run)"), std::string::npos);
}

TEST(RunSummary, CountsActions) {
    auto s = summarize(sample());
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.archived, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.kept, 1u);
    EXPECT_EQ(s.simulated, 0u);
}
