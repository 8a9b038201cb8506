#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "cleaner_types.hpp"

namespace slack_cleaner {

struct RunSummary {
    size_t total = 0;
    size_t kept = 0;
    size_t simulated = 0;
    size_t archived = 0;
    size_t failed = 0;
};

RunSummary summarize(const std::vector<RunResultRecord>& records);

class IReportSink {
public:
    virtual ~IReportSink() = default;
    virtual void write(const std::vector<RunResultRecord>& records) = 0;
};

// Human-readable lines plus a summary.
class ConsoleReport : public IReportSink {
public:
    ConsoleReport(std::ostream& out, bool live) : out_(out), live_(live) {}
    void write(const std::vector<RunResultRecord>& records) override;

    static std::string format_line(const RunResultRecord& record);

private:
    std::ostream& out_;
    bool live_;
};

// channel_id,channel_name,verdict,action,reason
class CsvReport : public IReportSink {
public:
    explicit CsvReport(std::string path) : path_(std::move(path)) {}

    // Throws std::runtime_error when the file cannot be written.
    void write(const std::vector<RunResultRecord>& records) override;

    static void write_to(std::ostream& out, const std::vector<RunResultRecord>& records);
    static std::string escape_field(const std::string& field);

private:
    std::string path_;
};

} // namespace slack_cleaner
