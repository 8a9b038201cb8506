#include "report/ReportSink.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace slack_cleaner {

RunSummary summarize(const std::vector<RunResultRecord>& records) {
    RunSummary s;
    s.total = records.size();
    for (const auto& r : records) {
        switch (r.action) {
            case ActionTaken::None: ++s.kept; break;
            case ActionTaken::Simulated: ++s.simulated; break;
            case ActionTaken::Archived: ++s.archived; break;
            case ActionTaken::Failed: ++s.failed; break;
        }
    }
    return s;
}

std::string ConsoleReport::format_line(const RunResultRecord& record) {
    std::string action = to_string(record.action);
    std::transform(action.begin(), action.end(), action.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string line = fmt::format("[{}] #{} ({}) {}: {}",
                                   action, record.channel_name, record.channel_id,
                                   to_string(record.verdict.kind), record.verdict.reason);
    if (record.error) line += fmt::format(" | error: {}", *record.error);
    return line;
}

void ConsoleReport::write(const std::vector<RunResultRecord>& records) {
    for (const auto& record : records) {
        out_ << format_line(record) << '\n';
    }

    auto s = summarize(records);
    out_ << fmt::format("{} channels evaluated: {} kept, {} {}, {} failed\n",
                        s.total, s.kept,
                        live_ ? s.archived : s.simulated,
                        live_ ? "archived" : "would be archived (dry run)",
                        s.failed);
    out_.flush();
}

} // namespace slack_cleaner
