#include "cleaner_types.hpp"
#include <cctype>

namespace slack_cleaner {

const char* to_string(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::Keep: return "keep";
        case VerdictKind::ArchiveByInactivity: return "archive_by_inactivity";
        case VerdictKind::ArchiveByDomain: return "archive_by_domain";
    }
    return "unknown";
}

const char* to_string(ActionTaken action) {
    switch (action) {
        case ActionTaken::None: return "none";
        case ActionTaken::Simulated: return "simulated";
        case ActionTaken::Archived: return "archived";
        case ActionTaken::Failed: return "failed";
    }
    return "unknown";
}

std::optional<SystemClock::time_point> parse_slack_ts(const std::string& ts) {
    if (ts.empty()) return std::nullopt;

    std::int64_t seconds = 0;
    std::int64_t micros = 0;
    size_t i = 0;
    for (; i < ts.size() && ts[i] != '.'; ++i) {
        unsigned char c = static_cast<unsigned char>(ts[i]);
        if (!std::isdigit(c)) return std::nullopt;
        if (i >= 12) return std::nullopt; // not a plausible epoch
        seconds = seconds * 10 + (c - '0');
    }
    if (i == 0) return std::nullopt;

    if (i < ts.size()) {
        // fractional part, keep microsecond precision
        int digits = 0;
        for (size_t j = i + 1; j < ts.size(); ++j) {
            unsigned char c = static_cast<unsigned char>(ts[j]);
            if (!std::isdigit(c)) return std::nullopt;
            if (digits < 6) {
                micros = micros * 10 + (c - '0');
                ++digits;
            }
        }
        for (; digits < 6; ++digits) micros *= 10;
    }

    return SystemClock::time_point(std::chrono::duration_cast<SystemClock::duration>(
        std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
}

bool operator==(const Verdict& a, const Verdict& b) {
    return a.kind == b.kind && a.reason == b.reason &&
           a.activity_age == b.activity_age && a.matched_domains == b.matched_domains;
}

bool operator==(const RunResultRecord& a, const RunResultRecord& b) {
    return a.channel_id == b.channel_id && a.channel_name == b.channel_name &&
           a.verdict == b.verdict && a.action == b.action && a.error == b.error;
}

} // namespace slack_cleaner
