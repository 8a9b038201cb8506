#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace slack_cleaner {

using SystemClock = std::chrono::system_clock;

struct Channel {
    std::string id;
    std::string name;
    std::int64_t created = 0;   // epoch seconds
    bool is_archived = false;
    bool is_private = false;
    int num_members = 0;        // advisory only, members are always listed
};

struct User {
    std::string id;
    std::optional<std::string> email;
    bool is_bot = false;
    bool deleted = false;
};

struct Message {
    std::optional<SystemClock::time_point> posted_at; // nullopt when "ts" is malformed
    std::string user;
    std::string subtype;
};

struct AuthIdentity {
    std::string team;
    std::string team_id;
    std::string user;
    std::string user_id;
    std::string url;
};

enum class VerdictKind {
    Keep,
    ArchiveByInactivity,
    ArchiveByDomain
};

struct Verdict {
    VerdictKind kind = VerdictKind::Keep;
    std::string reason;
    std::optional<std::chrono::seconds> activity_age;
    std::set<std::string> matched_domains;

    bool is_archive() const { return kind != VerdictKind::Keep; }
};

enum class ActionTaken {
    None,       // verdict was Keep
    Simulated,  // dry run
    Archived,
    Failed
};

struct RunResultRecord {
    std::string channel_id;
    std::string channel_name;
    Verdict verdict;
    ActionTaken action = ActionTaken::None;
    std::optional<std::string> error;
};

const char* to_string(VerdictKind kind);
const char* to_string(ActionTaken action);

// Slack message timestamps look like "1712345678.000200".
std::optional<SystemClock::time_point> parse_slack_ts(const std::string& ts);

bool operator==(const Verdict& a, const Verdict& b);
bool operator==(const RunResultRecord& a, const RunResultRecord& b);

} // namespace slack_cleaner
