#include "archival_orchestrator.hpp"

namespace slack_cleaner {

RunAbortedError::RunAbortedError(const std::string& stage, RemoteError error)
    : std::runtime_error(stage + " failed: " + error.describe()), error_(std::move(error)) {}

ArchivalOrchestrator::ArchivalOrchestrator(const PolicyConfig& policy,
                                           IWorkspaceClient& client,
                                           UserDirectory& directory,
                                           Clock clock)
    : policy_(policy), client_(client), directory_(directory), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return SystemClock::now(); };
}

std::vector<RunResultRecord> ArchivalOrchestrator::run() {
    auto auth = client_.authenticate();
    if (!auth) throw RunAbortedError("Authentication", auth.error());

    auto channels = client_.list_channels();
    if (!channels) throw RunAbortedError("Channel listing", channels.error());

    // One reference time for the whole run keeps ages consistent across channels
    const auto now = clock_();

    std::vector<RunResultRecord> records;
    records.reserve(channels.value().size());
    for (const auto& channel : channels.value()) {
        records.push_back(process_channel(channel, now));
    }
    return records;
}

RunResultRecord ArchivalOrchestrator::process_channel(const Channel& channel, SystemClock::time_point now) {
    RunResultRecord record;
    record.channel_id = channel.id;
    record.channel_name = channel.name;

    ChannelEvidence evidence;
    evidence.archived = channel.is_archived;

    if (channel.is_archived) {
        record.verdict = classify(evidence, policy_);
        return record;
    }

    // 1. Members -> domains
    auto members = client_.list_members(channel.id);
    if (!members) {
        record.verdict.kind = VerdictKind::Keep;
        record.verdict.reason = "data unavailable: " + members.error().describe();
        return record;
    }
    for (const auto& user_id : members.value()) {
        if (auto domain = directory_.resolve_domain(user_id)) {
            evidence.member_domains.insert(*domain);
        }
    }

    // 2. Activity, only needed when the inactivity rule is on
    if (policy_.inactivity_threshold()) {
        evidence.activity_age = activity_age(channel, now);
    }

    // 3. Decide
    record.verdict = classify(evidence, policy_);
    if (!record.verdict.is_archive()) return record;

    // 4. Act
    if (!policy_.live()) {
        record.action = ActionTaken::Simulated;
        return record;
    }

    auto archived = client_.archive_channel(channel.id);
    if (archived) {
        record.action = ActionTaken::Archived;
    } else {
        record.action = ActionTaken::Failed;
        record.error = archived.error().describe();
    }
    return record;
}

std::optional<std::chrono::seconds> ArchivalOrchestrator::activity_age(const Channel& channel,
                                                                       SystemClock::time_point now) {
    auto history = client_.recent_messages(channel.id);
    if (!history) return std::nullopt;

    for (const auto& message : history.value()) {
        if (!message.posted_at) continue;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *message.posted_at);
        return age.count() < 0 ? std::chrono::seconds(0) : age;
    }
    return std::nullopt;
}

} // namespace slack_cleaner
