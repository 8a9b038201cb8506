#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include "cleaner_types.hpp"
#include "policy_config.hpp"

namespace slack_cleaner {

// Everything classify() needs, already resolved. Building this is the
// orchestrator's job; classify() itself never touches the network.
struct ChannelEvidence {
    bool archived = false;
    std::optional<std::chrono::seconds> activity_age; // nullopt = unknown
    std::set<std::string> member_domains;             // unresolved members are left out
};

// Precedence: already archived > domain match > inactivity > keep.
Verdict classify(const ChannelEvidence& evidence, const PolicyConfig& policy);

// "Alice@Acme.COM" -> "acme.com"; nullopt when there is no usable domain.
std::optional<std::string> domain_of(const std::string& email);

// Whole days, rounded down.
long long whole_days(std::chrono::seconds age);

} // namespace slack_cleaner
