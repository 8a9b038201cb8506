#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace slack_cleaner {

// Lower-cases a domain and strips one leading '@'.
// Throws std::invalid_argument for empty input, wildcards, whitespace or an inner '@'.
std::string normalize_domain(const std::string& raw);

/**
 * Immutable per-run policy. Build it with create(); every validation
 * failure is raised there so classify() never sees malformed input.
 */
class PolicyConfig {
public:
    static PolicyConfig create(const std::vector<std::string>& email_domains,
                               std::optional<int> inactivity_days,
                               bool live);

    const std::set<std::string>& target_domains() const { return target_domains_; }

    // nullopt disables the inactivity rule
    const std::optional<std::chrono::seconds>& inactivity_threshold() const { return inactivity_threshold_; }

    std::optional<int> inactivity_days() const { return inactivity_days_; }

    bool live() const { return live_; }

private:
    PolicyConfig(std::set<std::string> domains, std::optional<int> days, bool live);

    std::set<std::string> target_domains_;
    std::optional<int> inactivity_days_;
    std::optional<std::chrono::seconds> inactivity_threshold_;
    bool live_ = false;
};

} // namespace slack_cleaner
