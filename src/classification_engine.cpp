#include "classification_engine.hpp"
#include <algorithm>
#include <cctype>

namespace slack_cleaner {

namespace {

std::string join_domains(const std::set<std::string>& domains) {
    std::string out;
    for (const auto& d : domains) {
        if (!out.empty()) out += ", ";
        out += d;
    }
    return out;
}

std::string days_text(long long days) {
    return std::to_string(days) + (days == 1 ? " day" : " days");
}

} // namespace

long long whole_days(std::chrono::seconds age) {
    if (age.count() < 0) return 0;
    return std::chrono::duration_cast<std::chrono::hours>(age).count() / 24;
}

std::optional<std::string> domain_of(const std::string& email) {
    auto at = email.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 >= email.size()) return std::nullopt;

    std::string domain = email.substr(at + 1);
    for (char c : domain) {
        if (std::isspace(static_cast<unsigned char>(c))) return std::nullopt;
    }
    std::transform(domain.begin(), domain.end(), domain.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return domain;
}

Verdict classify(const ChannelEvidence& evidence, const PolicyConfig& policy) {
    Verdict verdict;
    verdict.activity_age = evidence.activity_age;

    // 1. Archived channels are left alone
    if (evidence.archived) {
        verdict.kind = VerdictKind::Keep;
        verdict.reason = "already archived";
        return verdict;
    }

    // 2. Domain rule. An empty membership never matches.
    const auto& targets = policy.target_domains();
    if (!evidence.member_domains.empty() &&
        std::includes(targets.begin(), targets.end(),
                      evidence.member_domains.begin(), evidence.member_domains.end())) {
        verdict.kind = VerdictKind::ArchiveByDomain;
        verdict.matched_domains = evidence.member_domains;
        verdict.reason = "all members match domains: " + join_domains(evidence.member_domains);
        return verdict;
    }

    // 3. Inactivity rule, only with a known age
    const auto& threshold = policy.inactivity_threshold();
    if (!threshold) {
        verdict.kind = VerdictKind::Keep;
        verdict.reason = "no archival rule matched";
        return verdict;
    }

    if (!evidence.activity_age) {
        verdict.kind = VerdictKind::Keep;
        verdict.reason = "activity unknown";
        return verdict;
    }

    const long long age_days = whole_days(*evidence.activity_age);
    const std::string threshold_text = days_text(*policy.inactivity_days());

    if (*evidence.activity_age > *threshold) {
        verdict.kind = VerdictKind::ArchiveByInactivity;
        verdict.reason = "no activity for " + days_text(age_days) + " (threshold " + threshold_text + ")";
        return verdict;
    }

    // 4. Nothing applies
    verdict.kind = VerdictKind::Keep;
    verdict.reason = "last activity " + days_text(age_days) + " ago (threshold " + threshold_text + ")";
    return verdict;
}

} // namespace slack_cleaner
