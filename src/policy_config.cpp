#include "policy_config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace slack_cleaner {

namespace {
constexpr int kSecondsPerDay = 24 * 60 * 60;
constexpr int kMaxInactivityDays = 365 * 100;
}

std::string normalize_domain(const std::string& raw) {
    std::string domain = raw;
    if (!domain.empty() && domain.front() == '@') domain.erase(0, 1);

    if (domain.empty()) {
        throw std::invalid_argument("Email domain must not be empty");
    }

    for (char c : domain) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '*' || c == '?') {
            throw std::invalid_argument("Wildcards are not allowed in email domains: " + raw);
        }
        if (std::isspace(uc) || c == '@') {
            throw std::invalid_argument("Invalid email domain: " + raw);
        }
    }

    std::transform(domain.begin(), domain.end(), domain.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return domain;
}

PolicyConfig::PolicyConfig(std::set<std::string> domains, std::optional<int> days, bool live)
    : target_domains_(std::move(domains)), inactivity_days_(days), live_(live) {
    if (inactivity_days_) {
        inactivity_threshold_ = std::chrono::seconds(
            static_cast<long long>(*inactivity_days_) * kSecondsPerDay);
    }
}

PolicyConfig PolicyConfig::create(const std::vector<std::string>& email_domains,
                                  std::optional<int> inactivity_days,
                                  bool live) {
    if (inactivity_days) {
        if (*inactivity_days < 0) {
            throw std::invalid_argument("Inactivity threshold must not be negative (got " +
                                        std::to_string(*inactivity_days) + " days)");
        }
        if (*inactivity_days > kMaxInactivityDays) {
            throw std::invalid_argument("Inactivity threshold is unreasonably large: " +
                                        std::to_string(*inactivity_days) + " days");
        }
    }

    std::set<std::string> domains;
    for (const auto& raw : email_domains) {
        domains.insert(normalize_domain(raw));
    }

    return PolicyConfig(std::move(domains), inactivity_days, live);
}

} // namespace slack_cleaner
