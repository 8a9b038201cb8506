#include "workspace/WorkspaceClient.hpp"
#include <unordered_map>

namespace slack_cleaner {

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Auth: return "auth";
        case ErrorCategory::Permission: return "permission";
        case ErrorCategory::NotFound: return "not_found";
        case ErrorCategory::Conflict: return "conflict";
        case ErrorCategory::RateLimited: return "rate_limited";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Http: return "http";
        case ErrorCategory::Malformed: return "malformed";
        case ErrorCategory::Other: return "other";
    }
    return "other";
}

ErrorCategory categorize_slack_error(const std::string& code) {
    static const std::unordered_map<std::string, ErrorCategory> known = {
        {"invalid_auth", ErrorCategory::Auth},
        {"not_authed", ErrorCategory::Auth},
        {"token_revoked", ErrorCategory::Auth},
        {"token_expired", ErrorCategory::Auth},
        {"account_inactive", ErrorCategory::Auth},
        {"missing_scope", ErrorCategory::Permission},
        {"not_in_channel", ErrorCategory::Permission},
        {"restricted_action", ErrorCategory::Permission},
        {"cant_archive_general", ErrorCategory::Permission},
        {"method_not_supported_for_channel_type", ErrorCategory::Permission},
        {"channel_not_found", ErrorCategory::NotFound},
        {"user_not_found", ErrorCategory::NotFound},
        {"already_archived", ErrorCategory::Conflict},
        {"ratelimited", ErrorCategory::RateLimited},
    };

    auto it = known.find(code);
    return it != known.end() ? it->second : ErrorCategory::Other;
}

std::string RemoteError::describe() const {
    std::string out = to_string(category);
    if (!code.empty()) out += " (" + code + ")";
    if (http_status != 0 && http_status != 200) out += " HTTP " + std::to_string(http_status);
    if (!message.empty()) out += ": " + message;
    return out;
}

} // namespace slack_cleaner
