#include "user_directory.hpp"
#include <spdlog/spdlog.h>
#include "classification_engine.hpp"

namespace slack_cleaner {

namespace {

// A missing user will still be missing on the next channel; anything else
// may succeed on retry.
bool is_definitive(const RemoteError& error) {
    return error.category == ErrorCategory::NotFound;
}

} // namespace

UserDirectory::UserDirectory(IWorkspaceClient& client, size_t capacity)
    : client_(client), cache_(capacity) {}

std::optional<std::string> UserDirectory::resolve_domain(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(resolve_mutex_);
    if (auto cached = cache_.get(user_id)) return cached->domain;

    Lookup lookup = fetch_domain(user_id);
    if (!lookup.entry.domain) ++unknown_;
    if (lookup.cacheable) cache_.set(user_id, lookup.entry);
    return lookup.entry.domain;
}

UserDirectory::Lookup UserDirectory::fetch_domain(const std::string& user_id) {
    auto user = client_.get_user(user_id);
    if (!user) {
        const RemoteError& error = user.error();
        if (is_definitive(error)) {
            spdlog::debug("User {} unresolved: {}", user_id, error.describe());
            return Lookup{Entry{std::nullopt}, true};
        }
        spdlog::warn("⚠️ Lookup of user {} failed, will retry on next use: {}", user_id, error.describe());
        return Lookup{Entry{std::nullopt}, false};
    }

    const User& u = user.value();
    if (u.is_bot || u.deleted || !u.email) {
        spdlog::debug("User {} skipped (bot={}, deleted={}, email={})",
                      user_id, u.is_bot, u.deleted, u.email.has_value());
        return Lookup{Entry{std::nullopt}, true};
    }
    return Lookup{Entry{domain_of(*u.email)}, true};
}

DirectoryStats UserDirectory::stats() const {
    DirectoryStats s;
    s.cache_hits = cache_.hits();
    s.lookups = cache_.hits() + cache_.misses();
    s.unknown = unknown_.load();
    return s;
}

} // namespace slack_cleaner
