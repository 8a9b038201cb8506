#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include "memo_cache.hpp"
#include "workspace/WorkspaceClient.hpp"

namespace slack_cleaner {

struct DirectoryStats {
    size_t lookups = 0;
    size_t cache_hits = 0;
    size_t unknown = 0;
};

/**
 * Per-run memo of user id -> email domain.
 *
 * Bots, deleted users, users without an email and failed lookups all
 * resolve to nullopt. Only definitive answers are cached: a user that does
 * not exist is cached as unknown, but a transport, HTTP or rate-limit
 * failure is not, so the next channel asks again.
 *
 * Safe to share between threads. Resolution of a missing id is serialized,
 * so each id is fetched at most once while its answer stays cached.
 */
class UserDirectory {
public:
    explicit UserDirectory(IWorkspaceClient& client, size_t capacity = 100000);

    std::optional<std::string> resolve_domain(const std::string& user_id);

    DirectoryStats stats() const;

private:
    struct Entry {
        std::optional<std::string> domain;
    };

    struct Lookup {
        Entry entry;
        bool cacheable = true;
    };

    IWorkspaceClient& client_;
    LRUCache<std::string, Entry> cache_;
    std::mutex resolve_mutex_;
    std::atomic<size_t> unknown_{0};

    Lookup fetch_domain(const std::string& user_id);
};

} // namespace slack_cleaner
