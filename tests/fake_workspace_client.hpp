#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "workspace/WorkspaceClient.hpp"

namespace slack_cleaner::fakes {

// In-memory workspace with call counters and per-call failure injection.
class FakeWorkspaceClient : public IWorkspaceClient {
public:
    std::vector<Channel> channels;
    std::map<std::string, std::vector<std::string>> members;   // channel -> user ids
    std::map<std::string, std::vector<Message>> history;       // channel -> newest first
    std::map<std::string, User> users;

    std::optional<RemoteError> auth_error;
    std::optional<RemoteError> list_error;
    std::map<std::string, RemoteError> member_errors;
    std::map<std::string, RemoteError> history_errors;
    std::map<std::string, RemoteError> archive_errors;
    std::map<std::string, int> user_transport_failures;  // user -> failures left before success

    std::vector<std::string> archived;          // order of archive calls
    std::vector<std::string> history_calls;
    std::vector<std::string> member_calls;
    std::map<std::string, int> user_calls;

    ApiResult<AuthIdentity> authenticate() override {
        if (auth_error) return *auth_error;
        return AuthIdentity{"Acme", "T1", "cleaner", "U0", "https://acme.slack.com/"};
    }

    ApiResult<std::vector<Channel>> list_channels() override {
        if (list_error) return *list_error;
        return channels;
    }

    ApiResult<std::vector<std::string>> list_members(const std::string& channel_id) override {
        member_calls.push_back(channel_id);
        auto err = member_errors.find(channel_id);
        if (err != member_errors.end()) return err->second;
        return members[channel_id];
    }

    ApiResult<std::vector<Message>> recent_messages(const std::string& channel_id) override {
        history_calls.push_back(channel_id);
        auto err = history_errors.find(channel_id);
        if (err != history_errors.end()) return err->second;
        return history[channel_id];
    }

    ApiResult<User> get_user(const std::string& user_id) override {
        ++user_calls[user_id];
        auto flaky = user_transport_failures.find(user_id);
        if (flaky != user_transport_failures.end() && flaky->second > 0) {
            --flaky->second;
            return RemoteError{ErrorCategory::Transport, "", 0, "users.info: connection reset"};
        }
        auto it = users.find(user_id);
        if (it == users.end()) {
            return RemoteError{ErrorCategory::NotFound, "user_not_found", 200, "users.info failed"};
        }
        return it->second;
    }

    ApiStatus archive_channel(const std::string& channel_id) override {
        auto err = archive_errors.find(channel_id);
        if (err != archive_errors.end()) return err->second;
        archived.push_back(channel_id);
        return std::monostate{};
    }

    // --- builders ---

    void add_user(const std::string& id, const std::string& email) {
        User u;
        u.id = id;
        u.email = email;
        users[id] = u;
    }

    void add_channel(const std::string& id, const std::string& name,
                     std::vector<std::string> member_ids, bool is_archived = false) {
        Channel c;
        c.id = id;
        c.name = name;
        c.is_archived = is_archived;
        c.num_members = static_cast<int>(member_ids.size());
        channels.push_back(c);
        members[id] = std::move(member_ids);
    }

    void add_message(const std::string& channel_id, SystemClock::time_point at) {
        Message m;
        m.posted_at = at;
        m.user = "U1";
        history[channel_id].push_back(m);
    }
};

} // namespace slack_cleaner::fakes
