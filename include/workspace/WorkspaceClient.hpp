#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "cleaner_types.hpp"

namespace slack_cleaner {

enum class ErrorCategory {
    Auth,
    Permission,
    NotFound,
    Conflict,
    RateLimited,  // only after backoff retries are exhausted
    Transport,
    Http,
    Malformed,
    Other
};

const char* to_string(ErrorCategory category);

// Maps a Slack "error" string (e.g. "not_in_channel") to a category.
ErrorCategory categorize_slack_error(const std::string& code);

struct RemoteError {
    ErrorCategory category = ErrorCategory::Other;
    std::string code;      // Slack error string when the API supplied one
    long http_status = 0;
    std::string message;

    std::string describe() const;
};

// Either a value or the RemoteError that prevented it.
template<typename T>
class ApiResult {
public:
    ApiResult(T value) : value_(std::move(value)) {}
    ApiResult(RemoteError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) throw std::logic_error("ApiResult::value() on failed result: " + error_->describe());
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("ApiResult::value() on failed result: " + error_->describe());
        return *value_;
    }

    const RemoteError& error() const {
        if (!error_) throw std::logic_error("ApiResult::error() on successful result");
        return *error_;
    }

private:
    std::optional<T> value_;
    std::optional<RemoteError> error_;
};

using ApiStatus = ApiResult<std::monostate>;

/**
 * The remote workspace as the cleaner sees it.
 *
 * Listing calls return the complete, cursor-followed sequence in source
 * order. Rate limiting is handled inside the implementation; everything
 * else comes back as a RemoteError and is never retried.
 */
class IWorkspaceClient {
public:
    virtual ~IWorkspaceClient() = default;

    virtual ApiResult<AuthIdentity> authenticate() = 0;
    virtual ApiResult<std::vector<Channel>> list_channels() = 0;
    virtual ApiResult<std::vector<std::string>> list_members(const std::string& channel_id) = 0;

    // One bounded page, most recent first.
    virtual ApiResult<std::vector<Message>> recent_messages(const std::string& channel_id) = 0;

    virtual ApiResult<User> get_user(const std::string& user_id) = 0;
    virtual ApiStatus archive_channel(const std::string& channel_id) = 0;
};

} // namespace slack_cleaner
