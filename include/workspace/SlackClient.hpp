#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "workspace/WorkspaceClient.hpp"

namespace slack_cleaner {

struct SlackClientOptions {
    std::string token;
    std::string base_url = "https://slack.com/api/";
    std::string channel_types = "public_channel";
    bool exclude_archived = true;
    int page_size = 200;
    int history_limit = 1;
    int max_rate_limit_retries = 5;
    std::chrono::milliseconds timeout{30000};
};

// Slack Web API over cpr. Only HTTP 429 is retried, after Retry-After.
class SlackClient : public IWorkspaceClient {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;
    using Params = std::map<std::string, std::string>;

    explicit SlackClient(SlackClientOptions options, Sleeper sleeper = nullptr);

    ApiResult<AuthIdentity> authenticate() override;
    ApiResult<std::vector<Channel>> list_channels() override;
    ApiResult<std::vector<std::string>> list_members(const std::string& channel_id) override;
    ApiResult<std::vector<Message>> recent_messages(const std::string& channel_id) override;
    ApiResult<User> get_user(const std::string& user_id) override;
    ApiStatus archive_channel(const std::string& channel_id) override;

    // Number of 429 responses seen so far.
    int rate_limit_hits() const { return rate_limit_hits_; }

private:
    SlackClientOptions options_;
    Sleeper sleeper_;
    int rate_limit_hits_ = 0;

    std::string endpoint(const std::string& method) const;

    ApiResult<nlohmann::json> get(const std::string& method, const Params& params);
    ApiResult<nlohmann::json> post(const std::string& method, const nlohmann::json& body);

    // Calls method repeatedly, following response_metadata.next_cursor,
    // and concatenates the arrays found under collection_key.
    ApiResult<std::vector<nlohmann::json>> paginate(const std::string& method,
                                                    Params params,
                                                    const std::string& collection_key);
};

} // namespace slack_cleaner
