#include "workspace/SlackClient.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <thread>

namespace slack_cleaner {

using json = nlohmann::json;

namespace {

constexpr std::chrono::seconds kDefaultRetryAfter{1};

RemoteError malformed(const std::string& method, const std::string& what) {
    return RemoteError{ErrorCategory::Malformed, "", 200, method + ": " + what};
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

bool bool_field(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

// Out-of-range or non-numeric values read as 0.
std::int64_t int_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return 0;
    if (it->is_number_unsigned()) {
        auto v = it->get<std::uint64_t>();
        return v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
            ? 0 : static_cast<std::int64_t>(v);
    }
    if (it->is_number_integer()) return it->get<std::int64_t>();
    if (it->is_number_float()) {
        double v = it->get<double>();
        // 2^63 is exactly representable; anything at or past it overflows
        constexpr double kLimit = 9223372036854775808.0;
        if (!std::isfinite(v) || v >= kLimit || v < -kLimit) return 0;
        return static_cast<std::int64_t>(v);
    }
    return 0;
}

int clamp_to_int(std::int64_t v) {
    if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(v);
}

std::chrono::seconds retry_after(const cpr::Response& r) {
    auto it = r.header.find("Retry-After");
    if (it == r.header.end()) return kDefaultRetryAfter;
    try {
        long value = std::stol(it->second);
        return value > 0 ? std::chrono::seconds(value) : kDefaultRetryAfter;
    } catch (const std::exception&) {
        return kDefaultRetryAfter;
    }
}

// Runs request_factory until it returns something other than 429 or the
// retry budget is spent. The final response is returned either way.
template<typename Func, typename OnRateLimit>
cpr::Response perform_request_with_backoff(Func request_factory, int max_retries, OnRateLimit on_rate_limit) {
    cpr::Response r;
    for (int attempt = 0; ; ++attempt) {
        r = request_factory();
        if (r.status_code != 429) return r;
        if (attempt >= max_retries) break;
        on_rate_limit(retry_after(r), attempt + 1);
    }
    return r;
}

ApiResult<json> interpret(const std::string& method, const cpr::Response& r) {
    if (r.error.code != cpr::ErrorCode::OK) {
        return RemoteError{ErrorCategory::Transport, "", 0, method + ": " + r.error.message};
    }
    if (r.status_code == 429) {
        return RemoteError{ErrorCategory::RateLimited, "ratelimited", 429,
                           method + ": rate limit retries exhausted"};
    }
    if (r.status_code != 200) {
        return RemoteError{ErrorCategory::Http, "", r.status_code, method + ": unexpected HTTP status"};
    }

    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return malformed(method, "response is not a JSON object");
    }

    if (!bool_field(body, "ok")) {
        std::string code = string_field(body, "error");
        if (code.empty()) code = "unknown_error";
        return RemoteError{categorize_slack_error(code), code, r.status_code, method + " failed"};
    }
    return body;
}

std::optional<Channel> parse_channel(const json& j) {
    if (!j.is_object()) return std::nullopt;
    Channel c;
    c.id = string_field(j, "id");
    c.name = string_field(j, "name");
    if (c.id.empty() || c.name.empty()) return std::nullopt;
    c.created = int_field(j, "created");
    c.is_archived = bool_field(j, "is_archived");
    c.is_private = bool_field(j, "is_private");
    c.num_members = clamp_to_int(int_field(j, "num_members"));
    return c;
}

Message parse_message(const json& j) {
    Message m;
    m.posted_at = parse_slack_ts(string_field(j, "ts"));
    m.user = string_field(j, "user");
    m.subtype = string_field(j, "subtype");
    return m;
}

} // namespace

SlackClient::SlackClient(SlackClientOptions options, Sleeper sleeper)
    : options_(std::move(options)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    }
    if (!options_.base_url.empty() && options_.base_url.back() != '/') {
        options_.base_url += '/';
    }
}

std::string SlackClient::endpoint(const std::string& method) const {
    return options_.base_url + method;
}

ApiResult<json> SlackClient::get(const std::string& method, const Params& params) {
    cpr::Parameters parameters;
    for (const auto& [key, value] : params) {
        parameters.Add(cpr::Parameter{key, value});
    }

    spdlog::debug("GET {}", method);
    auto r = perform_request_with_backoff(
        [&]() {
            return cpr::Get(cpr::Url{endpoint(method)},
                            cpr::Header{{"Authorization", "Bearer " + options_.token}},
                            parameters,
                            cpr::Timeout{options_.timeout});
        },
        options_.max_rate_limit_retries,
        [&](std::chrono::seconds wait, int attempt) {
            ++rate_limit_hits_;
            spdlog::warn("⏳ Rate limited on {}. Retrying after {} seconds (attempt {}/{})",
                         method, wait.count(), attempt, options_.max_rate_limit_retries);
            sleeper_(wait);
        });

    return interpret(method, r);
}

ApiResult<json> SlackClient::post(const std::string& method, const json& body) {
    const std::string payload = body.dump();

    spdlog::debug("POST {}", method);
    auto r = perform_request_with_backoff(
        [&]() {
            return cpr::Post(cpr::Url{endpoint(method)},
                             cpr::Header{{"Authorization", "Bearer " + options_.token},
                                         {"Content-Type", "application/json; charset=utf-8"}},
                             cpr::Body{payload},
                             cpr::Timeout{options_.timeout});
        },
        options_.max_rate_limit_retries,
        [&](std::chrono::seconds wait, int attempt) {
            ++rate_limit_hits_;
            spdlog::warn("⏳ Rate limited on {}. Retrying after {} seconds (attempt {}/{})",
                         method, wait.count(), attempt, options_.max_rate_limit_retries);
            sleeper_(wait);
        });

    return interpret(method, r);
}

ApiResult<std::vector<json>> SlackClient::paginate(const std::string& method,
                                                   Params params,
                                                   const std::string& collection_key) {
    std::vector<json> items;
    std::string cursor;
    params["limit"] = std::to_string(options_.page_size);

    while (true) {
        if (cursor.empty()) {
            params.erase("cursor");
        } else {
            params["cursor"] = cursor;
        }

        auto page = get(method, params);
        if (!page) return page.error();

        const json& body = page.value();
        auto it = body.find(collection_key);
        if (it == body.end() || !it->is_array()) {
            return malformed(method, "missing '" + collection_key + "' array");
        }
        for (const auto& item : *it) {
            items.push_back(item);
        }

        std::string next;
        auto meta = body.find("response_metadata");
        if (meta != body.end() && meta->is_object()) {
            next = string_field(*meta, "next_cursor");
        }
        if (next.empty()) break;
        if (next == cursor) {
            return malformed(method, "pagination cursor did not advance");
        }
        cursor = next;
    }

    spdlog::debug("{} returned {} {}", method, items.size(), collection_key);
    return items;
}

ApiResult<AuthIdentity> SlackClient::authenticate() {
    auto r = get("auth.test", {});
    if (!r) return r.error();

    const json& body = r.value();
    AuthIdentity identity;
    identity.team = string_field(body, "team");
    identity.team_id = string_field(body, "team_id");
    identity.user = string_field(body, "user");
    identity.user_id = string_field(body, "user_id");
    identity.url = string_field(body, "url");
    return identity;
}

ApiResult<std::vector<Channel>> SlackClient::list_channels() {
    Params params = {
        {"types", options_.channel_types},
        {"exclude_archived", options_.exclude_archived ? "true" : "false"}
    };

    auto raw = paginate("conversations.list", params, "channels");
    if (!raw) return raw.error();

    std::vector<Channel> channels;
    channels.reserve(raw.value().size());
    for (const auto& j : raw.value()) {
        auto channel = parse_channel(j);
        if (!channel) {
            return malformed("conversations.list", "channel entry without id or name");
        }
        channels.push_back(std::move(*channel));
    }
    return channels;
}

ApiResult<std::vector<std::string>> SlackClient::list_members(const std::string& channel_id) {
    auto raw = paginate("conversations.members", {{"channel", channel_id}}, "members");
    if (!raw) return raw.error();

    std::vector<std::string> members;
    members.reserve(raw.value().size());
    for (const auto& j : raw.value()) {
        if (!j.is_string()) {
            return malformed("conversations.members", "member id is not a string");
        }
        members.push_back(j.get<std::string>());
    }
    return members;
}

ApiResult<std::vector<Message>> SlackClient::recent_messages(const std::string& channel_id) {
    auto r = get("conversations.history", {
        {"channel", channel_id},
        {"limit", std::to_string(options_.history_limit)}
    });
    if (!r) return r.error();

    const json& body = r.value();
    auto it = body.find("messages");
    if (it == body.end() || !it->is_array()) {
        return malformed("conversations.history", "missing 'messages' array");
    }

    std::vector<Message> messages;
    for (const auto& j : *it) {
        if (j.is_object()) messages.push_back(parse_message(j));
    }
    return messages;
}

ApiResult<User> SlackClient::get_user(const std::string& user_id) {
    auto r = get("users.info", {{"user", user_id}});
    if (!r) return r.error();

    auto it = r.value().find("user");
    if (it == r.value().end() || !it->is_object()) {
        return malformed("users.info", "missing 'user' object");
    }

    User user;
    user.id = string_field(*it, "id");
    if (user.id.empty()) user.id = user_id;
    user.is_bot = bool_field(*it, "is_bot");
    user.deleted = bool_field(*it, "deleted");

    auto profile = it->find("profile");
    if (profile != it->end() && profile->is_object()) {
        std::string email = string_field(*profile, "email");
        if (!email.empty()) user.email = email;
    }
    return user;
}

ApiStatus SlackClient::archive_channel(const std::string& channel_id) {
    auto r = post("conversations.archive", json{{"channel", channel_id}});
    if (!r) return r.error();
    return std::monostate{};
}

} // namespace slack_cleaner
