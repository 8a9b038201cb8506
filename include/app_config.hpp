#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workspace/SlackClient.hpp"

namespace slack_cleaner {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Only what was actually given on the command line; unset means "not passed".
struct CliOptions {
    std::optional<std::string> api_token;
    std::optional<std::vector<std::string>> email_domains;
    std::optional<int> days;
    bool live = false;
    std::optional<std::string> csv_path;
    std::optional<std::string> config_path;
    std::optional<std::string> env_file;
    bool include_private = false;
    bool verbose = false;
    bool show_help = false;
};

// Throws UsageError.
CliOptions parse_cli(int argc, const char* const argv[]);
std::string usage_text(const std::string& program);

struct AppConfig {
    std::vector<std::string> email_domains;
    std::optional<int> days;
    bool live = false;
    std::optional<std::string> csv_path;
    bool include_private = false;
    bool verbose = false;

    std::string api_base_url = "https://slack.com/api/";
    int history_limit = 1;
    int page_size = 200;
    int max_rate_limit_retries = 5;
    int timeout_ms = 30000;
};

// Throws ConfigError on unreadable files, bad JSON, wrong types or out-of-range values.
AppConfig load_config_file(const std::string& path);
AppConfig parse_config_json(const nlohmann::json& j);

// Flags given on the command line win over the config file.
void apply_cli_overrides(AppConfig& config, const CliOptions& cli);

SlackClientOptions make_client_options(const AppConfig& config, const std::string& token);

} // namespace slack_cleaner
