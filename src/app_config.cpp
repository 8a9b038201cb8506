#include "app_config.hpp"
#include <fstream>

namespace slack_cleaner {

using json = nlohmann::json;

namespace {

// Any "-x" or "--xyz" word ends a value list; a lone "-" does not.
bool is_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

int parse_int(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw UsageError(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

template<typename T>
T required_type(const json& j, const char* key, const char* type_name) {
    try {
        return j.at(key).get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("Config key '") + key + "' must be " + type_name);
    }
}

int bounded_int(const json& j, const char* key, int lo, int hi) {
    int v = required_type<int>(j, key, "an integer");
    if (v < lo || v > hi) {
        throw ConfigError(std::string("Config key '") + key + "' must be between " +
                          std::to_string(lo) + " and " + std::to_string(hi));
    }
    return v;
}

} // namespace

std::string usage_text(const std::string& program) {
    return "Usage: " + program + " [api_token] [options]\n"
        "\n"
        "Archive inactive or orphaned Slack channels.\n"
        "\n"
        "  api_token                 Slack API token (optional if SLACK_API_TOKEN is set in env or .env)\n"
        "  --email-domains D [D...]  Archive channels whose members all have these email domains\n"
        "  --days N                  Archive channels with no messages in the last N days\n"
        "  --live                    Run in live mode (default is a dry run)\n"
        "  --csv PATH                Also write the results to a CSV file\n"
        "  --config PATH             Read settings from a JSON config file\n"
        "  --env-file PATH           Read SLACK_API_TOKEN from this .env file\n"
        "  --include-private         Include private channels\n"
        "  --verbose                 Debug logging\n"
        "  -h, --help                Show this help\n";
}

CliOptions parse_cli(int argc, const char* const argv[]) {
    CliOptions opts;

    auto need_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw UsageError("Missing value for " + flag);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--email-domains") {
            std::vector<std::string> domains;
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                domains.push_back(argv[++i]);
            }
            if (domains.empty()) throw UsageError("--email-domains expects at least one domain");
            opts.email_domains = std::move(domains);
        } else if (arg == "--days") {
            opts.days = parse_int(arg, need_value(i, arg));
        } else if (arg == "--live") {
            opts.live = true;
        } else if (arg == "--csv") {
            opts.csv_path = need_value(i, arg);
        } else if (arg == "--config") {
            opts.config_path = need_value(i, arg);
        } else if (arg == "--env-file") {
            opts.env_file = need_value(i, arg);
        } else if (arg == "--include-private") {
            opts.include_private = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (!opts.api_token) {
            opts.api_token = arg;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }
    return opts;
}

AppConfig parse_config_json(const json& j) {
    if (!j.is_object()) throw ConfigError("Config file must contain a JSON object");

    AppConfig config;
    if (j.contains("email_domains")) {
        config.email_domains = required_type<std::vector<std::string>>(j, "email_domains", "a list of strings");
    }
    if (j.contains("days") && !j.at("days").is_null()) {
        config.days = required_type<int>(j, "days", "an integer");
    }
    if (j.contains("live")) config.live = required_type<bool>(j, "live", "a boolean");
    if (j.contains("csv") && !j.at("csv").is_null()) {
        config.csv_path = required_type<std::string>(j, "csv", "a string");
    }
    if (j.contains("include_private")) {
        config.include_private = required_type<bool>(j, "include_private", "a boolean");
    }
    if (j.contains("verbose")) config.verbose = required_type<bool>(j, "verbose", "a boolean");
    if (j.contains("api_base_url")) {
        config.api_base_url = required_type<std::string>(j, "api_base_url", "a string");
        if (config.api_base_url.empty()) throw ConfigError("Config key 'api_base_url' must not be empty");
    }

    // Slack caps page sizes at 1000
    if (j.contains("history_limit")) config.history_limit = bounded_int(j, "history_limit", 1, 1000);
    if (j.contains("page_size")) config.page_size = bounded_int(j, "page_size", 1, 1000);
    if (j.contains("max_rate_limit_retries")) {
        config.max_rate_limit_retries = bounded_int(j, "max_rate_limit_retries", 0, 100);
    }
    if (j.contains("timeout_ms")) config.timeout_ms = bounded_int(j, "timeout_ms", 1, 600000);
    return config;
}

AppConfig load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("Cannot open config file: " + path);

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) throw ConfigError("Config file is not valid JSON: " + path);
    return parse_config_json(j);
}

void apply_cli_overrides(AppConfig& config, const CliOptions& cli) {
    if (cli.email_domains) config.email_domains = *cli.email_domains;
    if (cli.days) config.days = cli.days;
    if (cli.live) config.live = true;
    if (cli.csv_path) config.csv_path = cli.csv_path;
    if (cli.include_private) config.include_private = true;
    if (cli.verbose) config.verbose = true;
}

SlackClientOptions make_client_options(const AppConfig& config, const std::string& token) {
    SlackClientOptions options;
    options.token = token;
    options.base_url = config.api_base_url;
    options.channel_types = config.include_private ? "public_channel,private_channel" : "public_channel";
    options.exclude_archived = true;
    options.page_size = config.page_size;
    options.history_limit = config.history_limit;
    options.max_rate_limit_retries = config.max_rate_limit_retries;
    options.timeout = std::chrono::milliseconds(config.timeout_ms);
    return options;
}

} // namespace slack_cleaner
