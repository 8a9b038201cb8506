#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>

#include "app_config.hpp"
#include "archival_orchestrator.hpp"
#include "CredentialStore.hpp"
#include "policy_config.hpp"
#include "report/ReportSink.hpp"
#include "user_directory.hpp"
#include "workspace/SlackClient.hpp"

using namespace slack_cleaner;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRunFailed = 2;
constexpr int kExitReportFailed = 3;

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

void log_banner(const PolicyConfig& policy, TokenSource source) {
    if (source == TokenSource::DotEnv) {
        spdlog::info("Using SLACK_API_TOKEN from .env file");
    } else if (source == TokenSource::Environment) {
        spdlog::info("Using SLACK_API_TOKEN from environment");
    }

    if (policy.inactivity_days()) {
        spdlog::info("Archiving channels with no messages in the last {} days", *policy.inactivity_days());
    }
    if (!policy.target_domains().empty()) {
        std::vector<std::string> domains(policy.target_domains().begin(), policy.target_domains().end());
        spdlog::info("Checking for channels with users from [{}]", join(domains));
    }
    if (!policy.inactivity_days() && policy.target_domains().empty()) {
        spdlog::warn("⚠️ Neither --days nor --email-domains given; no channel can be archived");
    }

    if (policy.live()) {
        spdlog::warn("🔥 Running in live mode");
    } else {
        spdlog::info("DRY RUN: Use --live to run in live mode");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    const std::string program = argc > 0 ? argv[0] : "slack-cleaner";

    // 1. Command line + optional config file
    CliOptions cli;
    AppConfig config;
    try {
        cli = parse_cli(argc, argv);
        if (cli.show_help) {
            std::cout << usage_text(program);
            return kExitOk;
        }
        if (cli.config_path) config = load_config_file(*cli.config_path);
        apply_cli_overrides(config, cli);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << usage_text(program);
        return kExitUsage;
    } catch (const ConfigError& e) {
        spdlog::error("❌ {}", e.what());
        return kExitUsage;
    }

    if (config.verbose) spdlog::set_level(spdlog::level::debug);

    // 2. Credentials
    std::unique_ptr<CredentialStore> credentials = cli.env_file
        ? std::make_unique<CredentialStore>(std::vector<std::string>{*cli.env_file})
        : std::make_unique<CredentialStore>();

    auto token = credentials->resolve_token(cli.api_token);
    if (!token) {
        std::cerr << "No Slack API token given and SLACK_API_TOKEN is not set.\n\n" << usage_text(program);
        return kExitUsage;
    }

    // 3. Policy
    std::unique_ptr<PolicyConfig> policy;
    try {
        policy = std::make_unique<PolicyConfig>(
            PolicyConfig::create(config.email_domains, config.days, config.live));
    } catch (const std::invalid_argument& e) {
        spdlog::error("❌ Invalid policy: {}", e.what());
        return kExitUsage;
    }

    log_banner(*policy, token->source);

    // 4. Run
    SlackClient client(make_client_options(config, token->token));
    UserDirectory directory(client);
    ArchivalOrchestrator orchestrator(*policy, client, directory);

    std::vector<RunResultRecord> records;
    try {
        records = orchestrator.run();
    } catch (const RunAbortedError& e) {
        spdlog::critical("💥 {}", e.what());
        return kExitRunFailed;
    }

    auto stats = directory.stats();
    spdlog::debug("User lookups: {} ({} cached, {} unresolved), rate limit hits: {}",
                  stats.lookups, stats.cache_hits, stats.unknown, client.rate_limit_hits());

    // 5. Reports
    ConsoleReport console(std::cout, policy->live());
    console.write(records);

    if (config.csv_path) {
        try {
            CsvReport csv(*config.csv_path);
            csv.write(records);
        } catch (const std::runtime_error& e) {
            spdlog::error("❌ {}", e.what());
            return kExitReportFailed;
        }
    }

    auto summary = summarize(records);
    if (summary.failed > 0) {
        spdlog::warn("⚠️ {} channel(s) could not be archived", summary.failed);
    }
    return kExitOk;
}
