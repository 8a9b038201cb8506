#pragma once
#include <cstdlib>
#include <fstream>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace slack_cleaner {

enum class TokenSource {
    CommandLine,
    Environment,
    DotEnv
};

struct ResolvedToken {
    std::string token;
    TokenSource source;
};

/**
 * Resolves the Slack token: command line, then the process environment,
 * then a .env file. Values from .env never override the environment.
 */
class CredentialStore {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static constexpr const char* kTokenKey = "SLACK_API_TOKEN";

    explicit CredentialStore(std::vector<std::string> search_paths = {".env", "../.env"},
                             EnvLookup env = nullptr)
        : env_(env ? std::move(env) : process_env) {
        load_dotenv(search_paths);
    }

    // KEY=VALUE lines; '#' comments, "export " prefixes and quotes are handled.
    static std::map<std::string, std::string> parse_dotenv(std::istream& in) {
        std::map<std::string, std::string> values;
        std::string line;
        while (std::getline(in, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') continue;
            if (line.rfind("export ", 0) == 0) {
                line.erase(0, 7);
                trim(line);
            }

            auto eq = line.find('=');
            if (eq == std::string::npos) continue;

            std::string key = line.substr(0, eq);
            std::string value = line.substr(eq + 1);
            trim(key);
            trim(value);
            if (key.empty()) continue;

            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
                char quote = value.front();
                auto close = value.find(quote, 1);
                value = close == std::string::npos ? value.substr(1) : value.substr(1, close - 1);
            } else {
                auto hash = value.find(" #");
                if (hash != std::string::npos) {
                    value.erase(hash);
                    trim(value);
                }
            }
            values[key] = value;
        }
        return values;
    }

    std::optional<std::string> lookup(const std::string& key) const {
        if (auto v = env_(key); v && !v->empty()) return v;
        auto it = dotenv_values_.find(key);
        if (it != dotenv_values_.end() && !it->second.empty()) return it->second;
        return std::nullopt;
    }

    std::optional<ResolvedToken> resolve_token(const std::optional<std::string>& cli_token) const {
        if (cli_token && !cli_token->empty()) {
            return ResolvedToken{*cli_token, TokenSource::CommandLine};
        }
        if (auto v = env_(kTokenKey); v && !v->empty()) {
            return ResolvedToken{*v, TokenSource::Environment};
        }
        auto it = dotenv_values_.find(kTokenKey);
        if (it != dotenv_values_.end() && !it->second.empty()) {
            return ResolvedToken{it->second, TokenSource::DotEnv};
        }
        return std::nullopt;
    }

    const std::string& dotenv_path() const { return loaded_path_; }

private:
    EnvLookup env_;
    std::map<std::string, std::string> dotenv_values_;
    std::string loaded_path_;

    static std::optional<std::string> process_env(const std::string& key) {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    }

    static void trim(std::string& s) {
        const char* ws = " \t\r\n";
        s.erase(0, s.find_first_not_of(ws));
        auto last = s.find_last_not_of(ws);
        if (last == std::string::npos) {
            s.clear();
        } else {
            s.erase(last + 1);
        }
    }

    void load_dotenv(const std::vector<std::string>& search_paths) {
        for (const auto& path : search_paths) {
            std::ifstream f(path);
            if (!f.is_open()) continue;

            dotenv_values_ = parse_dotenv(f);
            loaded_path_ = path;
            spdlog::debug("Loaded {} entries from {}", dotenv_values_.size(), path);
            return;
        }
        spdlog::debug("No .env file found");
    }
};

} // namespace slack_cleaner
