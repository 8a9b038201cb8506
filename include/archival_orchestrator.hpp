#pragma once
#include <functional>
#include <stdexcept>
#include <vector>
#include "classification_engine.hpp"
#include "cleaner_types.hpp"
#include "policy_config.hpp"
#include "user_directory.hpp"
#include "workspace/WorkspaceClient.hpp"

namespace slack_cleaner {

// The run could not start: authentication or the channel listing failed.
class RunAbortedError : public std::runtime_error {
public:
    RunAbortedError(const std::string& stage, RemoteError error);

    const RemoteError& remote_error() const { return error_; }

private:
    RemoteError error_;
};

/**
 * Walks every channel once, in listing order, and turns each into a
 * RunResultRecord. Per-channel failures become records; only a failure to
 * authenticate or list channels throws (RunAbortedError).
 *
 * Archive calls are issued one at a time. Nothing is printed here; the
 * records are the only output.
 */
class ArchivalOrchestrator {
public:
    using Clock = std::function<SystemClock::time_point()>;

    ArchivalOrchestrator(const PolicyConfig& policy,
                         IWorkspaceClient& client,
                         UserDirectory& directory,
                         Clock clock = nullptr);

    std::vector<RunResultRecord> run();

private:
    const PolicyConfig& policy_;
    IWorkspaceClient& client_;
    UserDirectory& directory_;
    Clock clock_;

    RunResultRecord process_channel(const Channel& channel, SystemClock::time_point now);
    std::optional<std::chrono::seconds> activity_age(const Channel& channel, SystemClock::time_point now);
};

} // namespace slack_cleaner
