#pragma once

#include "IPrompter.hpp"
#include "IRemoteProcessDirectory.hpp"
#include "RemoteConfig.hpp"
#include "ShellStepExecutor.hpp"
#include <string>
#include <vector>

// Runs a step through ssh on the target host. Import scripts are staged into a
// temporary remote directory first and removed again afterwards.
class RemoteExecutor : public ShellStepExecutor {
public:
    RemoteExecutor(ExecutionContext& context,
                   IShellRunner& runner,
                   IRemoteProcessDirectory& processes,
                   IPrompter& prompter,
                   const RemoteConfig& config)
        : ShellStepExecutor(context, runner),
          processes_(processes),
          prompter_(prompter),
          config_(config) {}

    int execute(const Step& step, const CommandTarget& target, const std::string& command) override;

    // Complete local command line for the remote call
    std::string build_invocation(const std::string& host, const std::string& command) const;

private:
    IRemoteProcessDirectory& processes_;
    IPrompter& prompter_;
    const RemoteConfig& config_;

    // Query -> prompt -> signal loop until the remote command is gone or the operator moves on
    void handle_interrupt(const std::string& host, const std::string& command);
    std::vector<std::string> query_pids(const std::string& host, const std::string& command);
    void remove_staging_dir(const std::string& host);
};
