#include "RemoteExecutor.hpp"
#include "CommandBuilder.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"
#include "RemoteCommand.hpp"
#include <fmt/format.h>
#include <stdexcept>

std::string RemoteExecutor::build_invocation(const std::string& host, const std::string& command) const {
    if (context_.imports.empty()) {
        return RemoteCommand::invocation(config_, host, command);
    }

    const std::string remote_command = RemoteCommand::unpack_and_run(
        config_.staging_dir,
        CommandBuilder::build(command, context_.imports, config_.staging_dir));

    return RemoteCommand::invocation(
        config_, host, remote_command,
        RemoteCommand::staging_pipe(context_.import_path, context_.imports));
}

int RemoteExecutor::execute(const Step& step, const CommandTarget& target, const std::string& command) {
    const bool staged = !context_.imports.empty();
    int exit_code = 0;

    try {
        exit_code = run_shell_command(step, build_invocation(target.host, command));
    } catch (const CommandInterrupted&) {
        LogUtils::info("Abort command by user key stroke. Exit code is set to {}.", EXIT_CODE_INTERRUPTED);
        exit_code = EXIT_CODE_INTERRUPTED;
        handle_interrupt(target.host, command);
    } catch (const std::runtime_error&) {
        if (staged) {
            remove_staging_dir(target.host);
        }
        throw;
    }

    if (staged) {
        remove_staging_dir(target.host);
    }
    return exit_code;
}

void RemoteExecutor::handle_interrupt(const std::string& host, const std::string& command) {
    static const std::vector<PromptOption> options = {
        {'i', "send SIGINT"},
        {'t', "send SIGTERM"},
        {'k', "send SIGKILL"},
        {'p', "do nothing and proceed"}
    };

    auto pids = query_pids(host, command);
    while (!pids.empty()) {
        LogUtils::notice("Remote command seems still to be running! Found PIDs: {}", fmt::join(pids, ","));

        char answer = prompter_.choose("What should I do?", options, 'i');
        if (answer == 'p') {
            break;
        }

        std::string signal_name = "INT";
        if (answer == 't') {
            signal_name = "TERM";
        } else if (answer == 'k') {
            signal_name = "KILL";
        }

        for (const auto& pid : pids) {
            LogUtils::info("Kill {} on {}", pid, host);
            try {
                int rc = processes_.send_signal(host, pid, signal_name);
                if (rc != 0) {
                    LogUtils::warn("Sending SIG{} to {} on {} failed, exitcode: {}", signal_name, pid, host, rc);
                }
            } catch (const std::runtime_error& e) {
                LogUtils::warn("Sending SIG{} to {} on {} failed: {}", signal_name, pid, host, e.what());
            }
        }

        pids = query_pids(host, command);
    }
    LogUtils::info("Keystroke interrupt handled.");
}

std::vector<std::string> RemoteExecutor::query_pids(const std::string& host, const std::string& command) {
    try {
        return processes_.find_pids(host, command);
    } catch (const std::runtime_error& e) {
        LogUtils::warn("Could not look up remote processes: {}", e.what());
        return {};
    }
}

void RemoteExecutor::remove_staging_dir(const std::string& host) {
    const std::string cleanup_command = RemoteCommand::cleanup(config_, host);
    try {
        int rc = runner_.run(cleanup_command);
        if (rc != 0) {
            LogUtils::warn("Failed to remove {}, exitcode: {}", config_.staging_dir, rc);
        }
    } catch (const std::runtime_error& e) {
        LogUtils::warn("Failed to remove {}: {}", config_.staging_dir, e.what());
    }
}
