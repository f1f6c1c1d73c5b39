#include "SshProcessDirectory.hpp"
#include "RemoteCommand.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

std::string SshProcessDirectory::query_command(const std::string& host, const std::string& command) const {
    const std::string ps_command = "ps axu | grep " + StringUtils::shell_quote(command) +
                                   " | grep -v 'grep' | awk '{print $2}'";
    return config_.ssh_command + " " + host + " " + StringUtils::shell_quote(ps_command) + " 2>&1";
}

std::string SshProcessDirectory::kill_command(const std::string& host, const std::string& pid,
                                              const std::string& signal_name) const {
    return RemoteCommand::ssh_prefix(config_, host) + "kill -" + signal_name + " " + pid;
}

std::vector<std::string> SshProcessDirectory::find_pids(const std::string& host, const std::string& command) {
    std::string output;
    int exit_code = runner_.run_capture(query_command(host, command), output);
    if (exit_code != 0) {
        throw std::runtime_error("Process query on " + host + " failed with exit code " +
                                 std::to_string(exit_code) + ": " + StringUtils::trimmed(output));
    }
    return StringUtils::split_whitespace(output);
}

int SshProcessDirectory::send_signal(const std::string& host, const std::string& pid,
                                     const std::string& signal_name) {
    return runner_.run(kill_command(host, pid, signal_name));
}
