#pragma once

#include "IRemoteProcessDirectory.hpp"
#include "IShellRunner.hpp"
#include "RemoteConfig.hpp"

class SshProcessDirectory : public IRemoteProcessDirectory {
public:
    SshProcessDirectory(IShellRunner& runner, const RemoteConfig& config)
        : runner_(runner), config_(config) {}

    std::vector<std::string> find_pids(const std::string& host, const std::string& command) override;
    int send_signal(const std::string& host, const std::string& pid, const std::string& signal_name) override;

    std::string query_command(const std::string& host, const std::string& command) const;
    std::string kill_command(const std::string& host, const std::string& pid, const std::string& signal_name) const;

private:
    IShellRunner& runner_;
    const RemoteConfig& config_;
};
