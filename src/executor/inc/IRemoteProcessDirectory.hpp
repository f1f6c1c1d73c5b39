#pragma once

#include <string>
#include <vector>

// Finds and signals processes on a remote host
class IRemoteProcessDirectory {
public:
    virtual ~IRemoteProcessDirectory() = default;

    // PIDs of processes whose command line contains the given text.
    // Throws std::runtime_error if the host could not be queried.
    virtual std::vector<std::string> find_pids(const std::string& host, const std::string& command) = 0;

    // signal_name without the SIG prefix, e.g. "INT". Returns the exit code of the kill call.
    virtual int send_signal(const std::string& host, const std::string& pid, const std::string& signal_name) = 0;
};
