#pragma once

#include "IShellRunner.hpp"
#include <chrono>
#include <string>
#include <sys/types.h>

// Runs commands through bash. An operator interrupt stops the child: SIGINT,
// then SIGKILL if it is still alive after STOP_GRACE_PERIOD.
class PosixShellRunner : public IShellRunner {
public:
    static constexpr std::chrono::milliseconds STOP_GRACE_PERIOD{500};

    explicit PosixShellRunner(const std::string& shell = "/bin/bash") : shell_(shell) {}

    int run(const std::string& command) override;
    int run_capture(const std::string& command, std::string& output) override;

private:
    std::string shell_;

    int spawn(const std::string& command, std::string* output);
    int stop_child(pid_t pid);
};
