#pragma once

#include <string>

// Process launch capability: one shell invocation per call
class IShellRunner {
public:
    virtual ~IShellRunner() = default;

    // Stdout and stderr are inherited. Returns the exit code.
    // Throws CommandInterrupted when the operator interrupted the command.
    virtual int run(const std::string& command) = 0;

    // Like run(), with stdout captured into output
    virtual int run_capture(const std::string& command, std::string& output) = 0;
};
