#pragma once

#include "IShellRunner.hpp"
#include "StepExecutor.hpp"

// Base for executors that hand a command line to the shell runner
class ShellStepExecutor : public StepExecutor {
public:
    ShellStepExecutor(ExecutionContext& context, IShellRunner& runner)
        : StepExecutor(context), runner_(runner) {}

protected:
    IShellRunner& runner_;

    // Streams output through, or captures stdout into the step's variable
    int run_shell_command(const Step& step, const std::string& command);
};
