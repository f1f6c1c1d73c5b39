#include "ShellStepExecutor.hpp"
#include "LogUtils.hpp"

int ShellStepExecutor::run_shell_command(const Step& step, const std::string& command) {
    if (!step.assignment) {
        return runner_.run(command);
    }

    std::string output;
    int exit_code = runner_.run_capture(command, output);
    context_.variables[step.assignment_variable] = output;
    LogUtils::info("Variable {} = {}", step.assignment_variable, output);
    return exit_code;
}
