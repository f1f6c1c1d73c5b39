#include "InterpretedExecutor.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"

int InterpretedExecutor::execute(const Step& step, const CommandTarget& target, const std::string& command) {
    (void)target;
    LogUtils::debug("Run lua command: {}", command);

    try {
        if (step.assignment) {
            std::string value = evaluator_.evaluate(command, context_);
            context_.variables[step.assignment_variable] = value;
            LogUtils::info("Variable {} = {}", step.assignment_variable, value);
        } else {
            evaluator_.run(command, context_);
        }
        return 0;
    } catch (const CommandInterrupted&) {
        LogUtils::info("Abort command by user key stroke. Exit code is set to {}.", EXIT_CODE_INTERRUPTED);
        return EXIT_CODE_INTERRUPTED;
    } catch (const std::exception& e) {
        LogUtils::error("{}", e.what());
        return 1;
    }
}
