#include "ExecutionController.hpp"
#include "CommandClassifier.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"
#include "VariableResolver.hpp"
#include <string>
#include <vector>

namespace {

const std::vector<PromptOption> GATE_OPTIONS = {
    {'p', "proceed"},
    {'s', "skip"},
    {'a', "abort"}
};

const std::vector<PromptOption> FAILURE_OPTIONS = {
    {'p', "proceed"},
    {'r', "retry"},
    {'a', "abort"}
};

}

StepOutcome ExecutionController::execute(const Step& step, bool interactive, bool force) {
    while (true) {
        // Resolve first so the operator sees exactly what will run
        const std::string command = VariableResolver::resolve(step.value_template, context_);
        LogUtils::notice("\n({}) [{}]: {}", step.index, step.original_key, command);

        const CommandTarget target = CommandClassifier::classify(step.key, context_.systems);

        if (target.kind == CommandKind::Manual || interactive) {
            char answer = prompter_.choose("Proceed?", GATE_OPTIONS, 'p');
            if (answer == 's') {
                LogUtils::info("Step ({}) skipped", step.index);
                return StepOutcome::Skipped;
            }
            if (answer == 'a') {
                throw AbortSignal("1");
            }
        }

        const int exit_code = executors_.get(target.kind).execute(step, target, command);
        if (exit_code == 0) {
            return StepOutcome::Succeeded;
        }

        LogUtils::error("Command ({}) failed with return code {}.", step.index, exit_code);
        if (force) {
            return StepOutcome::Failed;
        }

        char answer = prompter_.choose("What should I do?", FAILURE_OPTIONS, 'p');
        if (answer == 'r') {
            continue;
        }
        if (answer == 'a') {
            throw AbortSignal(std::to_string(exit_code));
        }
        return StepOutcome::Failed;
    }
}
