#pragma once

#include "IActionEvaluator.hpp"
#include "StepExecutor.hpp"

// Runs the resolved step text in-process. Evaluation errors are logged and
// reported as exit code 1, they never leave the executor.
class InterpretedExecutor : public StepExecutor {
public:
    InterpretedExecutor(ExecutionContext& context, IActionEvaluator& evaluator)
        : StepExecutor(context), evaluator_(evaluator) {}

    int execute(const Step& step, const CommandTarget& target, const std::string& command) override;

private:
    IActionEvaluator& evaluator_;
};
