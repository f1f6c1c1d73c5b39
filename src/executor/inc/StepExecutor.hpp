#pragma once

#include "CommandClassifier.hpp"
#include "ExecutionContext.hpp"
#include "Step.hpp"
#include <string>

// Runs one classified, resolved step against its target and reports the exit code
class StepExecutor {
public:
    explicit StepExecutor(ExecutionContext& context) : context_(context) {}
    virtual ~StepExecutor() = default;

    virtual int execute(const Step& step, const CommandTarget& target, const std::string& command) = 0;

protected:
    ExecutionContext& context_;
};
