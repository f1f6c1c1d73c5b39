#pragma once

#include "ExecutionContext.hpp"
#include "ExecutorRegistry.hpp"
#include "IPrompter.hpp"
#include "Step.hpp"

enum class StepOutcome {
    Succeeded,
    Skipped,  // Skipped at the manual gate
    Failed    // Failed and left behind by force or by the operator
};

// Drives a single step: header, manual gate, dispatch, failure gate, retry.
// Only AbortSignal leaves execute(); every failure is settled before it returns.
class ExecutionController {
public:
    ExecutionController(ExecutionContext& context, ExecutorRegistry& executors, IPrompter& prompter)
        : context_(context), executors_(executors), prompter_(prompter) {}

    StepOutcome execute(const Step& step, bool interactive = false, bool force = false);

private:
    ExecutionContext& context_;
    ExecutorRegistry& executors_;
    IPrompter& prompter_;
};
