#pragma once

#include "ExecutionController.hpp"
#include "PipelineConfig.hpp"
#include <vector>

struct PipelineSummary {
    size_t executed = 0;
    size_t succeeded = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t not_selected = 0;
};

// Runs the pipeline section step by step, then the always section.
// An AbortSignal from the pipeline is rethrown once the always section is done.
// Errors inside the always section are logged and never replace it.
class PipelineRunner {
public:
    PipelineRunner(const PipelineConfig& config, ExecutionController& controller)
        : config_(config), controller_(controller) {}

    PipelineSummary run();

    // Context seeded from the configuration: vars, systems, imports, constants
    static ExecutionContext make_context(const PipelineConfig& config);

private:
    const PipelineConfig& config_;
    ExecutionController& controller_;
    PipelineSummary summary_;

    void run_pipeline();
    void run_always();
    void record(StepOutcome outcome);
};
