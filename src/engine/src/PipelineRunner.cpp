#include "PipelineRunner.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"

ExecutionContext PipelineRunner::make_context(const PipelineConfig& config) {
    ExecutionContext context;
    context.variables = config.vars;
    context.systems = config.systems;
    context.imports = config.imports;
    context.constants = config.constants;
    context.import_path = config.import_path;
    return context;
}

PipelineSummary PipelineRunner::run() {
    summary_ = PipelineSummary{};

    if (!config_.name.empty()) {
        LogUtils::notice("Pipeline: {}", config_.name);
    }

    try {
        run_pipeline();
    } catch (const AbortSignal& e) {
        LogUtils::error("Pipeline aborted with exit code {}", e.exit_code());
        run_always();
        throw;
    } catch (const std::exception& e) {
        LogUtils::error("Pipeline stopped: {}", e.what());
        run_always();
        throw;
    }

    run_always();
    LogUtils::info("Pipeline finished: {} executed, {} succeeded, {} failed, {} skipped",
                   summary_.executed, summary_.succeeded, summary_.failed, summary_.skipped);
    return summary_;
}

void PipelineRunner::run_pipeline() {
    const auto& options = config_.options;

    for (size_t i = 0; i < config_.pipeline.size(); ++i) {
        const size_t index = i + 1;
        if (index < options.jump_to || !options.selection.selects(index)) {
            LogUtils::debug("Step ({}) not selected", index);
            ++summary_.not_selected;
            continue;
        }

        Step step(config_.pipeline[i], index);
        record(controller_.execute(step, options.interactive, options.force));
    }
}

void PipelineRunner::run_always() {
    if (config_.always.empty()) {
        return;
    }

    LogUtils::notice("\nRunning always section");
    for (size_t i = 0; i < config_.always.size(); ++i) {
        const size_t index = i + 1;
        try {
            Step step(config_.always[i], index);
            record(controller_.execute(step, config_.options.interactive, true));
        } catch (const AbortSignal& e) {
            LogUtils::error("Always section aborted with exit code {}", e.exit_code());
            break;
        } catch (const std::exception& e) {
            // Broken always steps are counted as failed, later ones still run
            LogUtils::error("Always step ({}) failed: {}", index, e.what());
            record(StepOutcome::Failed);
        }
    }
}

void PipelineRunner::record(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Succeeded:
            ++summary_.executed;
            ++summary_.succeeded;
            break;
        case StepOutcome::Failed:
            ++summary_.executed;
            ++summary_.failed;
            break;
        case StepOutcome::Skipped:
            ++summary_.skipped;
            break;
    }
}
