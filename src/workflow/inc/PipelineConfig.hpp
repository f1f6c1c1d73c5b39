#pragma once

#include "ExecutionContext.hpp"
#include "RemoteConfig.hpp"
#include "Step.hpp"
#include "StepSelection.hpp"
#include <string>
#include <vector>

struct RunOptions {
    bool interactive = false; // Confirm every step before it runs
    bool force = false;       // Never stop at the failure gate
    size_t jump_to = 1;       // First step index to run
    StepSelection selection;
};

// Top-level config
struct PipelineConfig {
    std::string name;
    std::string config_file;

    VariableMap systems;
    VariableMap vars;
    VariableMap constants;
    std::vector<std::string> imports;
    std::string import_path = ".";

    std::vector<PipelineEntry> pipeline;
    std::vector<PipelineEntry> always;

    RemoteConfig remote;
    RunOptions options;

    bool verbose = false;
    std::string log_file = "log/stepflow.log";
};
