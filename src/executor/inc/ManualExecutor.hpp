#pragma once

#include "StepExecutor.hpp"

// Manual steps only exist as a confirmation point, passing the gate is the whole action
class ManualExecutor : public StepExecutor {
public:
    using StepExecutor::StepExecutor;

    int execute(const Step& step, const CommandTarget& target, const std::string& command) override;
};
