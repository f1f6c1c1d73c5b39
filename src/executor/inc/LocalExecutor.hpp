#pragma once

#include "ShellStepExecutor.hpp"

class LocalExecutor : public ShellStepExecutor {
public:
    using ShellStepExecutor::ShellStepExecutor;

    int execute(const Step& step, const CommandTarget& target, const std::string& command) override;
};
