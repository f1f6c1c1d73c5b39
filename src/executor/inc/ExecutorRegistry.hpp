#pragma once

#include "CommandKind.hpp"
#include "IActionEvaluator.hpp"
#include "IPrompter.hpp"
#include "IRemoteProcessDirectory.hpp"
#include "IShellRunner.hpp"
#include "RemoteConfig.hpp"
#include "StepExecutor.hpp"
#include <map>
#include <memory>

class ExecutorRegistry {
public:
    void register_executor(CommandKind kind, std::unique_ptr<StepExecutor> executor);

    // Throws std::invalid_argument if nothing is registered for the kind
    StepExecutor& get(CommandKind kind) const;

    bool has(CommandKind kind) const { return executors_.count(kind) > 0; }

    // Local, remote, lua and manual executors wired to the given collaborators
    static std::unique_ptr<ExecutorRegistry> create_default(ExecutionContext& context,
                                                            const RemoteConfig& remote,
                                                            IShellRunner& runner,
                                                            IRemoteProcessDirectory& processes,
                                                            IActionEvaluator& evaluator,
                                                            IPrompter& prompter);

private:
    std::map<CommandKind, std::unique_ptr<StepExecutor>> executors_;
};
