#include "ExecutorRegistry.hpp"
#include "InterpretedExecutor.hpp"
#include "LocalExecutor.hpp"
#include "ManualExecutor.hpp"
#include "RemoteExecutor.hpp"
#include <stdexcept>
#include <string>

void ExecutorRegistry::register_executor(CommandKind kind, std::unique_ptr<StepExecutor> executor) {
    executors_[kind] = std::move(executor);
}

StepExecutor& ExecutorRegistry::get(CommandKind kind) const {
    if (auto it = executors_.find(kind); it != executors_.end()) {
        return *it->second;
    }
    throw std::invalid_argument(std::string("No executor registered for command kind: ") + to_string(kind));
}

std::unique_ptr<ExecutorRegistry> ExecutorRegistry::create_default(ExecutionContext& context,
                                                                   const RemoteConfig& remote,
                                                                   IShellRunner& runner,
                                                                   IRemoteProcessDirectory& processes,
                                                                   IActionEvaluator& evaluator,
                                                                   IPrompter& prompter) {
    auto registry = std::make_unique<ExecutorRegistry>();
    registry->register_executor(CommandKind::Local, std::make_unique<LocalExecutor>(context, runner));
    registry->register_executor(CommandKind::Remote,
        std::make_unique<RemoteExecutor>(context, runner, processes, prompter, remote));
    registry->register_executor(CommandKind::Interpreted,
        std::make_unique<InterpretedExecutor>(context, evaluator));
    registry->register_executor(CommandKind::Manual, std::make_unique<ManualExecutor>(context));
    return registry;
}
