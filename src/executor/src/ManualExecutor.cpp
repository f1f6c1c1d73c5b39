#include "ManualExecutor.hpp"
#include "LogUtils.hpp"

int ManualExecutor::execute(const Step& step, const CommandTarget& target, const std::string& command) {
    (void)target;
    (void)command;
    LogUtils::debug("Manual step ({}) confirmed", step.index);
    return 0;
}
