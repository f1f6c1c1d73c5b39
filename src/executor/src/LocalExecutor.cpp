#include "LocalExecutor.hpp"
#include "CommandBuilder.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"

int LocalExecutor::execute(const Step& step, const CommandTarget& target, const std::string& command) {
    (void)target;
    const std::string full_command = CommandBuilder::build(command, context_.imports, context_.import_path);

    try {
        return run_shell_command(step, full_command);
    } catch (const CommandInterrupted&) {
        LogUtils::info("Abort command by user key stroke. Exit code is set to {}.", EXIT_CODE_INTERRUPTED);
        return EXIT_CODE_INTERRUPTED;
    }
}
