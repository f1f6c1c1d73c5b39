#include "CommandErrors.hpp"
#include "ConsolePrompter.hpp"
#include "ExecutionController.hpp"
#include "ExecutorRegistry.hpp"
#include "LogUtils.hpp"
#include "LuaActionEvaluator.hpp"
#include "ParameterContext.hpp"
#include "PipelineRunner.hpp"
#include "PosixShellRunner.hpp"
#include "SignalManager.hpp"
#include "SshProcessDirectory.hpp"
#include <csignal>
#include <iostream>
#include <unistd.h>

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return 0;
        }

        const PipelineConfig& config = context.get_config();
        LogUtils::LoggerGuard logger(config.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info,
                                     config.log_file);

        // Every log record is already flushed, only async-signal-safe calls from here
        SignalManager::register_signal(SIGTERM, [](int signum) {
            static const char message[] = "Terminate signal received. Stopping pipeline.\n";
            ssize_t written = write(STDERR_FILENO, message, sizeof(message) - 1);
            (void)written;
            _exit(128 + signum);
        }, true);
        SignalManager::setup();

        ExecutionContext run_context = PipelineRunner::make_context(config);
        PosixShellRunner shell;
        SshProcessDirectory processes(shell, config.remote);
        LuaActionEvaluator evaluator;
        ConsolePrompter prompter;

        auto executors = ExecutorRegistry::create_default(
            run_context, config.remote, shell, processes, evaluator, prompter);
        ExecutionController controller(run_context, *executors, prompter);
        PipelineRunner runner(config, controller);

        try {
            runner.run();
            LogUtils::info("All steps completed.");
        } catch (const AbortSignal& e) {
            result = e.process_exit_code();
            LogUtils::error("Aborted by user. Exit code: {}", result);
        } catch (const std::exception& e) {
            LogUtils::error("Error during pipeline execution: {}", e.what());
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    return result;
}
