#include "CommandErrors.hpp"
#include "PipelineRunner.hpp"
#include "RecordingExecutor.hpp"
#include "ScriptedPrompter.hpp"
#include <cassert>
#include <iostream>
#include <memory>

static PipelineEntry entry(const std::string& key, const std::string& text) {
    return PipelineEntry{{key, RawText{text}}};
}

static PipelineConfig make_config() {
    PipelineConfig config;
    config.name = "release";
    config.pipeline = {
        entry("local", "one"),
        entry("local", "two"),
        entry("local", "three"),
        entry("local", "four")
    };
    return config;
}

struct Harness {
    ExecutionContext context;
    ExecutorRegistry registry;
    RecordingExecutor* local = nullptr;
    RecordingExecutor* manual = nullptr;
    ScriptedPrompter prompter;
    std::unique_ptr<ExecutionController> controller;

    explicit Harness(const PipelineConfig& config, std::vector<char> answers = {})
        : context(PipelineRunner::make_context(config)), prompter(answers) {
        auto local_executor = std::make_unique<RecordingExecutor>(context);
        local = local_executor.get();
        registry.register_executor(CommandKind::Local, std::move(local_executor));
        auto manual_executor = std::make_unique<RecordingExecutor>(context);
        manual = manual_executor.get();
        registry.register_executor(CommandKind::Manual, std::move(manual_executor));
        controller = std::make_unique<ExecutionController>(context, registry, prompter);
    }
};

void test_make_context() {
    PipelineConfig config;
    config.vars["a"] = "1";
    config.systems["web1"] = "10.0.0.5";
    config.constants["dir"] = "/srv";
    config.imports = {"env.sh"};
    config.import_path = "/opt/scripts";

    ExecutionContext context = PipelineRunner::make_context(config);
    assert(context.variables.at("a") == "1");
    assert(context.systems.at("web1") == "10.0.0.5");
    assert(context.constants.at("dir") == "/srv");
    assert(context.imports.size() == 1);
    assert(context.import_path == "/opt/scripts");
    std::cout << "test_make_context passed.\n";
}

void test_runs_all_steps_in_order() {
    PipelineConfig config = make_config();
    Harness h(config);
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(h.local->commands.size() == 4);
    assert(h.local->commands[0] == "one");
    assert(h.local->commands[3] == "four");
    assert(h.local->indices[2] == 3);
    assert(summary.executed == 4);
    assert(summary.succeeded == 4);
    assert(summary.not_selected == 0);
    std::cout << "test_runs_all_steps_in_order passed.\n";
}

void test_jump_to() {
    PipelineConfig config = make_config();
    config.options.jump_to = 3;
    Harness h(config);
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(h.local->commands.size() == 2);
    assert(h.local->commands[0] == "three");
    assert(h.local->indices[0] == 3);
    assert(summary.not_selected == 2);
    std::cout << "test_jump_to passed.\n";
}

void test_step_selection() {
    PipelineConfig config = make_config();
    config.options.selection = StepSelection::parse("1,3");
    Harness h(config);
    PipelineRunner runner(config, *h.controller);
    runner.run();
    assert(h.local->commands.size() == 2);
    assert(h.local->commands[0] == "one");
    assert(h.local->commands[1] == "three");

    PipelineConfig excluded = make_config();
    excluded.options.selection = StepSelection::parse("e2,4");
    Harness h2(excluded);
    PipelineRunner runner2(excluded, *h2.controller);
    runner2.run();
    assert(h2.local->commands.size() == 2);
    assert(h2.local->commands[0] == "one");
    assert(h2.local->commands[1] == "three");
    std::cout << "test_step_selection passed.\n";
}

void test_jump_to_combined_with_selection() {
    PipelineConfig config = make_config();
    config.options.jump_to = 2;
    config.options.selection = StepSelection::parse("1,2,4");
    Harness h(config);
    PipelineRunner runner(config, *h.controller);
    runner.run();
    assert(h.local->commands.size() == 2);
    assert(h.local->commands[0] == "two");
    assert(h.local->commands[1] == "four");
    std::cout << "test_jump_to_combined_with_selection passed.\n";
}

void test_variables_flow_between_steps() {
    PipelineConfig config;
    config.vars["version"] = "1.0";
    config.pipeline = {entry("local", "build {version}")};
    Harness h(config);
    PipelineRunner runner(config, *h.controller);
    runner.run();
    assert(h.local->commands[0] == "build 1.0");
    std::cout << "test_variables_flow_between_steps passed.\n";
}

void test_force_continues_after_failure() {
    PipelineConfig config = make_config();
    config.options.force = true;
    Harness h(config);
    h.local->push(0);
    h.local->push(5);
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(h.local->commands.size() == 4);
    assert(summary.failed == 1);
    assert(summary.succeeded == 3);
    assert(h.prompter.questions.empty());
    std::cout << "test_force_continues_after_failure passed.\n";
}

void test_manual_skip_counts() {
    PipelineConfig config;
    config.pipeline = {entry("manual", "check"), entry("local", "go")};
    Harness h(config, {'s'});
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(summary.skipped == 1);
    assert(summary.succeeded == 1);
    assert(h.manual->commands.empty());
    std::cout << "test_manual_skip_counts passed.\n";
}

void test_abort_runs_always_then_rethrows() {
    PipelineConfig config = make_config();
    config.always = {entry("local", "cleanup")};
    Harness h(config, {'a'});
    h.local->push(0);
    h.local->push(7);
    PipelineRunner runner(config, *h.controller);

    bool thrown = false;
    try {
        runner.run();
    } catch (const AbortSignal& e) {
        thrown = e.exit_code() == "7";
    }
    assert(thrown);
    assert(h.local->commands.size() == 3);
    assert(h.local->commands[1] == "two");
    assert(h.local->commands[2] == "cleanup");
    std::cout << "test_abort_runs_always_then_rethrows passed.\n";
}

void test_error_runs_always_then_rethrows() {
    PipelineConfig config;
    config.pipeline = {entry("local", "echo {missing}")};
    config.always = {entry("local", "cleanup")};
    Harness h(config);
    PipelineRunner runner(config, *h.controller);

    bool thrown = false;
    try {
        runner.run();
    } catch (const UnresolvedVariable&) {
        thrown = true;
    }
    assert(thrown);
    assert(h.local->commands.size() == 1);
    assert(h.local->commands[0] == "cleanup");
    std::cout << "test_error_runs_always_then_rethrows passed.\n";
}

void test_always_step_error_keeps_abort_code() {
    PipelineConfig config;
    config.pipeline = {entry("local", "deploy")};
    config.always = {entry("local", "rm {lockfile}"), entry("local", "cleanup2")};
    Harness h(config, {'a'});
    h.local->push(5);
    PipelineRunner runner(config, *h.controller);

    bool thrown = false;
    try {
        runner.run();
    } catch (const AbortSignal& e) {
        thrown = e.exit_code() == "5";
    }
    assert(thrown);
    assert(h.local->commands.size() == 2);
    assert(h.local->commands[0] == "deploy");
    assert(h.local->commands[1] == "cleanup2");
    std::cout << "test_always_step_error_keeps_abort_code passed.\n";
}

void test_always_step_error_after_success() {
    PipelineConfig config;
    config.pipeline = {entry("local", "deploy")};
    config.always = {entry("remote@nowhere", "stop"), entry("local", "cleanup")};
    Harness h(config);
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(h.local->commands.size() == 2);
    assert(h.local->commands[1] == "cleanup");
    assert(summary.failed == 1);
    assert(summary.succeeded == 2);
    std::cout << "test_always_step_error_after_success passed.\n";
}

void test_always_ignores_selection_and_failures() {
    PipelineConfig config = make_config();
    config.options.selection = StepSelection::parse("1");
    config.options.jump_to = 1;
    config.always = {entry("local", "first"), entry("local", "second")};
    Harness h(config);
    h.local->push(0);
    h.local->push(9);
    PipelineRunner runner(config, *h.controller);

    PipelineSummary summary = runner.run();
    assert(h.local->commands.size() == 3);
    assert(h.local->commands[1] == "first");
    assert(h.local->commands[2] == "second");
    assert(summary.failed == 1);
    assert(h.prompter.questions.empty());
    std::cout << "test_always_ignores_selection_and_failures passed.\n";
}

int main() {
    test_make_context();
    test_runs_all_steps_in_order();
    test_jump_to();
    test_step_selection();
    test_jump_to_combined_with_selection();
    test_variables_flow_between_steps();
    test_force_continues_after_failure();
    test_manual_skip_counts();
    test_abort_runs_always_then_rethrows();
    test_error_runs_always_then_rethrows();
    test_always_step_error_keeps_abort_code();
    test_always_step_error_after_success();
    test_always_ignores_selection_and_failures();

    std::cout << "All PipelineRunner tests passed.\n";
    return 0;
}
