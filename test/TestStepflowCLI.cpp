#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string find_stepflow_bin() {
    if (const char* env = std::getenv("STEPFLOW_BIN")) {
        if (env[0] != '\0' && fs::exists(env)) {
            return fs::absolute(env).string();
        }
    }

    std::vector<std::string> candidates = {
        "./stepflow",
        "../stepflow",
        "./build/stepflow",
        "../build/stepflow"
    };

    for (const auto& c : candidates) {
        if (fs::exists(c)) {
            return fs::absolute(fs::path(c)).string();
        }
    }

    return {};
}

static fs::path work_dir() {
    fs::path dir = fs::temp_directory_path() / ("stepflow_cli_" + std::to_string(getpid()));
    fs::create_directories(dir);
    return dir;
}

static std::string write_pipeline(const std::string& name, const std::string& yaml) {
    fs::path path = work_dir() / name;
    std::ofstream out(path);
    out << yaml;
    return path.string();
}

// Exit code of the command, stdin taken from `input`
static int run_cmd(const std::string& cmd, const std::string& input = "") {
    const std::string full = "printf '" + input + "' | " + cmd;
    std::cout << "[RUN] " << full << std::endl;
    int status = std::system(full.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

static std::string bin_cmd(const std::string& args) {
    const auto bin = find_stepflow_bin();
    assert(!bin.empty() && "stepflow binary not found; set STEPFLOW_BIN");
    const std::string log = (work_dir() / "stepflow.log").string();
    return "\"" + bin + "\" -l \"" + log + "\" " + args;
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void test_help_command() {
    int rc = run_cmd(bin_cmd("--help"));
    (void)rc;
    assert(rc == 0 && "stepflow --help should exit 0");
    std::cout << "test_help_command passed\n";
}

void test_unknown_argument() {
    int rc = run_cmd(bin_cmd("--unknown-arg"));
    (void)rc;
    assert(rc != 0 && "stepflow with unknown args should exit non-zero");
    std::cout << "test_unknown_argument passed\n";
}

void test_missing_config() {
    int rc = run_cmd(bin_cmd("-c /nonexistent/pipeline.yaml"));
    (void)rc;
    assert(rc == 1);
    std::cout << "test_missing_config passed\n";
}

void test_pipeline_runs() {
    const fs::path out = work_dir() / "result.txt";
    const std::string cfg = write_pipeline("ok.yaml", R"(
name: smoke
vars:
  greeting: hello
pipeline:
  - name=local: printf world
  - lua: vars.upper = string.upper(vars.name)
  - local: echo "{greeting} {upper} {const_target}" > )" + out.string() + R"(
always:
  - local: echo done >> )" + out.string() + "\n");

    int rc = run_cmd("STEPFLOW_CONST_TARGET=prod " + bin_cmd("-c \"" + cfg + "\""));
    (void)rc;
    assert(rc == 0);
    assert(read_file(out) == "hello WORLD prod\ndone\n");
    std::cout << "test_pipeline_runs passed\n";
}

void test_cli_var_and_steps() {
    const fs::path out = work_dir() / "steps.txt";
    const std::string cfg = write_pipeline("steps.yaml", R"(
vars:
  value: yaml
pipeline:
  - local: echo one {value} >> )" + out.string() + R"(
  - local: echo two {value} >> )" + out.string() + R"(
  - local: echo three {value} >> )" + out.string() + "\n");

    int rc = run_cmd(bin_cmd("-c \"" + cfg + "\" -s e2 -e value=cli"));
    (void)rc;
    assert(rc == 0);
    assert(read_file(out) == "one cli\nthree cli\n");
    std::cout << "test_cli_var_and_steps passed\n";
}

void test_failure_abort_exit_code() {
    const std::string cfg = write_pipeline("fail.yaml", R"(
pipeline:
  - local: exit 5
  - local: echo unreachable
)");

    // Abort at the failure prompt
    int rc = run_cmd(bin_cmd("-c \"" + cfg + "\""), "a\\n");
    (void)rc;
    assert(rc == 5);

    // --force never stops
    rc = run_cmd(bin_cmd("-f -c \"" + cfg + "\""));
    assert(rc == 0);
    std::cout << "test_failure_abort_exit_code passed\n";
}

void test_manual_abort() {
    const std::string cfg = write_pipeline("manual.yaml", R"(
pipeline:
  - manual: Stop here
)");
    int rc = run_cmd(bin_cmd("-c \"" + cfg + "\""), "a\\n");
    (void)rc;
    assert(rc == 1);
    std::cout << "test_manual_abort passed\n";
}

void test_sigterm_handling() {
    const auto bin = find_stepflow_bin();
    assert(!bin.empty() && "stepflow binary not found; set STEPFLOW_BIN");

    const std::string cfg = write_pipeline("sleep.yaml", R"(
pipeline:
  - local: sleep 5
)");
    const std::string log = (work_dir() / "sigterm.log").string();

    pid_t pid = fork();
    if (pid == 0) {
        execl(bin.c_str(), bin.c_str(), "-l", log.c_str(), "-c", cfg.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    assert(pid > 0 && "fork failed");
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    int kill_rc = kill(pid, SIGTERM);
    (void)kill_rc;
    assert(kill_rc == 0 && "Failed to send SIGTERM");

    int status = 0;
    waitpid(pid, &status, 0);

    assert(WIFEXITED(status) && "stepflow should exit through its SIGTERM handler");
    assert(WEXITSTATUS(status) == 128 + SIGTERM);

    std::cout << "test_sigterm_handling passed\n";
}

int main() {
    test_help_command();
    test_unknown_argument();
    test_missing_config();
    test_pipeline_runs();
    test_cli_var_and_steps();
    test_failure_abort_exit_code();
    test_manual_abort();
    test_sigterm_handling();

    std::error_code ec;
    fs::remove_all(work_dir(), ec);
    std::cout << "All stepflow command tests passed.\n";
    return 0;
}
