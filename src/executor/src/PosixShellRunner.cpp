#include "PosixShellRunner.hpp"
#include "CommandErrors.hpp"
#include "LogUtils.hpp"
#include "SignalManager.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

int PosixShellRunner::run(const std::string& command) {
    return spawn(command, nullptr);
}

int PosixShellRunner::run_capture(const std::string& command, std::string& output) {
    output.clear();
    return spawn(command, &output);
}

// SIGINT first, SIGKILL once the grace period is over
int PosixShellRunner::stop_child(pid_t pid) {
    kill(pid, SIGINT);

    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + STOP_GRACE_PERIOD;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return status;
        }
        if (rc < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LogUtils::debug("Command {} ignored SIGINT, sending SIGKILL", pid);
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    return status;
}

int PosixShellRunner::spawn(const std::string& command, std::string* output) {
    LogUtils::debug("Executing: {}", command);

    // SIGINT reaches the foreground child through the terminal; the supervisor only records it
    SignalManager::InterruptGuard guard;

    int fds[2] = {-1, -1};
    if (output && pipe(fds) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        if (output) {
            close(fds[0]);
            close(fds[1]);
        }
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        if (output) {
            dup2(fds[1], STDOUT_FILENO);
            close(fds[0]);
            close(fds[1]);
        }
        execl(shell_.c_str(), shell_.c_str(), "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    if (output) {
        close(fds[1]);
        char buffer[4096];
        while (true) {
            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                output->append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                LogUtils::warn("Reading command output failed: {}", std::strerror(errno));
                break;
            } else if (guard.triggered()) {
                break;
            }
        }
        close(fds[0]);
    }

    int status = 0;
    bool reaped = false;
    while (!guard.triggered()) {
        if (waitpid(pid, &status, 0) == pid) {
            reaped = true;
            break;
        }
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (!reaped) {
        status = stop_child(pid);
    }

    bool killed_by_interrupt = WIFSIGNALED(status) && WTERMSIG(status) == SIGINT;
    if (guard.triggered() || killed_by_interrupt) {
        throw CommandInterrupted();
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}
