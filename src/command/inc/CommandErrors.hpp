#pragma once

#include <stdexcept>
#include <string>

// Step key matches none of the known command kinds
class UnknownCommandKind : public std::runtime_error {
public:
    explicit UnknownCommandKind(const std::string& key)
        : std::runtime_error("Command type " + key + " is not known."), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// remote@<name> references a system that is not configured
class UnknownHost : public std::runtime_error {
public:
    explicit UnknownHost(const std::string& system)
        : std::runtime_error("System " + system + " is not defined in systems."), system_(system) {}

    const std::string& system() const { return system_; }

private:
    std::string system_;
};

// Template references a name that is neither a variable nor a constant
class UnresolvedVariable : public std::runtime_error {
public:
    UnresolvedVariable(const std::string& name, const std::string& message)
        : std::runtime_error(message), name_(name) {}

    explicit UnresolvedVariable(const std::string& name)
        : UnresolvedVariable(name, "Variable " + name + " is not defined.") {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Stops the whole pipeline run. Carries the exit code as text.
class AbortSignal : public std::runtime_error {
public:
    explicit AbortSignal(const std::string& exit_code)
        : std::runtime_error("Pipeline aborted with exit code " + exit_code), exit_code_(exit_code) {}

    const std::string& exit_code() const { return exit_code_; }

    // Numeric exit code for the process, 1 if the carried text is not a number
    int process_exit_code() const;

private:
    std::string exit_code_;
};

// The operator interrupted a running command (SIGINT)
class CommandInterrupted : public std::runtime_error {
public:
    explicit CommandInterrupted(const std::string& what = "Command interrupted by user")
        : std::runtime_error(what) {}
};

inline constexpr int EXIT_CODE_INTERRUPTED = 130;
