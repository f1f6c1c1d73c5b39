#pragma once

#include "CommandKind.hpp"
#include "ExecutionContext.hpp"
#include <string>

struct CommandTarget {
    CommandKind kind = CommandKind::Local;
    std::string system;              // Symbolic host name, empty unless remote
    std::string host = "localhost";  // Resolved address
};

class CommandClassifier {
public:
    static constexpr const char* LOCAL_KEY = "local";
    static constexpr const char* MANUAL_KEY = "manual";
    static constexpr const char* INTERPRETED_KEY = "lua";
    static constexpr const char* REMOTE_MARKER = "remote@";

    // Kind of a normalized step key. Throws UnknownCommandKind.
    static CommandKind kind_of(const std::string& key);

    // Kind plus host resolution against the configured systems.
    // Throws UnknownCommandKind or UnknownHost.
    static CommandTarget classify(const std::string& key, const VariableMap& systems);
};
