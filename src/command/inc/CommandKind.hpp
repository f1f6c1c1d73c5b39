#pragma once

#include <string>

enum class CommandKind {
    Local,
    Manual,
    Interpreted,
    Remote
};

inline const char* to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::Local:       return "local";
        case CommandKind::Manual:      return "manual";
        case CommandKind::Interpreted: return "lua";
        case CommandKind::Remote:      return "remote";
        default:                       return "unknown";
    }
}
