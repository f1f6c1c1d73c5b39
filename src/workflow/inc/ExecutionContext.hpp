#pragma once

#include <map>
#include <string>
#include <vector>

using VariableMap = std::map<std::string, std::string>;

// Prefix under which constants are visible to templates, e.g. {const_release_dir}
inline constexpr const char* CONSTANT_PREFIX = "const_";

// State shared by all steps of one pipeline run
struct ExecutionContext {
    VariableMap variables;            // Written by capturing steps
    VariableMap systems;              // Symbolic host name -> address
    std::vector<std::string> imports; // Scripts sourced before local and remote commands
    VariableMap constants;            // Read-only, merged as const_<name>
    std::string import_path = ".";    // Local directory holding the import scripts
};
