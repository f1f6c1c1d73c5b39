#pragma once

#include <string>
#include <vector>

class CommandBuilder {
public:
    // ". <path>/<import>; " for every import, followed by the command
    static std::string build(const std::string& resolved_command,
                             const std::vector<std::string>& imports,
                             const std::string& path);
};
