#include "CommandBuilder.hpp"

std::string CommandBuilder::build(const std::string& resolved_command,
                                  const std::vector<std::string>& imports,
                                  const std::string& path) {
    if (imports.empty()) {
        return resolved_command;
    }

    std::string command;
    for (const auto& script : imports) {
        command += ". " + path + "/" + script + "; ";
    }
    command += resolved_command;
    return command;
}
