#include "RemoteCommand.hpp"
#include "StringUtils.hpp"

namespace RemoteCommand {

std::string ssh_prefix(const RemoteConfig& config, const std::string& host) {
    std::string prefix = config.ssh_command + " " + host + " ";
    if (!config.privilege.empty()) {
        prefix += config.privilege + " ";
    }
    return prefix;
}

std::string staging_pipe(const std::string& import_path, const std::vector<std::string>& imports) {
    std::string pipe = "tar -C " + StringUtils::shell_quote(import_path) + " -cf -";
    for (const auto& script : imports) {
        pipe += " " + StringUtils::shell_quote(script);
    }
    return pipe + " | ";
}

std::string unpack_and_run(const std::string& staging_dir, const std::string& command) {
    return "mkdir " + staging_dir + "; tar -C " + staging_dir + " -xf -; " + command;
}

std::string invocation(const RemoteConfig& config, const std::string& host,
                       const std::string& remote_command, const std::string& prefix) {
    return prefix + ssh_prefix(config, host) +
           StringUtils::shell_quote("bash -c " + StringUtils::shell_quote(remote_command));
}

std::string cleanup(const RemoteConfig& config, const std::string& host) {
    return ssh_prefix(config, host) + "rm -r " + config.staging_dir;
}

}
