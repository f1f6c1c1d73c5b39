#pragma once

#include "RemoteConfig.hpp"
#include <string>
#include <vector>

// Command lines of the remote execution protocol
namespace RemoteCommand {

// "ssh <host> sudo "
std::string ssh_prefix(const RemoteConfig& config, const std::string& host);

// "tar -C <import_path> -cf - <imports...> | "
std::string staging_pipe(const std::string& import_path, const std::vector<std::string>& imports);

// "mkdir <dir>; tar -C <dir> -xf -; <command>"
std::string unpack_and_run(const std::string& staging_dir, const std::string& command);

// <prefix>ssh <host> sudo 'bash -c '"'"'<command>'"'"''
std::string invocation(const RemoteConfig& config, const std::string& host,
                       const std::string& remote_command, const std::string& prefix = "");

// "ssh <host> sudo rm -r <dir>"
std::string cleanup(const RemoteConfig& config, const std::string& host);

}
