#pragma once

#include <string>

struct RemoteConfig {
    std::string ssh_command = "ssh";          // Secure remote-execution client
    std::string privilege = "sudo";           // Privilege escalation, may be empty
    std::string staging_dir = "stepflow_tmp"; // Remote directory receiving the imports
};
