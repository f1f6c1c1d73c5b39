#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <sstream>

extern char** environ;

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify pipeline file path", true},
    {"--interactive", 'i', "Confirm every step before it runs", false},
    {"--force", 'f', "Continue after failed steps without asking", false},
    {"--jump-to", 'j', "Start at the step with this index", true},
    {"--steps", 's', "Only run these steps (1,3,5) or all except them (e2,4)", true},
    {"--var", 'e', "Set a variable, NAME=VALUE (repeatable)", true},
    {"--log-file", 'l', "Write the log to this file", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: stepflow [OPTIONS]... --config-file=FILE\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  STEPFLOW_IMPORT_PATH     Local directory holding the import scripts\n"
              << "  STEPFLOW_SSH             ssh client command\n"
              << "  STEPFLOW_PRIVILEGE       Privilege escalation for remote commands (default: sudo)\n"
              << "  STEPFLOW_CONST_<NAME>    Constant available as {const_<name>}\n"
              << "\nExamples:\n"
              << "  stepflow --config-file=deploy.yaml\n"
              << "  stepflow -c deploy.yaml -i --steps=e3 -e version=1.2.3\n\n";
}

void ParameterContext::show_version() {
    std::cout << "stepflow version: " << STEPFLOW_VERSION << std::endl;
    std::cout << "build: " << STEPFLOW_BUILD_TARGET_OSTYPE << "-" << STEPFLOW_BUILD_TARGET_CPUTYPE
              << " " << STEPFLOW_BUILD_DATE << std::endl;
}

void ParameterContext::parse_pipeline(const YAML::Node& config) {
    static const std::set<std::string> valid_keys = {
        "name", "systems", "vars", "constants", "imports", "import_path", "remote", "pipeline", "always"
    };
    YAML::check_unknown_keys(config, valid_keys, "pipeline file");

    if (config["name"]) {
        config_.name = config["name"].as<std::string>();
    }

    auto systems = YAML::parse_string_map(config["systems"], "systems");
    for (auto& [name, host] : systems) {
        config_.systems[name] = host;
    }

    auto vars = YAML::parse_string_map(config["vars"], "vars");
    for (auto& [name, value] : vars) {
        config_.vars[name] = value;
    }

    auto constants = YAML::parse_string_map(config["constants"], "constants");
    for (auto& [name, value] : constants) {
        config_.constants[name] = value;
    }

    if (config["imports"]) {
        if (!config["imports"].IsSequence()) {
            throw std::runtime_error("Configuration key 'imports' must be a list of script names.");
        }
        config_.imports = config["imports"].as<std::vector<std::string>>();
    }
    if (config["import_path"]) {
        config_.import_path = config["import_path"].as<std::string>();
    }
    if (config["remote"]) {
        config_.remote = config["remote"].as<RemoteConfig>();
    }

    if (!config["pipeline"]) {
        throw std::runtime_error("Missing required field 'pipeline' in pipeline file.");
    }
    config_.pipeline = YAML::parse_steps(config["pipeline"], "pipeline");
    config_.always = YAML::parse_steps(config["always"], "always");
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config.IsMap()) {
        throw std::runtime_error("Pipeline file must contain a mapping at the top level.");
    }
    parse_pipeline(config);
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(file_path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open pipeline file: " + file_path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse pipeline file " + file_path + ": " + e.what());
    }
    config_.config_file = file_path;
    merge_yaml(config);
}

void ParameterContext::merge_yaml() {
    auto it = cli_params.find("--config-file");
    if (it == cli_params.end() || it->second.empty()) {
        throw std::runtime_error("Missing required option --config-file");
    }
    merge_yaml(it->second);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                // Try to get value from next argv
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }

        if (key == "--var") {
            cli_vars.push_back(value);
        } else {
            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& options = config_.options;

    if (cli_params.count("--interactive")) {
        options.interactive = true;
    }
    if (cli_params.count("--force")) {
        options.force = true;
    }
    if (cli_params.count("--jump-to")) {
        const std::string& text = cli_params["--jump-to"];
        size_t consumed = 0;
        unsigned long index = 0;
        try {
            index = std::stoul(text, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid step index for --jump-to: " + text);
        }
        if (consumed != text.size() || index == 0) {
            throw std::runtime_error("Invalid step index for --jump-to: " + text);
        }
        options.jump_to = static_cast<size_t>(index);
    }
    if (cli_params.count("--steps")) {
        options.selection = StepSelection::parse(cli_params["--steps"]);
    }
    if (cli_params.count("--log-file")) {
        config_.log_file = cli_params["--log-file"];
    }
    if (cli_params.count("--verbose")) {
        config_.verbose = true;
    }

    for (const auto& assignment : cli_vars) {
        size_t pos = assignment.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw std::runtime_error("Invalid variable assignment '" + assignment + "', expected NAME=VALUE");
        }
        config_.vars[assignment.substr(0, pos)] = assignment.substr(pos + 1);
    }
}

void ParameterContext::merge_environment_vars() {
    if (const char* import_path = std::getenv("STEPFLOW_IMPORT_PATH")) {
        config_.import_path = import_path;
    }
    if (const char* ssh = std::getenv("STEPFLOW_SSH")) {
        config_.remote.ssh_command = ssh;
    }
    if (const char* privilege = std::getenv("STEPFLOW_PRIVILEGE")) {
        config_.remote.privilege = privilege;
    }

    // STEPFLOW_CONST_RELEASE_DIR=/srv -> constant release_dir
    const std::string const_prefix = "STEPFLOW_CONST_";
    for (char** env = environ; env && *env; ++env) {
        std::string entry = *env;
        if (entry.compare(0, const_prefix.size(), const_prefix) != 0) {
            continue;
        }
        size_t pos = entry.find('=');
        if (pos == std::string::npos || pos == const_prefix.size()) {
            continue;
        }
        std::string name = StringUtils::to_lower(entry.substr(const_prefix.size(), pos - const_prefix.size()));
        config_.constants[name] = entry.substr(pos + 1);
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const PipelineConfig& ParameterContext::get_config() const {
    return config_;
}

const RunOptions& ParameterContext::get_run_options() const {
    return config_.options;
}

const RemoteConfig& ParameterContext::get_remote_config() const {
    return config_.remote;
}
