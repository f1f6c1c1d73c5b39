#pragma once

#include "ConfigParser.hpp"
#include "PipelineConfig.hpp"

#include <yaml-cpp/yaml.h>
#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);

    const PipelineConfig& get_config() const;
    const RunOptions& get_run_options() const;
    const RemoteConfig& get_remote_config() const;

private:
    PipelineConfig config_;

    // Command line storage, --var may repeat
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> cli_vars;

    void parse_pipeline(const YAML::Node& pipeline_yaml);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--config-file")
        char short_opt;          // Short option (e.g. 'c')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
