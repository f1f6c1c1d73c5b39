#pragma once

#include "PipelineConfig.hpp"
#include "RemoteConfig.hpp"
#include "Step.hpp"
#include "StepValue.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    // name -> scalar mapping, scalars are kept as written
    inline VariableMap parse_string_map(const YAML::Node& node, const std::string& context) {
        VariableMap values;
        if (!node || node.IsNull()) {
            return values;
        }
        if (!node.IsMap()) {
            throw std::runtime_error("Configuration key '" + context + "' must be a mapping.");
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string name = it->first.as<std::string>();
            if (it->second.IsNull()) {
                values[name] = "";
            } else if (it->second.IsScalar()) {
                values[name] = it->second.as<std::string>();
            } else {
                throw std::runtime_error("Value of '" + context + "::" + name + "' must be a scalar.");
            }
        }
        return values;
    }

    // A step value written as "{name}" without quotes is read by YAML as a
    // one-key mapping; it becomes a reference to that variable.
    template<>
    struct convert<StepValue> {
        static bool decode(const Node& node, StepValue& rhs) {
            if (node.IsNull()) {
                rhs = RawText{""};
                return true;
            }
            if (node.IsScalar()) {
                rhs = RawText{node.as<std::string>()};
                return true;
            }
            if (node.IsMap() && node.size() > 0) {
                rhs = SingleKeyReference{node.begin()->first.as<std::string>()};
                return true;
            }
            throw std::runtime_error("Step value must be a string.");
        }
    };

    template<>
    struct convert<PipelineEntry> {
        static bool decode(const Node& node, PipelineEntry& rhs) {
            if (!node.IsMap() || node.size() == 0) {
                throw std::runtime_error("Pipeline entries must be mappings like 'local: <command>'.");
            }
            rhs.clear();
            for (auto it = node.begin(); it != node.end(); ++it) {
                rhs.emplace_back(it->first.as<std::string>(), it->second.as<StepValue>());
            }
            return true;
        }
    };

    template<>
    struct convert<RemoteConfig> {
        static bool decode(const Node& node, RemoteConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("Configuration key 'remote' must be a mapping.");
            }
            static const std::set<std::string> valid_keys = {"ssh", "privilege", "staging_dir"};
            check_unknown_keys(node, valid_keys, "remote");

            if (node["ssh"]) {
                rhs.ssh_command = node["ssh"].as<std::string>();
            }
            if (node["privilege"]) {
                rhs.privilege = node["privilege"].IsNull() ? "" : node["privilege"].as<std::string>();
            }
            if (node["staging_dir"]) {
                rhs.staging_dir = node["staging_dir"].as<std::string>();
                if (rhs.staging_dir.empty() || rhs.staging_dir == "/" || rhs.staging_dir == ".") {
                    throw std::runtime_error("Invalid remote::staging_dir: '" + rhs.staging_dir + "'");
                }
            }
            return true;
        }
    };

    inline std::vector<PipelineEntry> parse_steps(const YAML::Node& node, const std::string& context) {
        std::vector<PipelineEntry> entries;
        if (!node || node.IsNull()) {
            return entries;
        }
        if (!node.IsSequence()) {
            throw std::runtime_error("Configuration key '" + context + "' must be a list of steps.");
        }
        for (const auto& item : node) {
            entries.push_back(item.as<PipelineEntry>());
        }
        return entries;
    }

}
