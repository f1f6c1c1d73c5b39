#pragma once

#include "StepValue.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// One decoded pipeline entry. Entries are expected to hold a single pair.
using PipelineEntry = std::vector<std::pair<std::string, StepValue>>;

struct AssignmentKey {
    bool assignment = false;
    std::string variable;
    std::string key;
};

// "name=local" -> {true, "name", "local"}, "local" -> {false, "", "local"}
AssignmentKey split_assignment_key(const std::string& key);

struct Step {
    std::string original_key;        // Key as written, e.g. "result=remote@web1"
    bool assignment = false;         // Output is captured into a variable
    std::string assignment_variable; // Capture target, empty without assignment
    std::string key;                 // Key without the assignment prefix
    std::string value_template;      // Unresolved command text
    size_t index = 0;                // 1-based pipeline position

    Step() = default;

    // Built from the first pair of the entry, further pairs are ignored
    Step(const PipelineEntry& entry, size_t index);
};
