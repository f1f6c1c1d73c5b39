#include "Step.hpp"
#include <stdexcept>

AssignmentKey split_assignment_key(const std::string& key) {
    size_t pos = key.rfind('=');
    if (pos == std::string::npos) {
        return AssignmentKey{false, "", key};
    }
    return AssignmentKey{true, key.substr(0, pos), key.substr(pos + 1)};
}

Step::Step(const PipelineEntry& entry, size_t index) : index(index) {
    if (entry.empty()) {
        throw std::runtime_error("Pipeline entry " + std::to_string(index) + " is empty");
    }

    const auto& [raw_key, value] = entry.front();
    original_key = raw_key;

    auto split = split_assignment_key(raw_key);
    assignment = split.assignment;
    assignment_variable = split.variable;
    key = split.key;

    value_template = to_template(value);
}
