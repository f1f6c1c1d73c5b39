#include "StepSelection.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

bool StepSelection::selects(size_t index) const {
    switch (mode) {
        case Mode::Include: return indices.count(index) > 0;
        case Mode::Exclude: return indices.count(index) == 0;
        default:            return true;
    }
}

StepSelection StepSelection::parse(const std::string& text) {
    StepSelection selection;
    std::string list = StringUtils::trimmed(text);
    if (list.empty()) {
        return selection;
    }

    selection.mode = Mode::Include;
    if (list.front() == 'e') {
        selection.mode = Mode::Exclude;
        list.erase(0, 1);
    }
    if (list.empty()) {
        throw std::runtime_error("Invalid step selection: " + text);
    }

    for (auto item : StringUtils::split(list, ',')) {
        StringUtils::trim(item);
        if (item.empty()) {
            throw std::runtime_error("Invalid step selection: " + text);
        }
        size_t consumed = 0;
        unsigned long value = 0;
        try {
            value = std::stoul(item, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid step index '" + item + "' in step selection: " + text);
        }
        if (consumed != item.size() || value == 0) {
            throw std::runtime_error("Invalid step index '" + item + "' in step selection: " + text);
        }
        selection.indices.insert(static_cast<size_t>(value));
    }
    return selection;
}
