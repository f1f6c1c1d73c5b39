#pragma once

#include <cstddef>
#include <set>
#include <string>

// Restricts which pipeline steps run: "1,3" runs only steps 1 and 3,
// "e2,4" runs every step except 2 and 4, an empty string runs everything.
struct StepSelection {
    enum class Mode {
        All,
        Include,
        Exclude
    };

    Mode mode = Mode::All;
    std::set<size_t> indices;

    bool selects(size_t index) const;

    static StepSelection parse(const std::string& text);
};
