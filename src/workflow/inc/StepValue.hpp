#pragma once

#include <string>
#include <variant>

// Plain command text as written in the pipeline file
struct RawText {
    std::string text;
};

// A step value that was decoded as a mapping: only its first key is kept and
// the step runs the value of the variable with that name.
struct SingleKeyReference {
    std::string name;
};

using StepValue = std::variant<RawText, SingleKeyReference>;

inline std::string to_template(const StepValue& value) {
    if (const auto* reference = std::get_if<SingleKeyReference>(&value)) {
        return "{" + reference->name + "}";
    }
    return std::get<RawText>(value).text;
}
