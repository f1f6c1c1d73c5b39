#pragma once

#include "ExecutionContext.hpp"
#include <string>

class VariableResolver {
public:
    // Variables plus constants under their const_ names. A variable named like a
    // constant is shadowed by the constant.
    static VariableMap substitution_context(const ExecutionContext& context);

    // Single pass rendering of {name} placeholders, {{ and }} are literal braces.
    // Substituted values are not scanned again. Throws UnresolvedVariable.
    static std::string resolve(const std::string& value_template, const ExecutionContext& context);
    static std::string render(const std::string& value_template, const VariableMap& values);
};
