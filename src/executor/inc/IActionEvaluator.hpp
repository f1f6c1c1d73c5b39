#pragma once

#include "ExecutionContext.hpp"
#include <string>

// Embedded scripting runtime for interpreted steps. Both calls may read and
// write context.variables. Errors are reported as std::runtime_error,
// operator interrupts as CommandInterrupted.
class IActionEvaluator {
public:
    virtual ~IActionEvaluator() = default;

    // Runs code as a chunk of statements
    virtual void run(const std::string& code, ExecutionContext& context) = 0;

    // Evaluates an expression and returns its value as text
    virtual std::string evaluate(const std::string& expression, ExecutionContext& context) = 0;
};
