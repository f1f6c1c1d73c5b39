#include "VariableResolver.hpp"
#include "CommandErrors.hpp"

VariableMap VariableResolver::substitution_context(const ExecutionContext& context) {
    VariableMap values = context.variables;
    for (const auto& [name, value] : context.constants) {
        values[CONSTANT_PREFIX + name] = value;
    }
    return values;
}

std::string VariableResolver::resolve(const std::string& value_template, const ExecutionContext& context) {
    return render(value_template, substitution_context(context));
}

std::string VariableResolver::render(const std::string& value_template, const VariableMap& values) {
    std::string result;
    result.reserve(value_template.size());

    size_t pos = 0;
    while (pos < value_template.size()) {
        char ch = value_template[pos];

        if (ch == '}') {
            if (pos + 1 < value_template.size() && value_template[pos + 1] == '}') {
                result += '}';
                pos += 2;
                continue;
            }
            throw UnresolvedVariable("", "Single '}' encountered in command template: " + value_template);
        }

        if (ch != '{') {
            result += ch;
            ++pos;
            continue;
        }

        if (pos + 1 < value_template.size() && value_template[pos + 1] == '{') {
            result += '{';
            pos += 2;
            continue;
        }

        size_t close = value_template.find('}', pos + 1);
        if (close == std::string::npos) {
            throw UnresolvedVariable("", "Single '{' encountered in command template: " + value_template);
        }

        std::string name = value_template.substr(pos + 1, close - pos - 1);
        auto it = values.find(name);
        if (it == values.end()) {
            throw UnresolvedVariable(name);
        }
        result += it->second;
        pos = close + 1;
    }

    return result;
}
