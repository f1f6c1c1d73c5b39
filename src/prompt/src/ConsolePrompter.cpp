#include "ConsolePrompter.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <string>

std::string format_question(const std::string& question,
                            const std::vector<PromptOption>& options,
                            char default_key) {
    std::string text = question + " (";
    for (size_t i = 0; i < options.size(); ++i) {
        if (i > 0) text += ", ";
        text += options[i].key;
        text += ": " + options[i].description;
        if (options[i].key == default_key) text += " (default)";
    }
    text += ") ";
    return text;
}

char ConsolePrompter::choose(const std::string& question,
                             const std::vector<PromptOption>& options,
                             char default_key) {
    out_ << format_question(question, options, default_key) << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        LogUtils::debug("No answer available, using default '{}'", default_key);
        return default_key;
    }

    StringUtils::trim(answer);
    if (answer.size() != 1) {
        return default_key;
    }

    auto it = std::find_if(options.begin(), options.end(),
        [&answer](const PromptOption& option) { return option.key == answer[0]; });
    return it != options.end() ? it->key : default_key;
}
