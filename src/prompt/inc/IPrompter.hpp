#pragma once

#include <string>
#include <vector>

struct PromptOption {
    char key;
    std::string description;
};

// Blocking operator interaction: returns the key of the chosen option
class IPrompter {
public:
    virtual ~IPrompter() = default;
    virtual char choose(const std::string& question,
                        const std::vector<PromptOption>& options,
                        char default_key) = 0;
};

// "Proceed? (p: proceed (default), s: skip, a: abort) "
std::string format_question(const std::string& question,
                            const std::vector<PromptOption>& options,
                            char default_key);
