#pragma once

#include "IPrompter.hpp"
#include <iostream>

// Reads one answer line per question. Empty, unknown or unreadable answers
// select the default option.
class ConsolePrompter : public IPrompter {
public:
    explicit ConsolePrompter(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    char choose(const std::string& question,
                const std::vector<PromptOption>& options,
                char default_key) override;

private:
    std::istream& in_;
    std::ostream& out_;
};
