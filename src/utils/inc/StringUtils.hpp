#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <locale>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    // Split on any run of whitespace, dropping empty fields
    static std::vector<std::string> split_whitespace(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // POSIX shell quoting: safe words pass through, everything else is single-quoted
    static std::string shell_quote(const std::string& str);
};
