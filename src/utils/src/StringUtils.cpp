#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trimmed(const std::string& str) {
    std::string copy = str;
    trim(copy);
    return copy;
}

std::vector<std::string> StringUtils::split_whitespace(const std::string& str) {
    std::vector<std::string> fields;
    std::istringstream iss(str);
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(str);
    while (std::getline(iss, field, delimiter)) {
        fields.push_back(field);
    }
    if (!str.empty() && str.back() == delimiter) {
        fields.emplace_back();
    }
    return fields;
}

std::string StringUtils::shell_quote(const std::string& str) {
    if (str.empty()) {
        return "''";
    }

    bool safe = std::all_of(str.begin(), str.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_' || ch == '@' || ch == '%' || ch == '+' ||
               ch == '=' || ch == ':' || ch == ',' || ch == '.' || ch == '/' || ch == '-';
    });
    if (safe) {
        return str;
    }

    std::string quoted = "'";
    for (char ch : str) {
        if (ch == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}
