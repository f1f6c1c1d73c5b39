#include "StringUtils.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

void test_trim() {
    std::string text = "  echo hi \n";
    StringUtils::trim(text);
    assert(text == "echo hi");
    assert(StringUtils::trimmed("\t\t") == "");
    assert(StringUtils::trimmed("a") == "a");
    std::cout << "test_trim passed\n";
}

void test_to_lower() {
    assert(StringUtils::to_lower("RELEASE_Dir") == "release_dir");
    std::cout << "test_to_lower passed\n";
}

void test_split_whitespace() {
    auto fields = StringUtils::split_whitespace("  1234\n5678  \t91\n");
    assert((fields == std::vector<std::string>{"1234", "5678", "91"}));
    assert(StringUtils::split_whitespace("").empty());
    assert(StringUtils::split_whitespace(" \n ").empty());
    std::cout << "test_split_whitespace passed\n";
}

void test_split() {
    assert((StringUtils::split("1,3,5", ',') == std::vector<std::string>{"1", "3", "5"}));
    assert((StringUtils::split("1,,2", ',') == std::vector<std::string>{"1", "", "2"}));
    assert((StringUtils::split("1,", ',') == std::vector<std::string>{"1", ""}));
    assert(StringUtils::split("", ',').empty());
    std::cout << "test_split passed\n";
}

void test_shell_quote() {
    assert(StringUtils::shell_quote("") == "''");
    assert(StringUtils::shell_quote("web1.example.org") == "web1.example.org");
    assert(StringUtils::shell_quote("/srv/app-1/run.sh") == "/srv/app-1/run.sh");
    assert(StringUtils::shell_quote("echo hi") == "'echo hi'");
    assert(StringUtils::shell_quote("it's") == "'it'\"'\"'s'");
    assert(StringUtils::shell_quote("$HOME") == "'$HOME'");
    std::cout << "test_shell_quote passed\n";
}

int main() {
    test_trim();
    test_to_lower();
    test_split_whitespace();
    test_split();
    test_shell_quote();

    std::cout << "All StringUtils tests passed!\n";
    return 0;
}
