#pragma once

#include "IActionEvaluator.hpp"
#include <lua.hpp>
#include <string>

// One Lua state per pipeline run, so globals defined by one step are visible to later ones.
// Scripts see the run variables as the table `vars` and the configured hosts as `systems`.
class LuaActionEvaluator : public IActionEvaluator {
public:
    LuaActionEvaluator();
    ~LuaActionEvaluator();

    LuaActionEvaluator(const LuaActionEvaluator&) = delete;
    LuaActionEvaluator& operator=(const LuaActionEvaluator&) = delete;

    void run(const std::string& code, ExecutionContext& context) override;
    std::string evaluate(const std::string& expression, ExecutionContext& context) override;

private:
    lua_State* lua_vm_ = nullptr;

    void load(const std::string& chunk);
    void call(int results);
    void push_context(const ExecutionContext& context);
    void pull_variables(ExecutionContext& context);
    std::string value_to_string(int index);
};
