#include "LuaActionEvaluator.hpp"
#include "CommandErrors.hpp"
#include "SignalManager.hpp"
#include <stdexcept>

namespace {

const char* const VARS_TABLE = "vars";
const char* const SYSTEMS_TABLE = "systems";
const int HOOK_INSTRUCTION_COUNT = 1000;

void interrupt_hook(lua_State* L, lua_Debug*) {
    if (SignalManager::interrupt_pending()) {
        luaL_error(L, "interrupted");
    }
}

void push_table(lua_State* L, const VariableMap& values) {
    lua_newtable(L);
    for (const auto& [name, value] : values) {
        lua_pushlstring(L, name.data(), name.size());
        lua_pushlstring(L, value.data(), value.size());
        lua_settable(L, -3);
    }
}

}

LuaActionEvaluator::LuaActionEvaluator() {
    lua_vm_ = luaL_newstate();
    if (!lua_vm_) throw std::runtime_error("Failed to create Lua state");

    luaL_openlibs(lua_vm_);

    // The interrupt hook is not called from compiled traces
    luaJIT_setmode(lua_vm_, 0, LUAJIT_MODE_ENGINE | LUAJIT_MODE_OFF);
}

LuaActionEvaluator::~LuaActionEvaluator() {
    if (lua_vm_) {
        lua_close(lua_vm_);
    }
}

void LuaActionEvaluator::run(const std::string& code, ExecutionContext& context) {
    push_context(context);
    load(code);
    call(0);
    pull_variables(context);
}

std::string LuaActionEvaluator::evaluate(const std::string& expression, ExecutionContext& context) {
    push_context(context);
    load("return " + expression);
    call(1);

    if (lua_isnil(lua_vm_, -1)) {
        lua_pop(lua_vm_, 1);
        pull_variables(context);
        throw std::runtime_error("Expression returned nil: " + expression);
    }

    std::string result;
    try {
        result = value_to_string(-1);
    } catch (const std::runtime_error&) {
        lua_pop(lua_vm_, 1);
        throw;
    }
    lua_pop(lua_vm_, 1);
    pull_variables(context);
    return result;
}

void LuaActionEvaluator::load(const std::string& chunk) {
    if (luaL_loadstring(lua_vm_, chunk.c_str()) != 0) {
        const char* message = lua_tostring(lua_vm_, -1);
        std::string err = message ? message : "unknown error";
        lua_pop(lua_vm_, 1);
        throw std::runtime_error("Compile error: " + err);
    }
}

void LuaActionEvaluator::call(int results) {
    SignalManager::InterruptGuard guard;
    lua_sethook(lua_vm_, interrupt_hook, LUA_MASKCOUNT, HOOK_INSTRUCTION_COUNT);
    int rc = lua_pcall(lua_vm_, 0, results, 0);
    lua_sethook(lua_vm_, nullptr, 0, 0);

    if (rc != 0) {
        const char* message = lua_tostring(lua_vm_, -1);
        std::string err = message ? message : "unknown error";
        lua_pop(lua_vm_, 1);
        if (guard.triggered()) {
            throw CommandInterrupted();
        }
        throw std::runtime_error("Runtime error: " + err);
    }
}

void LuaActionEvaluator::push_context(const ExecutionContext& context) {
    push_table(lua_vm_, context.variables);
    lua_setglobal(lua_vm_, VARS_TABLE);
    push_table(lua_vm_, context.systems);
    lua_setglobal(lua_vm_, SYSTEMS_TABLE);
}

// Replaces the run variables with the string, number and boolean entries of `vars`
void LuaActionEvaluator::pull_variables(ExecutionContext& context) {
    lua_getglobal(lua_vm_, VARS_TABLE);
    if (!lua_istable(lua_vm_, -1)) {
        lua_pop(lua_vm_, 1);
        throw std::runtime_error("Global 'vars' is no longer a table");
    }

    VariableMap variables;
    lua_pushnil(lua_vm_);
    while (lua_next(lua_vm_, -2) != 0) {
        int value_type = lua_type(lua_vm_, -1);
        if (lua_type(lua_vm_, -2) == LUA_TSTRING &&
            (value_type == LUA_TSTRING || value_type == LUA_TNUMBER || value_type == LUA_TBOOLEAN)) {
            size_t len = 0;
            const char* name = lua_tolstring(lua_vm_, -2, &len);
            variables[std::string(name, len)] = value_to_string(-1);
        }
        lua_pop(lua_vm_, 1);
    }
    lua_pop(lua_vm_, 1);

    context.variables = std::move(variables);
}

std::string LuaActionEvaluator::value_to_string(int index) {
    switch (lua_type(lua_vm_, index)) {
        case LUA_TBOOLEAN:
            return lua_toboolean(lua_vm_, index) ? "true" : "false";
        case LUA_TSTRING:
        case LUA_TNUMBER: {
            // Convert a copy so numeric keys seen by lua_next stay untouched
            lua_pushvalue(lua_vm_, index);
            size_t len = 0;
            const char* text = lua_tolstring(lua_vm_, -1, &len);
            std::string value(text, len);
            lua_pop(lua_vm_, 1);
            return value;
        }
        default:
            throw std::runtime_error(std::string("Invalid return type: ") +
                                     lua_typename(lua_vm_, lua_type(lua_vm_, index)));
    }
}
