#include "sandbox.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <regex>
#include <sstream>

namespace scriptscene::scripting {

namespace {

// Joins print() arguments with tabs, converted through the guest's own tostring.
std::string join_print_args(sol::variadic_args va, sol::this_state ts) {
    sol::state_view lua(ts);
    sol::protected_function tostring = lua["tostring"];

    std::ostringstream oss;
    bool first = true;
    for (auto v : va) {
        if (!first) oss << '\t';
        first = false;

        if (!tostring.valid()) continue;
        sol::protected_function_result text = tostring(v);
        if (text.valid()) {
            oss << text.get<std::string>();
        }
    }
    return oss.str();
}

void merge(ValidationResult& into, const ValidationResult& from) {
    if (!from.valid) into.valid = false;
    into.errors.insert(into.errors.end(), from.errors.begin(), from.errors.end());
    into.warnings.insert(into.warnings.end(), from.warnings.begin(), from.warnings.end());
}

} // namespace

ValidationResult Sandbox::validate_script(const std::string& script) {
    ValidationResult result;
    result.valid = true;

    // Compiled in a throwaway state; nothing runs
    auto state = create_sandboxed_state();
    if (!state) {
        result.valid = false;
        result.errors.push_back("Failed to create Lua state");
        return result;
    }

    auto compiled = state->load(script);
    if (!compiled) {
        result.valid = false;
        result.errors.push_back(compiled.error);
        return result;
    }

    merge(result, check_forbidden_calls(script));
    return result;
}

ValidationResult Sandbox::check_forbidden_calls(const std::string& script) {
    ValidationResult result;
    result.valid = true;

    for (const auto& name : stripped_globals()) {
        // Member access or call on the bare global name
        const std::regex use("\\b" + name + "\\s*[.:(]");
        if (std::regex_search(script, use)) {
            result.valid = false;
            result.errors.push_back("Forbidden function/module used: " + name);
        }
    }

    // Precompiled chunks start with ESC "Lua"
    if (script.find("\x1bLua") != std::string::npos ||
        script.find("\\27Lua") != std::string::npos) {
        result.valid = false;
        result.errors.push_back("Potential bytecode detected");
    }

    if (script.find("while true do") != std::string::npos) {
        result.warnings.push_back("Infinite loop detected - ensure proper exit condition");
    }

    return result;
}

std::unique_ptr<LuaState> Sandbox::create(const SandboxConfig& config) {
    auto state = create_sandboxed_state(config.to_script_limits());
    if (!state || !config.printHandler) {
        return state;
    }

    auto handler = config.printHandler;
    sol::state& lua = state->state();
    lua.set_function("print", [handler](sol::variadic_args va, sol::this_state ts) {
        handler(join_print_args(va, ts));
    });
    sol::object print = lua["print"];
    lua["log"] = print;

    return state;
}

const std::vector<std::string>& Sandbox::forbidden_functions() {
    return stripped_globals();
}

} // namespace scriptscene::scripting
