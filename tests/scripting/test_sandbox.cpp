/**
 * @file test_sandbox.cpp
 * @brief Sandboxed Lua states: removed globals, limits, validation.
 */

#include <catch2/catch_test_macros.hpp>

#include "scriptscene/scripting/sandbox.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <string>
#include <vector>

using namespace scriptscene;
using namespace scriptscene::scripting;

TEST_CASE("Sandboxed state removes dangerous globals", "[scripting][sandbox]") {
    SandboxConfig cfg;
    auto state = Sandbox::create(cfg);
    REQUIRE(state != nullptr);
    REQUIRE(state->is_sandboxed());

    for (const std::string& name : Sandbox::forbidden_functions()) {
        INFO(name);
        sol::object value = state->state()[name];
        REQUIRE_FALSE(value.valid());
    }

    SECTION("safe libraries stay") {
        REQUIRE(state->execute("x = math.floor(2.5) + #string.rep('a', 3) + #table.pack(1, 2)"));
        REQUIRE(state->state()["x"].get<int>() == 7);
    }

    SECTION("using a removed global fails at run time") {
        const ScriptResult result = state->execute("os.exit(1)");
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(result.error.empty());
    }
}

TEST_CASE("Instruction limit stops runaway code", "[scripting][sandbox]") {
    SandboxConfig cfg;
    cfg.maxInstructionsPerCall = 100000;
    cfg.maxExecutionTimeSec = 0.0;
    auto state = Sandbox::create(cfg);
    REQUIRE(state != nullptr);

    SECTION("in the chunk") {
        const ScriptResult result = state->execute("local n = 0 while true do n = n + 1 end");
        REQUIRE_FALSE(result);
        REQUIRE(result.error.find("instruction limit exceeded") != std::string::npos);
    }

    SECTION("the budget resets for every call") {
        REQUIRE(state->execute("function step() local n = 0 for i = 1, 1000 do n = n + i end return n end"));
        for (int i = 0; i < 200; ++i) {
            REQUIRE(state->call("step"));
        }
    }

    SECTION("in a hook") {
        REQUIRE(state->execute("function spin() while true do end end"));
        const ScriptResult result = state->call("spin");
        REQUIRE_FALSE(result);
        REQUIRE(result.error.find("instruction limit exceeded") != std::string::npos);
    }
}

TEST_CASE("Memory limit refuses large allocations", "[scripting][sandbox]") {
    SandboxConfig cfg;
    cfg.maxMemoryMB = 1;
    auto state = Sandbox::create(cfg);
    REQUIRE(state != nullptr);

    const ScriptResult result = state->execute("big = string.rep('x', 4 * 1024 * 1024)");
    REQUIRE_FALSE(result);
    REQUIRE(state->memory_used() < 1024 * 1024);
    REQUIRE(state->peak_memory() >= state->memory_used());
    REQUIRE(state->peak_memory() <= 1024 * 1024);
}

TEST_CASE("Print handler joins arguments with tabs", "[scripting][sandbox]") {
    std::vector<std::string> printed;
    SandboxConfig cfg;
    cfg.printHandler = [&](const std::string& line) { printed.push_back(line); };

    auto state = Sandbox::create(cfg);
    REQUIRE(state != nullptr);
    REQUIRE(state->execute("print('ready', 3, true) log('via log')"));

    REQUIRE(printed.size() == 2);
    REQUIRE(printed[0] == "ready\t3\ttrue");
    REQUIRE(printed[1] == "via log");
}

TEST_CASE("Script validation", "[scripting][sandbox]") {
    SECTION("plain script") {
        const ValidationResult result = Sandbox::validate_script("local t = {} function on_init() t[1] = 1 end");
        REQUIRE(result);
        REQUIRE(result.errors.empty());
    }

    SECTION("syntax error") {
        const ValidationResult result = Sandbox::validate_script("function broken(");
        REQUIRE_FALSE(result);
        REQUIRE(result.errors.size() == 1);
    }

    SECTION("forbidden calls") {
        const ValidationResult result = Sandbox::validate_script("local f = io.open('x') require('y')");
        REQUIRE_FALSE(result);
        REQUIRE(result.errors.size() == 2);
    }

    SECTION("names that only contain a forbidden word") {
        REQUIRE(Sandbox::check_forbidden_calls("local position = 1 reload(position)"));
    }

    SECTION("bytecode") {
        REQUIRE_FALSE(Sandbox::check_forbidden_calls(std::string("\x1bLua") + "T"));
    }

    SECTION("endless loop is only a warning") {
        const ValidationResult result = Sandbox::validate_script("function f() while true do break end end");
        REQUIRE(result);
        REQUIRE(result.warnings.size() == 1);
    }
}
