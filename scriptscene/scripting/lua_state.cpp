#include "lua_state.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>

namespace scriptscene::scripting {

namespace {

// ============================================================================
// Heap budget
// ============================================================================

struct HeapBudget {
    std::size_t allocated{0};
    std::size_t peak{0};
    std::size_t limit{0};

    bool admits(std::size_t growth) const {
        return limit == 0 || allocated + growth <= limit;
    }

    void grow(std::size_t bytes) {
        allocated += bytes;
        peak = std::max(peak, allocated);
    }

    // lua_Alloc. For a fresh block `osize` carries the object type, not a size.
    static void* alloc(void* ud, void* ptr, std::size_t osize, std::size_t nsize) {
        auto* budget = static_cast<HeapBudget*>(ud);

        if (nsize == 0) {
            if (ptr) {
                budget->allocated -= osize;
                std::free(ptr);
            }
            return nullptr;
        }

        const std::size_t held = ptr ? osize : 0;
        const std::size_t growth = nsize > held ? nsize - held : 0;
        if (!budget->admits(growth)) {
            return nullptr;
        }

        void* block = std::realloc(ptr, nsize);
        if (block) {
            budget->allocated -= held;
            budget->grow(nsize);
        }
        return block;
    }
};

// ============================================================================
// Call budget
// ============================================================================

// Address used as the registry key for the active budget.
char kCallBudgetKey = 0;

struct CallBudget {
    static constexpr int kHookInterval = 1000;

    std::size_t maxInstructions{0};
    double maxTimeSec{0.0};

    std::size_t used{0};
    std::chrono::steady_clock::time_point start;

    void reset() {
        used = 0;
        start = std::chrono::steady_clock::now();
    }

    static void hook(lua_State* L, lua_Debug*) {
        lua_rawgetp(L, LUA_REGISTRYINDEX, &kCallBudgetKey);
        auto* budget = static_cast<CallBudget*>(lua_touserdata(L, -1));
        lua_pop(L, 1);
        if (!budget) return;

        budget->used += kHookInterval;
        if (budget->maxInstructions > 0 && budget->used > budget->maxInstructions) {
            luaL_error(L, "instruction limit exceeded (%I)", static_cast<lua_Integer>(budget->maxInstructions));
        }

        if (budget->maxTimeSec > 0.0) {
            const double elapsed =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - budget->start).count();
            if (elapsed > budget->maxTimeSec) {
                luaL_error(L, "execution time limit exceeded (%f s)", static_cast<lua_Number>(budget->maxTimeSec));
            }
        }
    }
};

ScriptResult to_script_result(sol::protected_function_result result) {
    if (result.valid()) {
        return ScriptResult::ok();
    }
    sol::error err = result;
    return ScriptResult::fail(err.what());
}

} // namespace

const std::vector<std::string>& stripped_globals() {
    static const std::vector<std::string> names = {
        "os", "io", "debug", "package", "require",
        "load", "loadfile", "loadstring", "dofile",
        "collectgarbage",
        "rawget", "rawset", "rawequal", "setmetatable",
        "getfenv", "setfenv",
    };
    return names;
}

// ============================================================================
// LuaState
// ============================================================================

struct LuaState::Impl {
    HeapBudget heap;
    CallBudget budget;
    std::unique_ptr<sol::state> lua;
    bool limited{false};

    template <typename... Args>
    ScriptResult invoke(const std::string& funcName, Args&&... args) {
        if (limited) budget.reset();

        sol::protected_function func = (*lua)[funcName];
        if (!func.valid()) {
            return ScriptResult::fail("function '" + funcName + "' not found");
        }
        return to_script_result(func(std::forward<Args>(args)...));
    }
};

LuaState::LuaState() : impl_(std::make_unique<Impl>()) {}

LuaState::~LuaState() = default;

LuaState::LuaState(LuaState&&) noexcept = default;
LuaState& LuaState::operator=(LuaState&&) noexcept = default;

bool LuaState::init(std::size_t memoryLimitBytes) {
    impl_->heap.limit = memoryLimitBytes;
    impl_->lua = std::make_unique<sol::state>(sol::default_at_panic, HeapBudget::alloc, &impl_->heap);
    if (!impl_->lua->lua_state()) {
        return false;
    }

    impl_->lua->open_libraries(
        sol::lib::base,
        sol::lib::coroutine,
        sol::lib::string,
        sol::lib::table,
        sol::lib::math,
        sol::lib::utf8
    );
    return true;
}

void LuaState::apply_sandbox(const ScriptLimits& limits) {
    sol::state& lua = *impl_->lua;
    for (const std::string& name : stripped_globals()) {
        lua[name] = sol::lua_nil;
    }

    // Silent until the host installs a print handler
    lua["print"] = [](sol::variadic_args) {};

    impl_->budget.maxInstructions = limits.maxInstructions;
    impl_->budget.maxTimeSec = limits.maxExecutionTimeSec;
    impl_->limited = true;

    lua_State* L = lua.lua_state();
    lua_pushlightuserdata(L, &impl_->budget);
    lua_rawsetp(L, LUA_REGISTRYINDEX, &kCallBudgetKey);
    lua_sethook(L, CallBudget::hook, LUA_MASKCOUNT, CallBudget::kHookInterval);

    sandboxed_ = true;
}

ScriptResult LuaState::execute(const std::string& script, const std::string& chunkName) {
    if (impl_->limited) impl_->budget.reset();
    return to_script_result(impl_->lua->safe_script(script, sol::script_pass_on_error, chunkName));
}

ScriptResult LuaState::load(const std::string& script, const std::string& chunkName) {
    sol::load_result chunk = impl_->lua->load(script, chunkName);
    if (!chunk.valid()) {
        sol::error err = chunk;
        return ScriptResult::fail(err.what());
    }
    return ScriptResult::ok();
}

ScriptResult LuaState::call(const std::string& funcName) {
    return impl_->invoke(funcName);
}

ScriptResult LuaState::call(const std::string& funcName, float arg1) {
    return impl_->invoke(funcName, arg1);
}

bool LuaState::has_function(const std::string& funcName) const {
    sol::object obj = (*impl_->lua)[funcName];
    return obj.is<sol::function>();
}

sol::state& LuaState::state() {
    return *impl_->lua;
}

const sol::state& LuaState::state() const {
    return *impl_->lua;
}

std::size_t LuaState::memory_used() const {
    return impl_->heap.allocated;
}

std::size_t LuaState::peak_memory() const {
    return impl_->heap.peak;
}

std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits) {
    auto state = std::make_unique<LuaState>();
    if (!state->init(limits.maxMemoryBytes)) {
        return nullptr;
    }
    state->apply_sandbox(limits);
    return state;
}

} // namespace scriptscene::scripting
