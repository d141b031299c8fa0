#include "lua_binding.hpp"

#include "dispatcher.hpp"

#include "../core/abi_error.hpp"
#include "../host/host_context.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace scriptscene::abi {

namespace {

// Integral results go back as Lua integers so ids print and compare cleanly.
sol::object to_lua(sol::state_view lua, double value) {
    if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.0e15) {
        return sol::make_object(lua, static_cast<lua_Integer>(value));
    }
    return sol::make_object(lua, value);
}

std::vector<double> to_numbers(const sol::variadic_args& va) {
    std::vector<double> out;
    out.reserve(va.size());
    for (auto v : va) {
        switch (v.get_type()) {
            case sol::type::number:
                out.push_back(v.as<double>());
                break;
            case sol::type::boolean:
                out.push_back(v.as<bool>() ? 1.0 : 0.0);
                break;
            default:
                out.push_back(std::numeric_limits<double>::quiet_NaN());
                break;
        }
    }
    return out;
}

host::Environment& environment_or_throw(host::HostContext& host, EnvironmentId env) {
    host::Environment* environment = host.environment(env);
    if (!environment) {
        throw AbiError(AbiErrorKind::InvalidState, "environment " + std::to_string(env) + " is unloaded");
    }
    return *environment;
}

std::uint32_t to_offset(double value) {
    if (!std::isfinite(value) || value < 0.0 || std::trunc(value) != value ||
        value > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
        throw AbiError(AbiErrorKind::DecodeError, "invalid guest offset " + std::to_string(value));
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

void bind_abi_table(sol::state& lua, const Dispatcher& dispatcher, host::HostContext& host, EnvironmentId env) {
    sol::table websg = lua.create_named_table("websg");

    for (const std::string& name : dispatcher.names()) {
        websg.set_function(name, [&dispatcher, &host, env, name](sol::variadic_args va, sol::this_state ts) {
            sol::state_view view(ts);
            host::Environment* environment = host.environment(env);
            if (!environment) {
                return to_lua(view, dispatcher.entry(name)->sentinel);
            }

            CallContext ctx(host, *environment);
            const AbiArgs args(to_numbers(va));
            return to_lua(view, dispatcher.call(name, ctx, args));
        });
    }
}

void bind_memory_table(sol::state& lua, host::HostContext& host, EnvironmentId env) {
    sol::table memory = lua.create_named_table("memory");
    const std::uint32_t maxString = host.config().memory.max_string_bytes;

    // Returns 0 when the heap cannot grow any further.
    memory.set_function("alloc", [&host, env](double size, sol::optional<double> align) {
        host::Environment& environment = environment_or_throw(host, env);
        return environment.memory.alloc(to_offset(size), align ? to_offset(*align) : 8u);
    });

    memory.set_function("size", [&host, env]() {
        return environment_or_throw(host, env).memory.size();
    });

    memory.set_function("read_u32", [&host, env, maxString](double ptr) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        return cursor.read_u32();
    });

    memory.set_function("write_u32", [&host, env, maxString](double ptr, double value) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        cursor.write_u32(to_offset(value));
    });

    memory.set_function("read_i32", [&host, env, maxString](double ptr) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        return cursor.read_i32();
    });

    memory.set_function("write_i32", [&host, env, maxString](double ptr, double value) {
        if (!std::isfinite(value) || std::trunc(value) != value ||
            value < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
            value > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
            throw AbiError(AbiErrorKind::DecodeError, "invalid i32 " + std::to_string(value));
        }
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        cursor.write_i32(static_cast<std::int32_t>(value));
    });

    memory.set_function("read_f32", [&host, env, maxString](double ptr) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        return static_cast<double>(cursor.read_f32());
    });

    memory.set_function("write_f32", [&host, env, maxString](double ptr, double value) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        cursor.move_to(to_offset(ptr));
        cursor.write_f32(static_cast<float>(value));
    });

    // Copies the string's bytes (no terminator) and returns their count.
    memory.set_function("write_string", [&host, env, maxString](double ptr, const std::string& value) {
        if (value.size() > maxString) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "string of " + std::to_string(value.size()) + " bytes exceeds limit");
        }
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        const auto length = static_cast<std::uint32_t>(value.size());
        auto bytes = cursor.mutable_bytes_at(to_offset(ptr), length);
        std::copy(value.begin(), value.end(), bytes.begin());
        return length;
    });

    memory.set_function("read_string", [&host, env, maxString](double ptr, double byteLength) {
        CursorView cursor = environment_or_throw(host, env).memory.cursor(maxString);
        return cursor.string_at(to_offset(ptr), to_offset(byteLength));
    });
}

} // namespace scriptscene::abi
