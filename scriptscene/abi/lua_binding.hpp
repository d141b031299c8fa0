#pragma once

#include "../core/types.hpp"

namespace sol {
class state;
}

namespace scriptscene::host {
class HostContext;
}

namespace scriptscene::abi {

class Dispatcher;

// Installs the global `websg` table: one Lua function per dispatcher entry.
// Each call resolves environment `env` afresh, so a function invoked after the
// environment is unloaded returns the entry's sentinel.
void bind_abi_table(sol::state& lua, const Dispatcher& dispatcher, host::HostContext& host, EnvironmentId env);

// Installs the global `memory` table over the environment's guest heap. Out of
// range accesses raise a Lua error in the calling script.
void bind_memory_table(sol::state& lua, host::HostContext& host, EnvironmentId env);

} // namespace scriptscene::abi
