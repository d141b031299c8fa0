#pragma once

#include "abi_args.hpp"
#include "call_context.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace scriptscene::abi {

// What an entry returns, which fixes its error sentinel.
enum class ReturnKind : std::uint8_t {
    Id,      // resource id, 0 on error
    Status,  // 0 ok, -1 on error
    Count,   // non-negative count, -1 on error
    Flag,    // 0/1, 0 on error
    Scalar,  // value; sentinel given per entry
};

inline double default_sentinel(ReturnKind kind) {
    switch (kind) {
        case ReturnKind::Id: return 0.0;
        case ReturnKind::Status: return -1.0;
        case ReturnKind::Count: return -1.0;
        case ReturnKind::Flag: return 0.0;
        case ReturnKind::Scalar: return -1.0;
    }
    return -1.0;
}

using Handler = std::function<double(CallContext&, const AbiArgs&)>;

struct Entry {
    Handler handler;
    ReturnKind kind{ReturnKind::Status};
    double sentinel{-1.0};
};

// =============================================================================
// Dispatcher - name -> handler table
// =============================================================================
//
// Errors never cross into the guest: an AbiError (or any std::exception from a
// collaborator) raised by a handler is logged under the "abi" tag and the
// entry's sentinel is returned instead.

class Dispatcher {
public:
    void add(std::string name, ReturnKind kind, Handler handler);
    void add(std::string name, ReturnKind kind, double sentinel, Handler handler);

    bool contains(std::string_view name) const;
    const Entry* entry(std::string_view name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return entries_.size(); }

    double call(std::string_view name, CallContext& ctx, const AbiArgs& args) const;

private:
    std::map<std::string, Entry, std::less<>> entries_;
};

// Every handler family, in one table.
void register_all(Dispatcher& dispatcher);

void register_world_scene(Dispatcher& dispatcher);
void register_node(Dispatcher& dispatcher);
void register_mesh_accessor(Dispatcher& dispatcher);
void register_material_texture_light(Dispatcher& dispatcher);
void register_interaction_physics(Dispatcher& dispatcher);
void register_ui(Dispatcher& dispatcher);

} // namespace scriptscene::abi
