/**
 * @file test_dispatcher.cpp
 * @brief Name table, error sentinels and argument checking.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/host_fixture.hpp"

#include <limits>
#include <stdexcept>

using namespace scriptscene;
using namespace scriptscene::abi;
using namespace test_helpers;

namespace {

struct DispatchFixture {
    core::HostConfig config{make_test_config()};
    host::HostContext host{config};
    host::Environment& env{host.create_environment("guest")};
    Dispatcher dispatcher;

    double call(std::string_view name, AbiArgs args = {}) {
        CallContext ctx(host, env);
        return dispatcher.call(name, ctx, args);
    }
};

Handler throwing(AbiErrorKind kind) {
    return [kind](CallContext&, const AbiArgs&) -> double {
        throw AbiError(kind, "refused");
    };
}

} // namespace

TEST_CASE("Sentinels follow the return kind", "[abi][dispatcher]") {
    DispatchFixture f;
    f.dispatcher.add("id", ReturnKind::Id, throwing(AbiErrorKind::NotFound));
    f.dispatcher.add("status", ReturnKind::Status, throwing(AbiErrorKind::NotFound));
    f.dispatcher.add("count", ReturnKind::Count, throwing(AbiErrorKind::NotFound));
    f.dispatcher.add("flag", ReturnKind::Flag, throwing(AbiErrorKind::NotFound));
    f.dispatcher.add("scalar", ReturnKind::Scalar, throwing(AbiErrorKind::NotFound));
    f.dispatcher.add("mode", ReturnKind::Scalar, 0.0, throwing(AbiErrorKind::NotFound));

    REQUIRE(f.call("id") == 0.0);
    REQUIRE(f.call("status") == -1.0);
    REQUIRE(f.call("count") == -1.0);
    REQUIRE(f.call("flag") == 0.0);
    REQUIRE(f.call("scalar") == -1.0);
    REQUIRE(f.call("mode") == 0.0);
}

TEST_CASE("Handler results pass through", "[abi][dispatcher]") {
    DispatchFixture f;
    f.dispatcher.add("sum", ReturnKind::Scalar, [](CallContext&, const AbiArgs& a) {
        return static_cast<double>(a.f32(0) + a.f32(1));
    });

    REQUIRE(f.call("sum", {1.5, 2.0}) == 3.5);
    REQUIRE(f.dispatcher.contains("sum"));
    REQUIRE_FALSE(f.dispatcher.contains("product"));
}

TEST_CASE("Failures are logged under the abi tag", "[abi][dispatcher]") {
    DispatchFixture f;
    LogCapture log;

    SECTION("unknown name") {
        REQUIRE(f.call("no_such_function") == -1.0);
        REQUIRE(log.contains("abi", "no_such_function"));
        REQUIRE(log.lines().back().level == LogLevel::Error);
    }

    SECTION("access error names the kind and the caller") {
        f.dispatcher.add("locked", ReturnKind::Status, throwing(AbiErrorKind::NotAuthorized));
        REQUIRE(f.call("locked") == -1.0);
        REQUIRE(log.contains("abi", "[locked] not-authorized"));
        REQUIRE(log.contains("abi", "'guest'"));
        REQUIRE(log.lines().back().level == LogLevel::Warning);
    }

    SECTION("collaborator exception") {
        f.dispatcher.add("broken", ReturnKind::Id, [](CallContext&, const AbiArgs&) -> double {
            throw std::runtime_error("backend offline");
        });
        REQUIRE(f.call("broken") == 0.0);
        REQUIRE(log.contains("abi", "host error: backend offline"));
    }
}

TEST_CASE("Argument checking", "[abi][dispatcher]") {
    DispatchFixture f;
    LogCapture log;
    f.dispatcher.add("take_u32", ReturnKind::Scalar, [](CallContext&, const AbiArgs& a) {
        return static_cast<double>(a.u32(0));
    });
    f.dispatcher.add("take_f32", ReturnKind::Scalar, [](CallContext&, const AbiArgs& a) {
        return static_cast<double>(a.f32(0));
    });

    SECTION("missing argument") {
        REQUIRE(f.call("take_u32") == -1.0);
        REQUIRE(log.contains("abi", "decode-error"));
    }

    SECTION("fractional, negative and out-of-range integers") {
        REQUIRE(f.call("take_u32", {1.5}) == -1.0);
        REQUIRE(f.call("take_u32", {-1.0}) == -1.0);
        REQUIRE(f.call("take_u32", {4294967296.0}) == -1.0);
        REQUIRE(f.call("take_u32", {4294967295.0}) == 4294967295.0);
    }

    SECTION("NaN float") {
        REQUIRE(f.call("take_f32", {std::numeric_limits<double>::quiet_NaN()}) == -1.0);
        REQUIRE(f.call("take_f32", {0.25}) == 0.25);
    }
}

TEST_CASE("register_all installs the whole table", "[abi][dispatcher]") {
    Dispatcher d;
    register_all(d);

    for (const char* name : {"world_create_node", "world_create_scene", "scene_get_nodes", "node_get_children",
                             "world_create_mesh", "world_create_box_mesh", "accessor_update_with",
                             "world_create_material", "world_create_texture_from", "create_light",
                             "create_collider", "add_physics_body", "add_interactable", "create_ui_canvas",
                             "create_ui_button", "node_start_orbit", "stop_orbit", "world_dispose_resource"}) {
        INFO(name);
        REQUIRE(d.contains(name));
    }

    REQUIRE(d.entry("world_create_node")->kind == ReturnKind::Id);
    REQUIRE(d.entry("scene_get_node_count")->kind == ReturnKind::Count);
    REQUIRE(d.entry("node_get_visible")->kind == ReturnKind::Flag);
    REQUIRE(d.entry("mesh_get_primitive_mode")->sentinel == 0.0);
}
