/**
 * @file test_scene_node_handlers.cpp
 * @brief Scene and node entries through the dispatcher.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/host_fixture.hpp"

#include <array>

using namespace scriptscene;
using namespace test_helpers;
namespace res = scriptscene::resource;

TEST_CASE("Access follows grants", "[abi][node]") {
    TwoEnvFixture f;
    const ResourceId node = f.create_node(f.a, "door");
    REQUIRE(node != 0);
    REQUIRE(f.call(f.a, "node_set_visible", {double(node), 0.0}) == 0.0);

    SECTION("other environment is refused until granted") {
        REQUIRE(f.call(f.b, "node_set_visible", {double(node), 1.0}) == -1.0);
        REQUIRE(f.call(f.a, "node_get_visible", {double(node)}) == 0.0);

        REQUIRE(f.host.grant(f.b.id, node));
        REQUIRE(f.call(f.b, "node_set_visible", {double(node), 1.0}) == 0.0);
        REQUIRE(f.call(f.a, "node_get_visible", {double(node)}) == 1.0);
    }

    SECTION("revoked grant") {
        REQUIRE(f.host.grant(f.b.id, node));
        REQUIRE(f.host.revoke(f.b.id, node));
        REQUIRE(f.call(f.b, "node_get_visible", {double(node)}) == 0.0);
        REQUIRE(f.call(f.b, "node_set_visible", {double(node), 1.0}) == -1.0);
    }

    SECTION("id that was never issued") {
        REQUIRE(f.call(f.a, "node_set_visible", {9999.0, 1.0}) == -1.0);
    }

    SECTION("wrong resource type") {
        const ResourceId sceneId = f.create_scene(f.a);
        LogCapture log;
        REQUIRE(f.call(f.a, "node_set_visible", {double(sceneId), 1.0}) == -1.0);
        REQUIRE(log.contains("abi", "type-mismatch"));
    }
}

TEST_CASE("Find by name only sees granted resources", "[abi][node]") {
    TwoEnvFixture f;
    const ResourceId aNode = f.create_node(f.a, "lamp");
    const ResourceId bNode = f.create_node(f.b, "lamp");

    const std::uint32_t aName = put_string(f.a.memory, "lamp");
    const std::uint32_t bName = put_string(f.b.memory, "lamp");

    REQUIRE(f.call(f.a, "world_find_node_by_name", {double(aName), 4.0}) == double(aNode));
    REQUIRE(f.call(f.b, "world_find_node_by_name", {double(bName), 4.0}) == double(bNode));

    REQUIRE(f.host.grant(f.b.id, aNode));
    REQUIRE(f.call(f.b, "world_find_node_by_name", {double(bName), 4.0}) == double(aNode));

    const std::uint32_t missing = put_string(f.a.memory, "none");
    REQUIRE(f.call(f.a, "world_find_node_by_name", {double(missing), 4.0}) == 0.0);
}

TEST_CASE("Node transforms", "[abi][node]") {
    TwoEnvFixture f;
    const ResourceId node = f.create_node(f.a);

    SECTION("translation array and elements") {
        const std::uint32_t in = put_floats(f.a.memory, std::array<float, 3>{1.0f, 2.0f, 3.0f});
        REQUIRE(f.call(f.a, "node_set_translation", {double(node), double(in)}) == 0.0);
        REQUIRE(f.call(f.a, "node_get_translation_element", {double(node), 1.0}) == 2.0);

        REQUIRE(f.call(f.a, "node_set_translation_element", {double(node), 2.0, -4.0}) == 0.0);
        const std::uint32_t out = f.a.memory.alloc(12, 4);
        REQUIRE(f.call(f.a, "node_get_translation", {double(node), double(out)}) == 0.0);
        REQUIRE(read_floats(f.a.memory, out, 3) == std::vector<float>{1.0f, 2.0f, -4.0f});

        // The local matrix follows the TRS write.
        REQUIRE(f.call(f.a, "node_get_matrix_element", {double(node), 12.0}) == 1.0);
        REQUIRE(f.call(f.a, "node_get_matrix_element", {double(node), 14.0}) == -4.0);
    }

    SECTION("element index out of range") {
        REQUIRE(f.call(f.a, "node_get_rotation_element", {double(node), 4.0}) == -1.0);
        REQUIRE(f.call(f.a, "node_set_scale_element", {double(node), 3.0, 1.0}) == -1.0);
    }

    SECTION("null output pointer") {
        REQUIRE(f.call(f.a, "node_get_scale", {double(node), 0.0}) == -1.0);
    }

    SECTION("world matrix includes the parent") {
        const ResourceId parent = f.create_node(f.a);
        REQUIRE(f.call(f.a, "node_add_child", {double(parent), double(node)}) == 0.0);
        REQUIRE(f.call(f.a, "node_set_translation_element", {double(parent), 1.0, 10.0}) == 0.0);
        REQUIRE(f.call(f.a, "node_set_translation_element", {double(node), 1.0, 1.0}) == 0.0);

        REQUIRE(f.call(f.a, "node_get_world_matrix_element", {double(node), 13.0}) == 11.0);

        const std::uint32_t out = f.a.memory.alloc(64, 4);
        REQUIRE(f.call(f.a, "node_get_world_matrix", {double(node), double(out)}) == 0.0);
        REQUIRE(read_floats(f.a.memory, out, 16)[13] == 11.0f);
    }
}

TEST_CASE("World node blocks", "[abi][node]") {
    TwoEnvFixture f;

    SECTION("initial transform comes from the block") {
        const std::uint32_t ptr = f.block(f.a)
            .u32(0).u32(0).u32(0)
            .f32s({0.0f, 0.0f, 0.0f, 1.0f})
            .f32s({3.0f, 3.0f, 3.0f})
            .f32s({7.0f, 8.0f, 9.0f})
            .array_ref(0, 0)
            .string("spawned")
            .commit();
        const double node = f.call(f.a, "world_create_node", {double(ptr)});
        REQUIRE(node > 0.0);
        REQUIRE(f.call(f.a, "node_get_scale_element", {node, 0.0}) == 3.0);
        REQUIRE(f.call(f.a, "node_get_translation_element", {node, 2.0}) == 9.0);
        REQUIRE(f.host.registry().find(static_cast<ResourceId>(node))->name == "spawned");
    }

    SECTION("mesh handle owned by someone else") {
        const std::size_t before = f.host.registry().size();
        const ResourceId foreign = f.host.create_resource(&f.b, "", res::Mesh{}).id;
        REQUIRE(f.create_node(f.a, "", foreign) == 0);
        REQUIRE(f.host.registry().size() == before + 1);
    }
}

TEST_CASE("Node attachments", "[abi][node]") {
    TwoEnvFixture f;
    const ResourceId node = f.create_node(f.a);
    const ResourceId mesh = f.host.create_resource(&f.a, "", res::Mesh{}).id;

    REQUIRE(f.call(f.a, "node_set_mesh", {double(node), double(mesh)}) == 0.0);
    REQUIRE(f.call(f.a, "node_get_mesh", {double(node)}) == double(mesh));

    SECTION("attachment hidden from a grantee") {
        REQUIRE(f.host.grant(f.b.id, node));
        REQUIRE(f.call(f.b, "node_get_mesh", {double(node)}) == 0.0);
    }

    SECTION("type checked on set") {
        REQUIRE(f.call(f.a, "node_set_light", {double(node), double(mesh)}) == -1.0);
        REQUIRE(f.call(f.a, "node_get_light", {double(node)}) == 0.0);
    }
}

TEST_CASE("Orbit camera", "[abi][node]") {
    TwoEnvFixture f;
    const ResourceId node = f.create_node(f.a);
    const std::uint32_t orbit = f.block(f.a).f32(0.5f).f32(1.25f).f32(4.0f).commit();

    REQUIRE(f.call(f.a, "node_start_orbit", {double(node), double(orbit)}) == 0.0);
    REQUIRE(f.host.orbit().active);
    REQUIRE(f.host.orbit().node == node);
    REQUIRE(f.host.orbit().yaw == 1.25f);
    REQUIRE(f.host.orbit().requestedBy == f.a.id);

    SECTION("stop") {
        REQUIRE(f.call(f.a, "stop_orbit") == 0.0);
        REQUIRE_FALSE(f.host.orbit().active);
    }

    SECTION("ungranted node leaves the orbit alone") {
        const std::uint32_t other = f.block(f.b).f32(0.0f).f32(0.0f).f32(1.0f).commit();
        REQUIRE(f.call(f.b, "node_start_orbit", {double(node), double(other)}) == -1.0);
        REQUIRE(f.host.orbit().zoom == 4.0f);
    }
}

TEST_CASE("Environment scene", "[abi][scene]") {
    TwoEnvFixture f;

    SECTION("unset") {
        REQUIRE(f.call(f.a, "world_get_environment") == 0.0);
        const ResourceId mine = f.create_scene(f.a);
        REQUIRE(f.call(f.a, "world_set_environment", {double(mine)}) == -1.0);
    }

    SECTION("host scene granted to a script") {
        const ResourceId hostScene = f.host.create_resource(nullptr, "environment", res::Scene{}).id;
        f.host.set_environment_scene(hostScene);

        REQUIRE(f.call(f.a, "world_get_environment") == 0.0);
        REQUIRE(f.host.grant(f.a.id, hostScene));
        REQUIRE(f.call(f.a, "world_get_environment") == double(hostScene));

        const ResourceId mine = f.create_scene(f.a, "level");
        REQUIRE(f.call(f.a, "world_set_environment", {double(mine)}) == 0.0);
        REQUIRE(f.host.environment_scene() == mine);
        REQUIRE(f.call(f.b, "world_get_environment") == 0.0);
    }
}
