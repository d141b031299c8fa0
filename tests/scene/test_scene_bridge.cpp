/**
 * @file test_scene_bridge.cpp
 * @brief Hierarchy queries as each environment sees them.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/host_fixture.hpp"

#include <vector>

using namespace scriptscene;
using namespace test_helpers;
namespace res = scriptscene::resource;

namespace {

std::vector<ResourceId> read_ids(GuestMemory& mem, std::uint32_t ptr, std::uint32_t count) {
    std::vector<ResourceId> out;
    for (std::uint32_t i = 0; i < count; ++i) {
        out.push_back(read_u32(mem, ptr + i * 4));
    }
    return out;
}

} // namespace

TEST_CASE("Shared scene shows each environment its own nodes", "[scene][bridge]") {
    TwoEnvFixture f;

    const ResourceId sceneId = f.create_scene(f.a, "shared");
    REQUIRE(sceneId != 0);

    std::vector<ResourceId> aNodes;
    for (int i = 0; i < 3; ++i) {
        aNodes.push_back(f.create_node(f.a));
        REQUIRE(f.call(f.a, "scene_add_node", {double(sceneId), double(aNodes.back())}) == 0.0);
    }

    REQUIRE(f.host.grant(f.b.id, sceneId));

    const ResourceId b1 = f.create_node(f.b);
    const ResourceId b2 = f.create_node(f.b);
    REQUIRE(f.call(f.b, "scene_add_node", {double(sceneId), double(b1)}) == 0.0);
    REQUIRE(f.call(f.b, "scene_add_node", {double(sceneId), double(b2)}) == 0.0);

    SECTION("counts") {
        REQUIRE(f.call(f.a, "scene_get_node_count", {double(sceneId)}) == 3.0);
        REQUIRE(f.call(f.b, "scene_get_node_count", {double(sceneId)}) == 2.0);
    }

    SECTION("indexing skips hidden nodes") {
        REQUIRE(f.call(f.b, "scene_get_node", {double(sceneId), 0.0}) == double(b1));
        REQUIRE(f.call(f.b, "scene_get_node", {double(sceneId), 1.0}) == double(b2));
        REQUIRE(f.call(f.b, "scene_get_node", {double(sceneId), 2.0}) == 0.0);
        REQUIRE(f.call(f.a, "scene_get_node", {double(sceneId), 2.0}) == double(aNodes[2]));
    }

    SECTION("scene_get_nodes writes only visible ids") {
        const std::uint32_t arr = f.b.memory.alloc(8 * 4, 4);
        REQUIRE(f.call(f.b, "scene_get_nodes", {double(sceneId), double(arr), 8.0}) == 2.0);
        REQUIRE(read_ids(f.b.memory, arr, 2) == std::vector<ResourceId>{b1, b2});
    }

    SECTION("scene_get_nodes stops at the buffer size") {
        const std::uint32_t arr = f.a.memory.alloc(2 * 4, 4);
        REQUIRE(f.call(f.a, "scene_get_nodes", {double(sceneId), double(arr), 2.0}) == 2.0);
        REQUIRE(read_ids(f.a.memory, arr, 2) == std::vector<ResourceId>{aNodes[0], aNodes[1]});
    }

    SECTION("parent scene is visible to both") {
        REQUIRE(f.call(f.b, "node_get_parent_scene", {double(b1)}) == double(sceneId));
        REQUIRE(f.call(f.a, "node_get_parent_scene", {double(aNodes[0])}) == double(sceneId));
    }

    SECTION("B cannot remove A's node") {
        LogCapture log;
        REQUIRE(f.call(f.b, "scene_remove_node", {double(sceneId), double(aNodes[0])}) == -1.0);
        REQUIRE(log.contains("abi", "not-authorized"));
        REQUIRE(f.call(f.a, "scene_get_node_count", {double(sceneId)}) == 3.0);
    }
}

TEST_CASE("Node children through the ABI", "[scene][bridge]") {
    TwoEnvFixture f;

    const ResourceId parent = f.create_node(f.a, "parent");
    const ResourceId c1 = f.create_node(f.a);
    const ResourceId c2 = f.create_node(f.a);
    REQUIRE(f.call(f.a, "node_add_child", {double(parent), double(c1)}) == 0.0);
    REQUIRE(f.call(f.a, "node_add_child", {double(parent), double(c2)}) == 0.0);

    SECTION("order and lookup") {
        REQUIRE(f.call(f.a, "node_get_child_count", {double(parent)}) == 2.0);
        REQUIRE(f.call(f.a, "node_get_child", {double(parent), 1.0}) == double(c2));
        REQUIRE(f.call(f.a, "node_get_parent", {double(c1)}) == double(parent));

        const std::uint32_t arr = f.a.memory.alloc(4 * 4, 4);
        REQUIRE(f.call(f.a, "node_get_children", {double(parent), double(arr), 4.0}) == 2.0);
        REQUIRE(read_ids(f.a.memory, arr, 2) == std::vector<ResourceId>{c1, c2});
    }

    SECTION("granted child under a hidden parent") {
        REQUIRE(f.host.grant(f.b.id, c1));
        REQUIRE(f.call(f.b, "node_get_parent", {double(c1)}) == 0.0);
        REQUIRE(f.call(f.b, "node_get_child_count", {double(parent)}) == -1.0);
    }

    SECTION("cycle is refused") {
        REQUIRE(f.call(f.a, "node_add_child", {double(c1), double(parent)}) == -1.0);
        REQUIRE(f.call(f.a, "node_get_parent", {double(parent)}) == 0.0);
    }

    SECTION("remove_child") {
        REQUIRE(f.call(f.a, "node_remove_child", {double(parent), double(c1)}) == 0.0);
        REQUIRE(f.call(f.a, "node_get_child_count", {double(parent)}) == 1.0);
        REQUIRE(f.call(f.a, "node_get_parent", {double(c1)}) == 0.0);
    }

    SECTION("is_static_recursive") {
        REQUIRE(f.call(f.a, "node_set_is_static_recursive", {double(parent), 1.0}) == 0.0);
        REQUIRE(f.call(f.a, "node_get_is_static", {double(c2)}) == 1.0);
    }

    SECTION("child array above the cap") {
        REQUIRE(f.call(f.a, "node_get_children", {double(parent), 64.0, 1.0e6}) == -1.0);
    }
}

TEST_CASE("is_static_recursive skips children the caller cannot see", "[scene][bridge]") {
    TwoEnvFixture f;

    const ResourceId parent = f.create_node(f.a, "parent");
    const ResourceId own = f.create_node(f.a);
    REQUIRE(f.call(f.a, "node_add_child", {double(parent), double(own)}) == 0.0);

    // b parents its own node under a's node through a host grant.
    REQUIRE(f.host.grant(f.b.id, parent));
    const ResourceId foreign = f.create_node(f.b);
    REQUIRE(f.call(f.b, "node_add_child", {double(parent), double(foreign)}) == 0.0);

    REQUIRE(f.call(f.a, "node_set_is_static_recursive", {double(parent), 1.0}) == 0.0);

    REQUIRE(f.host.registry().find_as<res::Node>(parent)->isStatic);
    REQUIRE(f.host.registry().find_as<res::Node>(own)->isStatic);
    REQUIRE_FALSE(f.host.registry().find_as<res::Node>(foreign)->isStatic);
    REQUIRE(f.call(f.b, "node_get_is_static", {double(foreign)}) == 0.0);
}
