/**
 * @file test_transform_graph.cpp
 * @brief Unfiltered node hierarchy and world transforms.
 */

#include <catch2/catch_test_macros.hpp>

#include "scriptscene/scene/transform_graph.hpp"

#include <raymath.h>

#include <vector>

using namespace scriptscene;
namespace res = scriptscene::resource;

namespace {

struct GraphFixture {
    res::ResourceRegistry registry;
    scene::TransformGraph graph{registry};

    ResourceId node() { return registry.add(1, "", res::Node{}).id; }
    res::Node& get(ResourceId id) { return *registry.find_as<res::Node>(id); }
};

std::vector<ResourceId> children_of(const scene::TransformGraph& graph, ResourceId parent) {
    std::vector<ResourceId> out;
    for (ResourceId c = graph.first_child_of(parent); c != kNullResource; c = graph.next_sibling_of(c)) {
        out.push_back(c);
    }
    return out;
}

} // namespace

TEST_CASE("Children keep insertion order", "[scene][graph]") {
    GraphFixture f;
    const ResourceId root = f.node();
    const ResourceId c1 = f.node();
    const ResourceId c2 = f.node();
    const ResourceId c3 = f.node();

    f.graph.add_child(root, c1);
    f.graph.add_child(root, c2);
    f.graph.add_child(root, c3);
    REQUIRE(children_of(f.graph, root) == std::vector<ResourceId>{c1, c2, c3});

    SECTION("remove from the middle") {
        REQUIRE(f.graph.remove_child(root, c2));
        REQUIRE(children_of(f.graph, root) == std::vector<ResourceId>{c1, c3});
        REQUIRE(f.get(c2).parent == kNullResource);
    }

    SECTION("removing a non-child reports false") {
        REQUIRE_FALSE(f.graph.remove_child(c1, c3));
        REQUIRE(children_of(f.graph, root).size() == 3);
    }

    SECTION("reparenting moves the node") {
        f.graph.add_child(c1, c3);
        REQUIRE(children_of(f.graph, root) == std::vector<ResourceId>{c1, c2});
        REQUIRE(children_of(f.graph, c1) == std::vector<ResourceId>{c3});
        REQUIRE(f.get(c3).parent == c1);
    }

    SECTION("detach_children leaves roots") {
        f.graph.detach_children(root);
        REQUIRE(f.graph.first_child_of(root) == kNullResource);
        REQUIRE(f.get(c1).parent == kNullResource);
        REQUIRE(f.get(c3).prevSibling == kNullResource);
    }
}

TEST_CASE("Cycles are rejected", "[scene][graph]") {
    GraphFixture f;
    const ResourceId a = f.node();
    const ResourceId b = f.node();
    const ResourceId c = f.node();

    f.graph.add_child(a, b);
    f.graph.add_child(b, c);

    SECTION("grandchild as parent") {
        try {
            f.graph.add_child(c, a);
            FAIL("expected AbiError");
        } catch (const AbiError& e) {
            REQUIRE(e.kind() == AbiErrorKind::InvalidState);
        }
        REQUIRE(f.get(a).parent == kNullResource);
        REQUIRE(children_of(f.graph, b) == std::vector<ResourceId>{c});
    }

    SECTION("node as its own parent") {
        REQUIRE_THROWS_AS(f.graph.add_child(a, a), AbiError);
    }

    REQUIRE(f.graph.is_ancestor(a, c));
    REQUIRE_FALSE(f.graph.is_ancestor(c, a));
}

TEST_CASE("A node sits under a parent or a scene, not both", "[scene][graph]") {
    GraphFixture f;
    const ResourceId sceneId = f.registry.add(1, "", res::Scene{}).id;
    const ResourceId parent = f.node();
    const ResourceId n = f.node();

    f.graph.add_scene_node(sceneId, n);
    REQUIRE(f.graph.first_child_of(sceneId) == n);
    REQUIRE(f.get(n).parentScene == sceneId);

    f.graph.add_child(parent, n);
    REQUIRE(f.graph.first_child_of(sceneId) == kNullResource);
    REQUIRE(f.get(n).parentScene == kNullResource);
    REQUIRE(f.get(n).parent == parent);

    f.graph.detach(n);
    REQUIRE(f.get(n).parent == kNullResource);
    REQUIRE(f.graph.first_child_of(parent) == kNullResource);
}

TEST_CASE("World matrix composes up the parent chain", "[scene][graph]") {
    GraphFixture f;
    const ResourceId parent = f.node();
    const ResourceId child = f.node();
    f.graph.add_child(parent, child);

    scene::TransformGraph::set_scale(f.get(parent), Vector3{2.0f, 2.0f, 2.0f});
    scene::TransformGraph::set_translation(f.get(parent), Vector3{0.0f, 5.0f, 0.0f});
    scene::TransformGraph::set_translation(f.get(child), Vector3{1.0f, 0.0f, 0.0f});

    const Matrix world = f.graph.world_matrix(child);
    REQUIRE(world.m12 == 2.0f);
    REQUIRE(world.m13 == 5.0f);
    REQUIRE(world.m14 == 0.0f);
    REQUIRE(world.m0 == 2.0f);

    SECTION("detached node is its own world") {
        f.graph.detach(child);
        const Matrix local = f.graph.world_matrix(child);
        REQUIRE(local.m12 == 1.0f);
        REQUIRE(local.m0 == 1.0f);
    }
}

TEST_CASE("Matrix arrays use column-major order", "[scene][graph]") {
    const Matrix m = MatrixTranslate(3.0f, 4.0f, 5.0f);
    const auto values = scene::matrix_to_array(m);
    REQUIRE(values[12] == 3.0f);
    REQUIRE(values[13] == 4.0f);
    REQUIRE(values[14] == 5.0f);
    REQUIRE(values[15] == 1.0f);

    const Matrix back = scene::matrix_from_array(values);
    REQUIRE(back.m12 == 3.0f);
    REQUIRE(back.m5 == 1.0f);
}

TEST_CASE("Traverse visits in pre-order", "[scene][graph]") {
    GraphFixture f;
    const ResourceId root = f.node();
    const ResourceId a = f.node();
    const ResourceId a1 = f.node();
    const ResourceId b = f.node();
    f.graph.add_child(root, a);
    f.graph.add_child(a, a1);
    f.graph.add_child(root, b);

    f.get(root).translation.x = 0.0f;
    f.get(a).translation.x = 1.0f;
    f.get(a1).translation.x = 2.0f;
    f.get(b).translation.x = 3.0f;

    std::vector<float> order;
    f.graph.traverse(root, [&](res::Node& n) {
        n.isStatic = true;
        order.push_back(n.translation.x);
    });

    REQUIRE(order == std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f});
    REQUIRE(f.get(a1).isStatic);
    REQUIRE(f.get(b).isStatic);
}
