/**
 * @file test_capability_set.cpp
 * @brief Access checks: NotAuthorized, NotFound and TypeMismatch.
 */

#include <catch2/catch_test_macros.hpp>

#include "scriptscene/resource/capability_set.hpp"

using namespace scriptscene;
using namespace scriptscene::resource;

TEST_CASE("CapabilitySet grants typed access", "[resource][caps]") {
    ResourceRegistry registry;
    CapabilitySet caps;

    Resource& node = registry.add(1, "", Node{});
    caps.authorize(node);

    auto result = caps.check_access<Node>(registry, node.id);
    REQUIRE(result);
    REQUIRE(result.value == node.as<Node>());
    REQUIRE(caps.permits(registry, node.id));
}

TEST_CASE("CapabilitySet distinguishes the three failures", "[resource][caps]") {
    ResourceRegistry registry;
    CapabilitySet caps;

    Resource& node = registry.add(1, "", Node{});
    const ResourceId foreign = registry.add(2, "", Node{}).id;
    caps.authorize(node);

    SECTION("not granted") {
        REQUIRE(caps.check_access<Node>(registry, foreign).error == AbiErrorKind::NotAuthorized);
    }

    SECTION("null handle") {
        REQUIRE(caps.check_access<Node>(registry, kNullResource).error == AbiErrorKind::NotAuthorized);
    }

    SECTION("wrong kind") {
        REQUIRE(caps.check_access<Material>(registry, node.id).error == AbiErrorKind::TypeMismatch);
    }

    SECTION("released") {
        const ResourceId id = node.id;
        registry.remove(id);
        REQUIRE(caps.check_access<Node>(registry, id).error == AbiErrorKind::NotFound);
    }
}

TEST_CASE("CapabilitySet grant does not follow a recycled id", "[resource][caps]") {
    ResourceRegistry registry;
    CapabilitySet caps;

    const Resource& original = registry.add(1, "", Node{});
    const ResourceId id = original.id;
    caps.authorize(original);

    registry.remove(id);
    const Resource& reused = registry.add(2, "", Node{});
    REQUIRE(reused.id == id);

    REQUIRE(caps.contains(id));
    REQUIRE_FALSE(caps.permits(registry, id));
    REQUIRE(caps.check_access<Node>(registry, id).error == AbiErrorKind::NotFound);
}

TEST_CASE("CapabilitySet require throws AbiError with the kind", "[resource][caps]") {
    ResourceRegistry registry;
    CapabilitySet caps;

    Resource& light = registry.add(1, "", Light{});
    caps.authorize(light);

    try {
        caps.require<Node>(registry, light.id);
        FAIL("expected AbiError");
    } catch (const AbiError& e) {
        REQUIRE(e.kind() == AbiErrorKind::TypeMismatch);
    }

    REQUIRE(caps.require<Light>(registry, light.id).type == LightType::Directional);
}

TEST_CASE("CapabilitySet revoke and clear", "[resource][caps]") {
    ResourceRegistry registry;
    CapabilitySet caps;

    Resource& a = registry.add(1, "", Node{});
    Resource& b = registry.add(1, "", Node{});
    caps.authorize(a);
    caps.authorize(b);

    caps.revoke(a.id);
    REQUIRE_FALSE(caps.permits(registry, a.id));
    REQUIRE(caps.size() == 1);

    caps.clear();
    REQUIRE(caps.size() == 0);
}
