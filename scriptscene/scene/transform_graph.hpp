#pragma once

#include "../resource/resource_registry.hpp"

#include <raylib.h>

#include <array>
#include <functional>

namespace scriptscene::scene {

// =============================================================================
// Float array <-> raylib math types (glTF order: column-major matrix, xyzw quat)
// =============================================================================

std::array<float, 16> matrix_to_array(const Matrix& m);
Matrix matrix_from_array(const std::array<float, 16>& v);

std::array<float, 3> vector3_to_array(const Vector3& v);
Vector3 vector3_from_array(const std::array<float, 3>& v);

std::array<float, 4> quaternion_to_array(const Quaternion& q);
Quaternion quaternion_from_array(const std::array<float, 4>& v);

// =============================================================================
// TransformGraph - unfiltered hierarchy over registry resources
// =============================================================================
//
// Nodes hang either under another node (parent) or directly under a scene
// (parentScene); siblings form a doubly-linked chain in insertion order.
// This layer performs no access checks; SceneBridge adds them.

class TransformGraph {
public:
    explicit TransformGraph(resource::ResourceRegistry& registry) : registry_(registry) {}

    // Appends `child` to `parent`'s children, detaching it from any previous
    // parent or scene first. Throws AbiError(InvalidState) when the link
    // would create a cycle.
    void add_child(ResourceId parent, ResourceId child);

    // Returns false when `child` is not a child of `parent`.
    bool remove_child(ResourceId parent, ResourceId child);

    void add_scene_node(ResourceId scene, ResourceId node);
    bool remove_scene_node(ResourceId scene, ResourceId node);

    // Unlinks a node from whatever parent or scene holds it.
    void detach(ResourceId node);

    // Unlinks every child of a node or scene; the children become roots.
    void detach_children(ResourceId parent);

    // True if `ancestor` is `node` or lies on its parent chain.
    bool is_ancestor(ResourceId ancestor, ResourceId node) const;

    // Depth-first pre-order walk starting at (and including) `node`.
    void traverse(ResourceId node, const std::function<void(resource::Node&)>& fn);

    // Head of the child chain of a node or a scene (0 if neither).
    ResourceId first_child_of(ResourceId parent) const;
    ResourceId next_sibling_of(ResourceId node) const;

    // --- Local transform ---

    static void set_translation(resource::Node& node, const Vector3& t);
    static void set_rotation(resource::Node& node, const Quaternion& q);
    static void set_scale(resource::Node& node, const Vector3& s);
    static void set_local_matrix(resource::Node& node, const Matrix& m);

    // Recomposes the local matrix from TRS.
    static void update_local_matrix(resource::Node& node);

    // Local matrices multiplied up the parent chain.
    Matrix world_matrix(ResourceId node) const;

    // --- UI element tree ---

    void add_ui_child(ResourceId parent, ResourceId child);
    void detach_ui_element(ResourceId element);

private:
    void link_last(ResourceId& head, ResourceId child);
    void unlink(ResourceId& head, resource::Node& child);

    resource::ResourceRegistry& registry_;
};

} // namespace scriptscene::scene
