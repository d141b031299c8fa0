#pragma once

#include "transform_graph.hpp"
#include "../resource/capability_set.hpp"

#include <cstdint>
#include <span>

namespace scriptscene::scene {

// Hierarchy operations as one environment sees them.
//
// Every handle is checked against the caller's capability set. Traversals
// report only children the caller may reference; indices follow raw sibling
// order with hidden children skipped and are recomputed on every call.
class SceneBridge {
public:
    SceneBridge(resource::ResourceRegistry& registry, TransformGraph& graph,
                const resource::CapabilitySet& caps)
        : registry_(registry), graph_(graph), caps_(caps) {}

    void add_child(ResourceId parent, ResourceId child);
    void remove_child(ResourceId parent, ResourceId child);

    void add_scene_node(ResourceId scene, ResourceId node);
    void remove_scene_node(ResourceId scene, ResourceId node);

    // ParentT is resource::Node or resource::Scene.
    template <typename ParentT>
    std::uint32_t child_count(ResourceId parent);

    // Writes up to out.size() visible child ids; returns how many were written.
    template <typename ParentT>
    std::uint32_t children(ResourceId parent, std::span<ResourceId> out);

    template <typename ParentT>
    ResourceId child_at(ResourceId parent, std::uint32_t index);

    // 0 when there is no parent or the parent is not visible to the caller.
    ResourceId parent_of(ResourceId node);
    ResourceId parent_scene_of(ResourceId node);

    // Descendants the caller cannot see keep their flag; their own subtrees
    // are still walked.
    void set_is_static_recursive(ResourceId node, bool isStatic);

    // `id` if the caller may reference it, else 0.
    ResourceId visible(ResourceId id) const;

private:
    ResourceId first_child(ResourceId parent);
    void set_static_below(ResourceId parent, bool isStatic);

    resource::ResourceRegistry& registry_;
    TransformGraph& graph_;
    const resource::CapabilitySet& caps_;
};

} // namespace scriptscene::scene
