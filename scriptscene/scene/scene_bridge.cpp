#include "scene_bridge.hpp"

namespace scriptscene::scene {

using resource::Node;
using resource::Scene;

void SceneBridge::add_child(ResourceId parent, ResourceId child) {
    caps_.require<Node>(registry_, parent);
    caps_.require<Node>(registry_, child);
    graph_.add_child(parent, child);
}

void SceneBridge::remove_child(ResourceId parent, ResourceId child) {
    caps_.require<Node>(registry_, parent);
    caps_.require<Node>(registry_, child);
    graph_.remove_child(parent, child);
}

void SceneBridge::add_scene_node(ResourceId scene, ResourceId node) {
    caps_.require<Scene>(registry_, scene);
    caps_.require<Node>(registry_, node);
    graph_.add_scene_node(scene, node);
}

void SceneBridge::remove_scene_node(ResourceId scene, ResourceId node) {
    caps_.require<Scene>(registry_, scene);
    caps_.require<Node>(registry_, node);
    graph_.remove_scene_node(scene, node);
}

ResourceId SceneBridge::first_child(ResourceId parent) {
    return graph_.first_child_of(parent);
}

template <typename ParentT>
std::uint32_t SceneBridge::child_count(ResourceId parent) {
    caps_.require<ParentT>(registry_, parent);

    std::uint32_t count = 0;
    for (ResourceId c = first_child(parent); c != kNullResource; c = graph_.next_sibling_of(c)) {
        if (caps_.permits(registry_, c)) {
            ++count;
        }
    }
    return count;
}

template <typename ParentT>
std::uint32_t SceneBridge::children(ResourceId parent, std::span<ResourceId> out) {
    caps_.require<ParentT>(registry_, parent);

    std::uint32_t written = 0;
    for (ResourceId c = first_child(parent); c != kNullResource && written < out.size();
         c = graph_.next_sibling_of(c)) {
        if (caps_.permits(registry_, c)) {
            out[written++] = c;
        }
    }
    return written;
}

template <typename ParentT>
ResourceId SceneBridge::child_at(ResourceId parent, std::uint32_t index) {
    caps_.require<ParentT>(registry_, parent);

    std::uint32_t i = 0;
    for (ResourceId c = first_child(parent); c != kNullResource; c = graph_.next_sibling_of(c)) {
        if (!caps_.permits(registry_, c)) continue;
        if (i == index) return c;
        ++i;
    }
    return kNullResource;
}

template std::uint32_t SceneBridge::child_count<Node>(ResourceId);
template std::uint32_t SceneBridge::child_count<Scene>(ResourceId);
template std::uint32_t SceneBridge::children<Node>(ResourceId, std::span<ResourceId>);
template std::uint32_t SceneBridge::children<Scene>(ResourceId, std::span<ResourceId>);
template ResourceId SceneBridge::child_at<Node>(ResourceId, std::uint32_t);
template ResourceId SceneBridge::child_at<Scene>(ResourceId, std::uint32_t);

ResourceId SceneBridge::parent_of(ResourceId node) {
    const Node& n = caps_.require<Node>(registry_, node);
    return visible(n.parent);
}

ResourceId SceneBridge::parent_scene_of(ResourceId node) {
    const Node& n = caps_.require<Node>(registry_, node);
    return visible(n.parentScene);
}

void SceneBridge::set_is_static_recursive(ResourceId node, bool isStatic) {
    caps_.require<Node>(registry_, node).isStatic = isStatic;
    set_static_below(node, isStatic);
}

void SceneBridge::set_static_below(ResourceId parent, bool isStatic) {
    for (ResourceId c = first_child(parent); c != kNullResource; c = graph_.next_sibling_of(c)) {
        if (caps_.permits(registry_, c)) {
            if (auto* n = registry_.find_as<Node>(c)) {
                n->isStatic = isStatic;
            }
        }
        set_static_below(c, isStatic);
    }
}

ResourceId SceneBridge::visible(ResourceId id) const {
    if (id == kNullResource) return kNullResource;
    return caps_.permits(registry_, id) ? id : kNullResource;
}

} // namespace scriptscene::scene
