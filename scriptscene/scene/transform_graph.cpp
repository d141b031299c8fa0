#include "transform_graph.hpp"

#include "../core/abi_error.hpp"

#include <raymath.h>

#include <vector>

namespace scriptscene::scene {

using resource::Node;
using resource::UIElement;

std::array<float, 16> matrix_to_array(const Matrix& m) {
    const float16 f = MatrixToFloatV(m);
    std::array<float, 16> out{};
    for (int i = 0; i < 16; ++i) {
        out[i] = f.v[i];
    }
    return out;
}

Matrix matrix_from_array(const std::array<float, 16>& v) {
    Matrix m{};
    m.m0 = v[0];   m.m1 = v[1];   m.m2 = v[2];   m.m3 = v[3];
    m.m4 = v[4];   m.m5 = v[5];   m.m6 = v[6];   m.m7 = v[7];
    m.m8 = v[8];   m.m9 = v[9];   m.m10 = v[10]; m.m11 = v[11];
    m.m12 = v[12]; m.m13 = v[13]; m.m14 = v[14]; m.m15 = v[15];
    return m;
}

std::array<float, 3> vector3_to_array(const Vector3& v) {
    return {v.x, v.y, v.z};
}

Vector3 vector3_from_array(const std::array<float, 3>& v) {
    return Vector3{v[0], v[1], v[2]};
}

std::array<float, 4> quaternion_to_array(const Quaternion& q) {
    return {q.x, q.y, q.z, q.w};
}

Quaternion quaternion_from_array(const std::array<float, 4>& v) {
    return Quaternion{v[0], v[1], v[2], v[3]};
}

// =============================================================================
// Sibling chains
// =============================================================================

void TransformGraph::link_last(ResourceId& head, ResourceId child) {
    Node* childNode = registry_.find_as<Node>(child);
    if (!childNode) {
        throw AbiError(AbiErrorKind::NotFound, "node " + std::to_string(child) + " is not registered");
    }

    childNode->nextSibling = kNullResource;
    childNode->prevSibling = kNullResource;

    if (head == kNullResource) {
        head = child;
        return;
    }

    ResourceId last = head;
    Node* lastNode = registry_.find_as<Node>(last);
    while (lastNode && lastNode->nextSibling != kNullResource) {
        last = lastNode->nextSibling;
        lastNode = registry_.find_as<Node>(last);
    }

    if (!lastNode) {
        throw AbiError(AbiErrorKind::InvalidState, "broken sibling chain");
    }

    lastNode->nextSibling = child;
    childNode->prevSibling = last;
}

void TransformGraph::unlink(ResourceId& head, Node& child) {
    const ResourceId prev = child.prevSibling;
    const ResourceId next = child.nextSibling;

    if (Node* prevNode = registry_.find_as<Node>(prev)) {
        prevNode->nextSibling = next;
    } else {
        head = next;
    }

    if (Node* nextNode = registry_.find_as<Node>(next)) {
        nextNode->prevSibling = prev;
    }

    child.prevSibling = kNullResource;
    child.nextSibling = kNullResource;
}

// =============================================================================
// Hierarchy
// =============================================================================

void TransformGraph::add_child(ResourceId parent, ResourceId child) {
    Node* parentNode = registry_.find_as<Node>(parent);
    Node* childNode = registry_.find_as<Node>(child);
    if (!parentNode || !childNode) {
        throw AbiError(AbiErrorKind::NotFound, "add_child on unregistered node");
    }

    if (is_ancestor(child, parent)) {
        throw AbiError(AbiErrorKind::InvalidState,
                       "node " + std::to_string(child) + " is an ancestor of " + std::to_string(parent));
    }

    detach(child);
    link_last(parentNode->firstChild, child);
    childNode->parent = parent;
}

bool TransformGraph::remove_child(ResourceId parent, ResourceId child) {
    Node* parentNode = registry_.find_as<Node>(parent);
    Node* childNode = registry_.find_as<Node>(child);
    if (!parentNode || !childNode || childNode->parent != parent) {
        return false;
    }

    unlink(parentNode->firstChild, *childNode);
    childNode->parent = kNullResource;
    return true;
}

void TransformGraph::add_scene_node(ResourceId scene, ResourceId node) {
    auto* sceneData = registry_.find_as<resource::Scene>(scene);
    Node* n = registry_.find_as<Node>(node);
    if (!sceneData || !n) {
        throw AbiError(AbiErrorKind::NotFound, "add_scene_node on unregistered resource");
    }

    detach(node);
    link_last(sceneData->firstNode, node);
    n->parentScene = scene;
}

bool TransformGraph::remove_scene_node(ResourceId scene, ResourceId node) {
    auto* sceneData = registry_.find_as<resource::Scene>(scene);
    Node* n = registry_.find_as<Node>(node);
    if (!sceneData || !n || n->parentScene != scene) {
        return false;
    }

    unlink(sceneData->firstNode, *n);
    n->parentScene = kNullResource;
    return true;
}

void TransformGraph::detach(ResourceId node) {
    Node* n = registry_.find_as<Node>(node);
    if (!n) return;

    if (n->parent != kNullResource) {
        if (!remove_child(n->parent, node)) {
            // Parent vanished; drop the dangling links.
            n->parent = kNullResource;
            n->prevSibling = kNullResource;
            n->nextSibling = kNullResource;
        }
    }

    if (n->parentScene != kNullResource) {
        if (!remove_scene_node(n->parentScene, node)) {
            n->parentScene = kNullResource;
            n->prevSibling = kNullResource;
            n->nextSibling = kNullResource;
        }
    }
}

void TransformGraph::detach_children(ResourceId parent) {
    ResourceId child = first_child_of(parent);
    while (child != kNullResource) {
        detach(child);
        child = first_child_of(parent);
    }
}

bool TransformGraph::is_ancestor(ResourceId ancestor, ResourceId node) const {
    std::size_t guard = registry_.size() + 1;
    ResourceId cur = node;

    while (cur != kNullResource && guard-- > 0) {
        if (cur == ancestor) return true;
        const resource::Resource* r = registry_.find(cur);
        const Node* n = r ? r->as<Node>() : nullptr;
        cur = n ? n->parent : kNullResource;
    }
    return false;
}

ResourceId TransformGraph::first_child_of(ResourceId parent) const {
    const resource::Resource* r = registry_.find(parent);
    if (!r) return kNullResource;

    if (const Node* n = r->as<Node>()) return n->firstChild;
    if (const auto* s = r->as<resource::Scene>()) return s->firstNode;
    return kNullResource;
}

ResourceId TransformGraph::next_sibling_of(ResourceId node) const {
    const resource::Resource* r = registry_.find(node);
    const Node* n = r ? r->as<Node>() : nullptr;
    return n ? n->nextSibling : kNullResource;
}

void TransformGraph::traverse(ResourceId node, const std::function<void(Node&)>& fn) {
    std::vector<ResourceId> stack{node};

    while (!stack.empty()) {
        const ResourceId id = stack.back();
        stack.pop_back();

        Node* n = registry_.find_as<Node>(id);
        if (!n) continue;

        fn(*n);

        // Push in reverse so children are visited in chain order.
        std::vector<ResourceId> children;
        for (ResourceId c = n->firstChild; c != kNullResource; c = next_sibling_of(c)) {
            children.push_back(c);
        }
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
}

// =============================================================================
// Local / world transforms
// =============================================================================

void TransformGraph::update_local_matrix(Node& node) {
    const Matrix s = MatrixScale(node.scale.x, node.scale.y, node.scale.z);
    const Matrix r = QuaternionToMatrix(node.rotation);
    const Matrix t = MatrixTranslate(node.translation.x, node.translation.y, node.translation.z);
    node.localMatrix = MatrixMultiply(MatrixMultiply(s, r), t);
}

void TransformGraph::set_translation(Node& node, const Vector3& t) {
    node.translation = t;
    update_local_matrix(node);
}

void TransformGraph::set_rotation(Node& node, const Quaternion& q) {
    node.rotation = q;
    update_local_matrix(node);
}

void TransformGraph::set_scale(Node& node, const Vector3& s) {
    node.scale = s;
    update_local_matrix(node);
}

void TransformGraph::set_local_matrix(Node& node, const Matrix& m) {
    node.localMatrix = m;
    MatrixDecompose(m, &node.translation, &node.rotation, &node.scale);
}

Matrix TransformGraph::world_matrix(ResourceId node) const {
    const resource::Resource* r = registry_.find(node);
    const Node* n = r ? r->as<Node>() : nullptr;
    if (!n) return MatrixIdentity();

    Matrix world = n->localMatrix;
    std::size_t guard = registry_.size();
    ResourceId cur = n->parent;

    while (cur != kNullResource && guard-- > 0) {
        const resource::Resource* pr = registry_.find(cur);
        const Node* p = pr ? pr->as<Node>() : nullptr;
        if (!p) break;
        world = MatrixMultiply(world, p->localMatrix);
        cur = p->parent;
    }
    return world;
}

// =============================================================================
// UI element tree
// =============================================================================

void TransformGraph::add_ui_child(ResourceId parent, ResourceId child) {
    UIElement* p = registry_.find_as<UIElement>(parent);
    UIElement* c = registry_.find_as<UIElement>(child);
    if (!p || !c) {
        throw AbiError(AbiErrorKind::NotFound, "add_ui_child on unregistered element");
    }

    std::size_t guard = registry_.size() + 1;
    for (ResourceId cur = parent; cur != kNullResource && guard-- > 0;) {
        if (cur == child) {
            throw AbiError(AbiErrorKind::InvalidState, "ui element would become its own ancestor");
        }
        const UIElement* e = registry_.find_as<UIElement>(cur);
        cur = e ? e->parent : kNullResource;
    }

    detach_ui_element(child);

    if (p->firstChild == kNullResource) {
        p->firstChild = child;
    } else {
        ResourceId last = p->firstChild;
        UIElement* lastElem = registry_.find_as<UIElement>(last);
        while (lastElem && lastElem->nextSibling != kNullResource) {
            last = lastElem->nextSibling;
            lastElem = registry_.find_as<UIElement>(last);
        }
        if (!lastElem) {
            throw AbiError(AbiErrorKind::InvalidState, "broken ui sibling chain");
        }
        lastElem->nextSibling = child;
        c->prevSibling = last;
    }
    c->parent = parent;
}

void TransformGraph::detach_ui_element(ResourceId element) {
    UIElement* e = registry_.find_as<UIElement>(element);
    if (!e || e->parent == kNullResource) return;

    UIElement* p = registry_.find_as<UIElement>(e->parent);
    UIElement* prev = registry_.find_as<UIElement>(e->prevSibling);
    UIElement* next = registry_.find_as<UIElement>(e->nextSibling);

    if (prev) {
        prev->nextSibling = e->nextSibling;
    } else if (p) {
        p->firstChild = e->nextSibling;
    }
    if (next) {
        next->prevSibling = e->prevSibling;
    }

    e->parent = kNullResource;
    e->prevSibling = kNullResource;
    e->nextSibling = kNullResource;
}

} // namespace scriptscene::scene
