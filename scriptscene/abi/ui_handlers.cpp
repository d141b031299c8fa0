#include "handler_support.hpp"

#include "../host/rollback_scope.hpp"
#include "../marshal/decoders.hpp"

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;

namespace {

// Canvas collider thickness along z.
constexpr float kCanvasHalfDepth = 0.01f;

res::Interactable& button_interactable(CallContext& ctx, ResourceId buttonId) {
    const res::UIButton& button = ctx.require<res::UIButton>(buttonId);
    auto* interactable = ctx.registry().find_as<res::Interactable>(button.interactable);
    if (!interactable) {
        throw AbiError(AbiErrorKind::InvalidState, "button " + std::to_string(buttonId) + " has no interactable");
    }
    return *interactable;
}

// Registers an interactable of kind UI for `target` (node or button) and its
// physics marker. Both are undone if the enclosing scope rolls back.
ResourceId attach_ui_interactable(CallContext& ctx, host::RollbackScope& rollback, ResourceId target) {
    res::Interactable interactable;
    interactable.type = res::InteractableType::UI;
    interactable.target = target;
    const ResourceId id = ctx.create("", interactable).id;
    rollback.on_rollback([&ctx, id] { ctx.host.dispose(id); });

    physics::IPhysicsWorld& world = ctx.host.physics();
    world.add_interactable(target, res::InteractableType::UI);
    rollback.on_rollback([&world, target] { world.remove_interactable(target); });
    return id;
}

void register_flex_vec4(Dispatcher& d, const std::string& name, std::array<float, 4> res::UIElement::*member) {
    d.add(name, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        res::UIElement& flex = ctx.require<res::UIElement>(a.u32(0));
        flex.*member = read_floats<4>(ctx, a.u32(1));
        return kOk;
    });
}

void register_text_string(Dispatcher& d, const std::string& name, std::string res::UIText::*member) {
    d.add(name, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        res::UIText& text = ctx.require<res::UIText>(a.u32(0));
        text.*member = ctx.string_arg(a.u32(1), a.u32(2));
        return kOk;
    });
}

} // namespace

void register_ui(Dispatcher& d) {
    // --- Canvas ---

    d.add("create_ui_canvas", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        const res::UICanvas canvas = marshal::decode_ui_canvas(decoder, a.u32(0));
        return as_id(ctx.create("", canvas).id);
    });

    // Mounting a canvas makes the node a kinematic, interactable panel.
    d.add("node_set_ui_canvas", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        const ResourceId canvasId = a.u32(1);
        res::Node& node = ctx.require<res::Node>(nodeId);
        res::UICanvas& canvas = ctx.require<res::UICanvas>(canvasId);
        physics::IPhysicsWorld& world = ctx.host.physics();

        if (world.has_rigid_body(nodeId)) {
            throw AbiError(AbiErrorKind::InvalidState, "node already has a rigid body");
        }
        if (node.interactable != kNullResource) {
            throw AbiError(AbiErrorKind::InvalidState, "node is already interactable");
        }

        host::RollbackScope rollback;

        const ResourceId previousCanvas = node.uiCanvas;
        node.uiCanvas = canvasId;
        rollback.on_rollback([&node, previousCanvas] { node.uiCanvas = previousCanvas; });

        const ResourceId previousMount = canvas.mountedOn;
        canvas.mountedOn = nodeId;
        rollback.on_rollback([&canvas, previousMount] { canvas.mountedOn = previousMount; });

        physics::RigidBodyDesc bodyDesc;
        bodyDesc.type = res::PhysicsBodyType::Kinematic;
        const physics::BodyHandle body = world.create_rigid_body(nodeId, bodyDesc);
        rollback.on_rollback([&world, nodeId] { world.remove_rigid_body(nodeId); });

        physics::ColliderDesc colliderDesc;
        colliderDesc.type = res::ColliderType::Box;
        colliderDesc.halfExtents = Vector3{canvas.width / 2.0f, canvas.height / 2.0f, kCanvasHalfDepth};
        colliderDesc.collisionEvents = true;
        world.create_collider(body, colliderDesc);

        node.interactable = attach_ui_interactable(ctx, rollback, nodeId);

        rollback.commit();
        return kOk;
    });

    d.add("ui_canvas_get_root", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.visible(ctx.require<res::UICanvas>(a.u32(0)).root));
    });

    d.add("ui_canvas_set_root", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UICanvas& canvas = ctx.require<res::UICanvas>(a.u32(0));
        const ResourceId root = a.u32(1);
        ctx.require<res::UIElement>(root);
        canvas.root = root;
        return kOk;
    });

    d.add("ui_canvas_get_width", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.require<res::UICanvas>(a.u32(0)).width);
    });

    d.add("ui_canvas_set_width", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::UICanvas>(a.u32(0)).width = a.f32(1);
        return kOk;
    });

    d.add("ui_canvas_get_height", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.require<res::UICanvas>(a.u32(0)).height);
    });

    d.add("ui_canvas_set_height", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::UICanvas>(a.u32(0)).height = a.f32(1);
        return kOk;
    });

    d.add("ui_canvas_redraw", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ++ctx.require<res::UICanvas>(a.u32(0)).redraw;
        return kOk;
    });

    // --- Flex ---

    d.add("create_ui_flex", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        const res::UIElement flex = marshal::decode_ui_flex(decoder, a.u32(0));
        return as_id(ctx.create("", flex).id);
    });

    d.add("ui_flex_set_flex_direction", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UIElement& flex = ctx.require<res::UIElement>(a.u32(0));
        const std::uint32_t raw = a.u32(1);
        flex.flexDirection = marshal::require_enum(res::flex_direction_from(raw), raw, "flex direction");
        return kOk;
    });

    d.add("ui_flex_set_width", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::UIElement>(a.u32(0)).width = a.f32(1);
        return kOk;
    });

    d.add("ui_flex_set_height", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::UIElement>(a.u32(0)).height = a.f32(1);
        return kOk;
    });

    register_flex_vec4(d, "ui_flex_set_background_color", &res::UIElement::backgroundColor);
    register_flex_vec4(d, "ui_flex_set_border_color", &res::UIElement::borderColor);
    register_flex_vec4(d, "ui_flex_set_padding", &res::UIElement::padding);
    register_flex_vec4(d, "ui_flex_set_margin", &res::UIElement::margin);

    d.add("ui_flex_add_child", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId flex = a.u32(0);
        const ResourceId child = a.u32(1);
        ctx.require<res::UIElement>(flex);
        ctx.require<res::UIElement>(child);
        ctx.host.graph().add_ui_child(flex, child);
        return kOk;
    });

    d.add("ui_flex_add_text", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UIElement& flex = ctx.require<res::UIElement>(a.u32(0));
        const ResourceId text = a.u32(1);
        ctx.require<res::UIText>(text);
        flex.text = text;
        return kOk;
    });

    d.add("ui_flex_add_button", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UIElement& flex = ctx.require<res::UIElement>(a.u32(0));
        const ResourceId button = a.u32(1);
        ctx.require<res::UIButton>(button);
        flex.button = button;
        return kOk;
    });

    // --- Button ---

    d.add("create_ui_button", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        res::UIButton button;
        button.label = ctx.string_arg(a.u32(0), a.u32(1));

        host::RollbackScope rollback;

        const ResourceId buttonId = ctx.create("", std::move(button)).id;
        rollback.on_rollback([&ctx, buttonId] { ctx.host.dispose(buttonId); });

        const ResourceId interactable = attach_ui_interactable(ctx, rollback, buttonId);
        ctx.require<res::UIButton>(buttonId).interactable = interactable;

        rollback.commit();
        return as_id(buttonId);
    });

    d.add("ui_button_set_label", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UIButton& button = ctx.require<res::UIButton>(a.u32(0));
        std::string label = ctx.string_arg(a.u32(1), a.u32(2));
        if (label.empty()) {
            throw AbiError(AbiErrorKind::InvalidState, "button label may not be empty");
        }
        button.label = std::move(label);
        return kOk;
    });

    d.add("ui_button_get_pressed", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(button_interactable(ctx, a.u32(0)).pressed);
    });

    d.add("ui_button_get_held", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(button_interactable(ctx, a.u32(0)).held);
    });

    d.add("ui_button_get_released", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(button_interactable(ctx, a.u32(0)).released);
    });

    // --- Text ---

    d.add("create_ui_text", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        res::UIText text = marshal::decode_ui_text(decoder, a.u32(0));
        return as_id(ctx.create("", std::move(text)).id);
    });

    register_text_string(d, "ui_text_set_value", &res::UIText::value);
    register_text_string(d, "ui_text_set_font_family", &res::UIText::fontFamily);
    register_text_string(d, "ui_text_set_font_style", &res::UIText::fontStyle);

    d.add("ui_text_set_font_size", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::UIText>(a.u32(0)).fontSize = a.f32(1);
        return kOk;
    });

    d.add("ui_text_set_color", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::UIText& text = ctx.require<res::UIText>(a.u32(0));
        text.color = read_floats<4>(ctx, a.u32(1));
        return kOk;
    });
}

} // namespace scriptscene::abi
