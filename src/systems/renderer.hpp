#pragma once
#include "../sprite_renderer.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <optional>

// ---------------------------------------------------------------------------
// RaylibSpriteRenderer — SpriteRenderer on top of raylib / rlgl.
//
// Must only be used between BeginDrawing() and EndDrawing().
// ---------------------------------------------------------------------------

class RaylibSpriteRenderer : public SpriteRenderer {
public:
    void set_color(const Color4& color) override;
    void set_shader(const std::optional<ShaderRef>& shader) override;
    void draw(const DrawCommand& cmd) override;

private:
    Color tint_ = WHITE;
};

// ---------------------------------------------------------------------------
// RenderSystem — Draw-phase frame bracketing.
//
// Priorities (see RenderModule): BeginFrame < BeginWorld < world batches <
// EndWorld < screen batches < DebugSystem < EndFrame.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void BeginFrame(ecs::World& world);
    static void BeginWorld(ecs::World& world); // enters MainCamera's 2D mode
    static void EndWorld(ecs::World& world);
    static void EndFrame(ecs::World& world);
};
