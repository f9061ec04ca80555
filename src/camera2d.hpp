#pragma once
#include "math_util.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// CullCamera — visibility query used by SpriteBatch::update().
//
// position is the box centre, size its full extent, both in the camera's own
// input space. SpriteBatch passes either the resolved screen_position or the
// raw position (SpriteBatchConfig::cull_in_screen_space); a transform_fn used
// with a camera must therefore produce coordinates in that camera's space.
// ---------------------------------------------------------------------------

class CullCamera {
public:
    virtual ~CullCamera() = default;
    virtual bool aabb_on_screen(const ecs::Vec2& position, const ecs::Vec2& size) const = 0;
};

// ---------------------------------------------------------------------------
// MainCamera — the host's default 2D camera (World resource).
//
// target is the world point shown at the centre of the viewport. CameraSystem
// writes target/zoom from input; RenderSystem builds a raylib Camera2D from it.
// ---------------------------------------------------------------------------

struct MainCamera : CullCamera {
    ecs::Vec2 target   = {0, 0};
    ecs::Vec2 viewport = {1280, 720};
    float zoom = 1.0f;

    // Input tuning
    float pan_speed = 400.0f;
    int zoom_index = 1; // 0=Near, 1=Default, 2=Far

    ecs::Vec2 world_to_screen(const ecs::Vec2& p) const {
        return {(p.x - target.x) * zoom + viewport.x * 0.5f,
                (p.y - target.y) * zoom + viewport.y * 0.5f};
    }

    ecs::Vec2 screen_to_world(const ecs::Vec2& p) const {
        return {(p.x - viewport.x * 0.5f) / zoom + target.x,
                (p.y - viewport.y * 0.5f) / zoom + target.y};
    }

    // Input space is world space: the box is projected through target and zoom
    // before the viewport test. Pixel coordinates are not accepted as-is.
    bool aabb_on_screen(const ecs::Vec2& position, const ecs::Vec2& size) const override {
        ecs::Vec2 centre = world_to_screen(position);
        ecs::Vec2 extent = sprite2d::math::scale(size, zoom);
        ecs::Vec2 screen_centre = {viewport.x * 0.5f, viewport.y * 0.5f};
        return sprite2d::math::aabb_overlap(centre, extent, screen_centre, viewport);
    }
};
