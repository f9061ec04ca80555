#pragma once
#include "components.hpp"
#include "sprite_renderer.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// Sprite — one textured quad owned by a SpriteBatch.
//
// Game code mutates the public fields between frames. screen_position,
// screen_rotation and on_screen are outputs of SpriteBatch::update() and mean
// nothing before the first update.
// ---------------------------------------------------------------------------

struct Sprite {
    explicit Sprite(TextureRef tex) : texture(tex) {}

    // World space
    ecs::Vec2 position = {0, 0};
    ecs::Vec2 size     = {0, 0};
    ecs::Vec2 offset   = {0, 0};

    // Atlas cell: frame_size must be non-zero on both axes
    ecs::Vec2 frame_size = {1, 1};
    ecs::Vec2 frame      = {0, 0};

    float z = 0.0f;
    float rotation = 0.0f; // radians, about the centre

    bool visible   = true;
    bool on_screen = true;
    bool flip_x    = false;
    bool flip_y    = false;

    TextureRef texture;

    // Resolved each update
    ecs::Vec2 screen_position = {0, 0};
    float screen_rotation = 0.0f;

    // Configures quad for this sprite's atlas cell and returns the submission.
    // Pure; exposed for unit testing.
    DrawCommand draw_command(QuadRegion& quad, bool use_screen_space) const;

    // Exactly one renderer.draw() call. Renderer errors are not caught.
    void draw(QuadRegion& quad, bool use_screen_space, SpriteRenderer& renderer) const;
};
