#pragma once
#include "components.hpp"
#include <optional>

// One textured-quad submission. Transform order when realised by a backend:
// translate(x, y) * rotate(rotation) * scale(sx, sy) * shear(kx, ky) * translate(-ox, -oy).
struct DrawCommand {
    TextureRef texture;
    QuadRegion quad;
    float x = 0.0f, y = 0.0f;
    float rotation = 0.0f; // radians
    float sx = 1.0f, sy = 1.0f;
    float ox = 0.0f, oy = 0.0f;
    float kx = 0.0f, ky = 0.0f;
};

// ---------------------------------------------------------------------------
// SpriteRenderer — the draw primitive SpriteBatch::draw() talks to.
//
// RaylibSpriteRenderer (systems/renderer.hpp) is the real one; tests record.
// Stored in the World as std::shared_ptr<SpriteRenderer>.
// ---------------------------------------------------------------------------

class SpriteRenderer {
public:
    virtual ~SpriteRenderer() = default;

    virtual void set_color(const Color4& color) = 0;
    // std::nullopt restores the default shader.
    virtual void set_shader(const std::optional<ShaderRef>& shader) = 0;
    virtual void draw(const DrawCommand& cmd) = 0;
};
