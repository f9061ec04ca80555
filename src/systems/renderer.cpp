#include "renderer.hpp"
#include "../camera2d.hpp"
#include "../math_util.hpp"
#include <raylib.h>
#include <rlgl.h>
#include <cmath>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static inline Texture2D to_raylib(const TextureRef& t) {
    return Texture2D{t.id, t.width, t.height, t.mipmaps, t.format};
}

void RaylibSpriteRenderer::set_color(const Color4& color) {
    tint_ = to_raylib(color);
}

void RaylibSpriteRenderer::set_shader(const std::optional<ShaderRef>& shader) {
    if (shader) {
        BeginShaderMode(Shader{shader->id, shader->locs});
    } else {
        EndShaderMode();
    }
}

void RaylibSpriteRenderer::draw(const DrawCommand& cmd) {
    // Mirroring goes through the source rect: a negative geometry scale would
    // flip the winding and get back-face culled.
    Rectangle source = {cmd.quad.x, cmd.quad.y, cmd.quad.w, cmd.quad.h};
    if (cmd.sx < 0.0f) source.width  = -source.width;
    if (cmd.sy < 0.0f) source.height = -source.height;

    rlPushMatrix();
    rlTranslatef(cmd.x, cmd.y, 0.0f);
    rlRotatef(sprite2d::math::rad_to_deg(cmd.rotation), 0.0f, 0.0f, 1.0f);
    rlScalef(std::abs(cmd.sx), std::abs(cmd.sy), 1.0f);
    if (cmd.kx != 0.0f || cmd.ky != 0.0f) {
        // Column-major: x' = x + kx*y, y' = ky*x + y
        float shear[16] = {
            1.0f,   cmd.ky, 0.0f, 0.0f,
            cmd.kx, 1.0f,   0.0f, 0.0f,
            0.0f,   0.0f,   1.0f, 0.0f,
            0.0f,   0.0f,   0.0f, 1.0f,
        };
        rlMultMatrixf(shear);
    }
    DrawTextureRec(to_raylib(cmd.texture), source, {-cmd.ox, -cmd.oy}, tint_);
    rlPopMatrix();
}

void RenderSystem::BeginFrame(World&) {
    BeginDrawing();
    ClearBackground({35, 35, 40, 255});
}

void RenderSystem::BeginWorld(World& world) {
    Camera2D camera = {};
    camera.zoom = 1.0f;
    if (auto* cam = world.try_resource<MainCamera>()) {
        camera.offset = {cam->viewport.x * 0.5f, cam->viewport.y * 0.5f};
        camera.target = {cam->target.x, cam->target.y};
        camera.zoom   = cam->zoom;
    }
    BeginMode2D(camera);
}

void RenderSystem::EndWorld(World&) {
    EndMode2D();
}

void RenderSystem::EndFrame(World&) {
    EndShaderMode();
    DrawFPS(10, 10);
    DrawText("WASD / ARROWS: Pan | Z,X: Zoom | SPACE: Toggle Flip | F3: Debug", 10, 30, 20, LIGHTGRAY);
    EndDrawing();
}
