#include "camera2d.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "sprite_batch.hpp"
#include "modules/camera_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/render_module.hpp"
#include "modules/sprite_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cmath>
#include <iostream>
#include <string>

static const char* SCENE_PATH = "resources/scenes/sprites.json";

// Scatters animated balls over a 4000x4000 area so culling has work to do.
static void spawn_field(SpriteBatch& batch, const TextureRef& ball) {
    for (int gy = 0; gy < 40; ++gy) {
        for (int gx = 0; gx < 40; ++gx) {
            Sprite& s    = batch.add(ball);
            s.position   = {-2000.0f + gx * 100.0f, -2000.0f + gy * 100.0f};
            s.size       = {48, 48};
            s.frame_size = {32, 32};
            s.frame      = {static_cast<float>((gx + gy) % 4), 0};
            s.z          = static_cast<float>((gx * 7 + gy * 3) % 5);
        }
    }
}

int main() {
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(1280, 720, "Sprite Batch - Culling & Sorting");
    SetTargetFPS(60);

    ecs::World world;
    sprite2d::Pipeline pipeline;

    // Debug first: later modules add rows to its panel
    DebugModule::install(world, pipeline);
    RenderModule::install(world, pipeline);
    CameraModule::install(world, pipeline);

    auto resolve = [&world](const std::string& name) {
        return world.resource<AssetResource>().texture(name);
    };

    // --- World batch: culled against MainCamera, drawn under the 2D camera ---
    SpriteBatchConfig world_cfg;
    world_cfg.camera = UseDefaultCamera{};
    SpriteBatch& world_batch = SpriteModule::install(world, pipeline, "World", world_cfg, DrawOrder::World);

    if (!SpriteSceneLoader::load(SCENE_PATH, resolve, world_batch)) {
        std::cerr << "Failed to load sprite scene: " << SCENE_PATH << std::endl;
    }
    const auto ball = resolve("ball");
    if (ball) spawn_field(world_batch, *ball);

    // --- HUD batch: screen space, no culling; the transform only drives x ---
    SpriteBatchConfig hud_cfg;
    hud_cfg.transform_fn = [](const Sprite& s) {
        ScreenTransform t;
        t.x = s.position.x + 12.0f * std::sin(static_cast<float>(GetTime()) * 2.0f);
        return t;
    };
    SpriteBatch& hud = SpriteModule::install(world, pipeline, "HUD", hud_cfg, DrawOrder::Screen);
    if (auto tiles = resolve("tiles")) {
        for (int i = 0; i < 4; ++i) {
            Sprite& s          = hud.add(*tiles);
            s.position         = {60.0f + i * 72.0f, 660.0f};
            s.screen_position  = s.position;
            s.size             = {48, 48};
            s.frame_size       = {16, 16};
            s.frame            = {static_cast<float>(i % 2), static_cast<float>(i / 2)};
        }
    }

    // --- Game logic: mutate sprites before the batches update (priority < 1000) ---
    const unsigned int ball_id = ball ? ball->id : 0;
    pipeline.add_update([&world_batch, ball_id](ecs::World&, float dt) {
        static float anim_time = 0.0f;
        anim_time += dt;
        const bool flip  = IsKeyPressed(KEY_SPACE);
        const int  frame = static_cast<int>(anim_time * 8.0f);
        int i = 0;
        for (const auto& s : world_batch.sprites()) {
            if (s->texture.id != ball_id) continue;
            s->frame.x   = static_cast<float>((frame + i++) % 4);
            s->rotation += dt;
            if (flip) s->flip_x = !s->flip_x;
        }
    }, 500);

    std::cout << "Sprite batches ready: " << world_batch.sprites().size() << " world, "
              << hud.sprites().size() << " hud." << std::endl;

    // --- Main Loop ---
    while (!WindowShouldClose()) {
        float dt = GetFrameTime();
        pipeline.update(world, dt);
        pipeline.render(world);
    }

    RenderModule::shutdown(world);
    CloseWindow();
    return 0;
}
