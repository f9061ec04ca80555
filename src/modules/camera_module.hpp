#pragma once
#include "../camera2d.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Adds CameraSystem to the Update phase at priority 0 and registers "Camera"
// debug rows. Sprite batch update tasks sit at DrawOrder + 1000, so the camera
// has moved before any batch culls against it.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, sprite2d::Pipeline& pipeline) {
        pipeline.add_update([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); }, 0);

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Target", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                char b[32];
                std::snprintf(b, sizeof(b), "%.0f, %.0f", cam->target.x, cam->target.y);
                return std::string(b);
            });
            panel->watch("Camera", "Zoom", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                char b[16];
                std::snprintf(b, sizeof(b), "%.2fx", cam->zoom);
                return std::string(b);
            });
        }
    }
};
