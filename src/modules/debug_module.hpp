#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include "render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource, registers Engine-level debug rows
// (FPS, Frame Time), and adds DebugSystem to the Draw phase in screen space.
//
// Must be installed BEFORE SpriteModule / CameraModule so that the DebugPanel
// resource exists when they register their rows.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, sprite2d::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); }, DrawOrder::Debug);
    }
};
