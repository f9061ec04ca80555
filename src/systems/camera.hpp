#pragma once
#include "../camera2d.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>

// Pans and zooms the MainCamera resource from keyboard input.
// Runs in the Update phase, before any sprite batch update task.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pure state transition — no raylib dependency. Exposed for unit testing.
    // pan: unit-ish direction in screen axes; zoom_delta: -1, 0 or +1 steps.
    static void apply_input(MainCamera& cam, ecs::Vec2 pan, int zoom_delta, float dt) {
        static const float zoom_levels[] = {2.0f, 1.0f, 0.5f};

        cam.zoom_index = std::clamp(cam.zoom_index + zoom_delta, 0, 2);
        float target_zoom = zoom_levels[cam.zoom_index];
        cam.zoom += (target_zoom - cam.zoom) * std::min(1.0f, 8.0f * dt);

        // Pan speed is in screen pixels, so divide by zoom for world units
        cam.target.x += pan.x * cam.pan_speed * dt / cam.zoom;
        cam.target.y += pan.y * cam.pan_speed * dt / cam.zoom;
    }
};
