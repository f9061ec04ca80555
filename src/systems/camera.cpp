#include "camera.hpp"
#include <raylib.h>

using namespace ecs;

void CameraSystem::Update(World& world, float dt) {
    auto* cam = world.try_resource<MainCamera>();
    if (!cam) return;

    cam->viewport = {static_cast<float>(GetScreenWidth()), static_cast<float>(GetScreenHeight())};

    ecs::Vec2 pan = {0, 0};
    if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT))  pan.x -= 1.0f;
    if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT)) pan.x += 1.0f;
    if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP))    pan.y -= 1.0f;
    if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN))  pan.y += 1.0f;

    int zoom_delta = 0;
    if (IsKeyPressed(KEY_X)) zoom_delta++;
    if (IsKeyPressed(KEY_Z)) zoom_delta--;

    apply_input(*cam, pan, zoom_delta, dt);
}
