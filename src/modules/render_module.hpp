#pragma once
#include "../assets.hpp"
#include "../camera2d.hpp"
#include "../pipeline.hpp"
#include "../sprite_renderer.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// Draw-phase priorities. Sprite batches drawn under the camera use World,
// HUD batches use Screen.
namespace DrawOrder {
    constexpr int BeginFrame = 0;
    constexpr int BeginWorld = 100;
    constexpr int World      = 200;
    constexpr int EndWorld   = 300;
    constexpr int Screen     = 400;
    constexpr int Debug      = 900;
    constexpr int EndFrame   = 1000;
}

// ---------------------------------------------------------------------------
// RenderModule
//
// Loads the AssetResource (textures), creates the MainCamera and
// SpriteRenderer world resources, and adds the frame/camera brackets to the
// Draw phase.
//
// shutdown() must be called before CloseWindow() to unload GPU resources.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, sprite2d::Pipeline& pipeline) {
        AssetResource assets;
        assets.load();
        world.set_resource(assets);
        world.set_resource(MainCamera{});
        world.set_resource(std::shared_ptr<SpriteRenderer>(std::make_shared<RaylibSpriteRenderer>()));

        pipeline.add_render([](ecs::World& w, float) { RenderSystem::BeginFrame(w); }, DrawOrder::BeginFrame);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::BeginWorld(w); }, DrawOrder::BeginWorld);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::EndWorld(w); },   DrawOrder::EndWorld);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::EndFrame(w); },   DrawOrder::EndFrame);
    }

    static void shutdown(ecs::World& world) {
        world.resource<AssetResource>().unload();
    }
};
