#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../sprite_batch.hpp"
#include <ecs/ecs.hpp>
#include <memory>
#include <string>
#include <unordered_map>

// Named sprite batches (World resource). Lookup only: the pipeline tasks and
// debug row hold their own shared_ptr to each batch.
struct SpriteBatches {
    std::unordered_map<std::string, std::shared_ptr<SpriteBatch>> by_name;

    SpriteBatch* find(const std::string& name) const {
        auto it = by_name.find(name);
        return it == by_name.end() ? nullptr : it->second.get();
    }
};

// ---------------------------------------------------------------------------
// SpriteModule
//
// Creates a SpriteBatch, stores it under `name` in the SpriteBatches
// resource, registers its update (order + 1000) and draw (order) tasks, and
// adds a "Sprites" debug row when a DebugPanel exists.
//
// Installing a second batch under an existing name replaces the lookup entry;
// the first batch keeps running, owned by its tasks.
// ---------------------------------------------------------------------------

struct SpriteModule {
    static SpriteBatch& install(ecs::World& world, sprite2d::Pipeline& pipeline,
                                const std::string& name, SpriteBatchConfig config, int order) {
        if (!world.try_resource<SpriteBatches>()) world.set_resource(SpriteBatches{});

        auto batch = std::make_shared<SpriteBatch>(std::move(config));
        SpriteBatch::register_tasks(batch, pipeline, order);

        if (auto* panel = world.try_resource<DebugPanel>()) {
            SpriteBatch::add_debug_watch(batch, name, *panel);
        }

        world.resource<SpriteBatches>().by_name[name] = batch;
        return *batch;
    }
};
