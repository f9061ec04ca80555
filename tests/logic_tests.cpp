#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/debug_panel.hpp"
#include "../src/modules/sprite_module.hpp"
#include "../src/pipeline.hpp"
#include "../src/scene.hpp"
#include "../src/systems/camera.hpp"
#include <ecs/ecs.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Everything here is raylib-free: the host-side helpers can be exercised
// headless, without a window or GL context.

using Catch::Matchers::WithinAbs;
using sprite2d::Pipeline;

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — tasks run in ascending priority", "[pipeline]") {
    ecs::World world;
    Pipeline pipeline;
    std::vector<int> order;

    pipeline.add_update([&](ecs::World&, float) { order.push_back(30); }, 30);
    pipeline.add_update([&](ecs::World&, float) { order.push_back(10); }, 10);
    pipeline.add_update([&](ecs::World&, float) { order.push_back(20); }, 20);

    pipeline.update(world, 0.016f);

    REQUIRE(order.size() == 3);
    CHECK(order[0] == 10);
    CHECK(order[1] == 20);
    CHECK(order[2] == 30);
}

TEST_CASE("Pipeline — equal priorities keep registration order", "[pipeline]") {
    ecs::World world;
    Pipeline pipeline;
    std::string trace;

    pipeline.add_render([&](ecs::World&, float) { trace += "a"; }, 5);
    pipeline.add_render([&](ecs::World&, float) { trace += "b"; }, 5);
    pipeline.add_render([&](ecs::World&, float) { trace += "0"; }, 0);
    pipeline.add_render([&](ecs::World&, float) { trace += "c"; }, 5);

    pipeline.render(world);

    CHECK(trace == "0abc");
}

TEST_CASE("Pipeline — phases are independent and every task runs each frame", "[pipeline]") {
    ecs::World world;
    Pipeline pipeline;
    int updates = 0, draws = 0;
    float last_dt = 0.0f;

    pipeline.add_task(Pipeline::Phase::Update, [&](ecs::World&, float dt) { ++updates; last_dt = dt; }, 1000);
    pipeline.add_task(Pipeline::Phase::Draw,   [&](ecs::World&, float)    { ++draws; }, 0);

    CHECK(pipeline.task_count(Pipeline::Phase::Update) == 1);
    CHECK(pipeline.task_count(Pipeline::Phase::Draw)   == 1);

    for (int i = 0; i < 3; ++i) {
        pipeline.update(world, 0.5f);
        pipeline.render(world);
    }

    CHECK(updates == 3);
    CHECK(draws   == 3);
    CHECK(last_dt == 0.5f);
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — rows grouped by section in insertion order", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",  "FPS",   []() { return std::string("60"); });
    panel.watch("Sprites", "World", []() { return std::string("10s, 4r"); });
    panel.watch("Engine",  "Frame", []() { return std::string("16 ms"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[1].title == "Sprites");
    REQUIRE(panel.sections()[0].rows.size() == 2);
    CHECK(panel.sections()[0].rows[1].label == "Frame");
}

TEST_CASE("DebugPanel — read evaluates the provider each call", "[debug]") {
    int counter = 0;
    DebugPanel panel;
    panel.watch("Test", "Count", [&counter]() { return std::to_string(counter); });

    CHECK(panel.read("Test", "Count") == "0");
    counter = 42;
    CHECK(panel.read("Test", "Count") == "42");
    CHECK(panel.read("Test", "Missing") == "-");
    CHECK(panel.read("Nope", "Count") == "-");
    CHECK_FALSE(panel.visible);
}

// ---------------------------------------------------------------------------
// SpriteSceneLoader
// ---------------------------------------------------------------------------

static std::optional<TextureRef> test_textures(const std::string& name) {
    if (name == "checker") return TextureRef{1, 64, 64, 1, 7};
    if (name == "tiles")   return TextureRef{2, 32, 32, 1, 7};
    return std::nullopt;
}

static const char* SPRITE_SCENE = R"({
  "batch": { "camera": "default", "cull_screen": false, "draw_screen": false },
  "sprites": [
    { "texture": "checker", "position": [1.0, 2.0], "size": [64, 32], "z": 5 },
    {
      "texture": "tiles", "position": [10, 20], "offset": [1, 1], "size": [16, 16],
      "frame_size": [16, 16], "frame": [1, 0], "rotation": 0.5,
      "visible": false, "flip_x": true, "flip_y": true, "z": -1
    }
  ]
})";

TEST_CASE("SpriteSceneLoader — sprites are added in file order", "[scene]") {
    SpriteBatch batch;
    REQUIRE(SpriteSceneLoader::load_from_string(SPRITE_SCENE, test_textures, batch));
    REQUIRE(batch.sprites().size() == 2);

    const Sprite& a = *batch.sprites()[0];
    CHECK(a.texture.id == 1);
    CHECK_THAT(a.position.x, WithinAbs(1.0f, 1e-4f));
    CHECK_THAT(a.position.y, WithinAbs(2.0f, 1e-4f));
    CHECK(a.size.x == 64.0f);
    CHECK(a.z == 5.0f);
    // Defaults for omitted fields
    CHECK(a.frame_size.x == 1.0f);
    CHECK(a.offset.x == 0.0f);
    CHECK(a.visible);
    CHECK_FALSE(a.flip_x);

    const Sprite& b = *batch.sprites()[1];
    CHECK(b.texture.id == 2);
    CHECK(b.offset.y == 1.0f);
    CHECK(b.frame.x == 1.0f);
    CHECK(b.frame_size.y == 16.0f);
    CHECK_THAT(b.rotation, WithinAbs(0.5f, 1e-6f));
    CHECK_FALSE(b.visible);
    CHECK(b.flip_x);
    CHECK(b.flip_y);
    CHECK(b.z == -1.0f);
}

TEST_CASE("SpriteSceneLoader — batch options override config", "[scene]") {
    SpriteBatch batch;
    REQUIRE(SpriteSceneLoader::load_from_string(SPRITE_SCENE, test_textures, batch));

    CHECK(std::holds_alternative<UseDefaultCamera>(batch.config().camera));
    CHECK_FALSE(batch.config().cull_in_screen_space);
    CHECK_FALSE(batch.config().draw_in_screen_space);
}

TEST_CASE("SpriteSceneLoader — missing batch block keeps config", "[scene]") {
    SpriteBatchConfig cfg;
    cfg.draw_in_screen_space = false;
    SpriteBatch batch(cfg);

    REQUIRE(SpriteSceneLoader::load_from_string(R"({ "sprites": [] })", test_textures, batch));

    CHECK(std::holds_alternative<NoCulling>(batch.config().camera));
    CHECK(batch.config().cull_in_screen_space);
    CHECK_FALSE(batch.config().draw_in_screen_space);
    CHECK(batch.sprites().empty());
}

TEST_CASE("SpriteSceneLoader — failures leave the batch untouched", "[scene]") {
    SpriteBatch batch;
    batch.add(TextureRef{9, 1, 1, 1, 7});

    SECTION("Malformed JSON") {
        CHECK_FALSE(SpriteSceneLoader::load_from_string("{bad json", test_textures, batch));
    }
    SECTION("Unknown texture after a valid one") {
        CHECK_FALSE(SpriteSceneLoader::load_from_string(R"({
            "sprites": [ { "texture": "checker" }, { "texture": "nope" } ]
        })", test_textures, batch));
    }
    SECTION("Unknown camera mode") {
        CHECK_FALSE(SpriteSceneLoader::load_from_string(R"({
            "batch": { "camera": "sideways" }, "sprites": [ { "texture": "checker" } ]
        })", test_textures, batch));
    }
    SECTION("Missing texture field") {
        CHECK_FALSE(SpriteSceneLoader::load_from_string(R"({
            "sprites": [ { "position": [0, 0] } ]
        })", test_textures, batch));
    }
    SECTION("No resolver") {
        CHECK_FALSE(SpriteSceneLoader::load_from_string(R"({
            "sprites": [ { "texture": "checker" } ]
        })", SpriteSceneLoader::TextureResolver{}, batch));
    }

    CHECK(batch.sprites().size() == 1);
    CHECK(std::holds_alternative<NoCulling>(batch.config().camera));
}

TEST_CASE("SpriteSceneLoader — parse_batch_options applies present keys only", "[scene]") {
    SpriteBatchConfig cfg;
    cfg.draw_in_screen_space = false;

    SECTION("Empty object keeps everything") {
        SpriteSceneLoader::parse_batch_options(nlohmann::json::object(), cfg);
        CHECK(std::holds_alternative<NoCulling>(cfg.camera));
        CHECK(cfg.cull_in_screen_space);
        CHECK_FALSE(cfg.draw_in_screen_space);
    }
    SECTION("Camera modes") {
        SpriteSceneLoader::parse_batch_options({{"camera", "default"}}, cfg);
        CHECK(std::holds_alternative<UseDefaultCamera>(cfg.camera));
        SpriteSceneLoader::parse_batch_options({{"camera", "none"}}, cfg);
        CHECK(std::holds_alternative<NoCulling>(cfg.camera));
    }
    SECTION("Space flags") {
        SpriteSceneLoader::parse_batch_options({{"cull_screen", false}, {"draw_screen", true}}, cfg);
        CHECK_FALSE(cfg.cull_in_screen_space);
        CHECK(cfg.draw_in_screen_space);
    }
    SECTION("Unknown camera mode throws") {
        CHECK_THROWS_AS(SpriteSceneLoader::parse_batch_options({{"camera", "sideways"}}, cfg),
                        std::runtime_error);
    }
}

TEST_CASE("SpriteSceneLoader — missing file returns false", "[scene]") {
    SpriteBatch batch;
    CHECK_FALSE(SpriteSceneLoader::load("does/not/exist.json", test_textures, batch));
    CHECK(batch.sprites().empty());
}

// ---------------------------------------------------------------------------
// SpriteModule
// ---------------------------------------------------------------------------

TEST_CASE("SpriteModule — install registers tasks, resource and debug row", "[module]") {
    ecs::World world;
    Pipeline pipeline;
    world.set_resource(DebugPanel{});

    SpriteBatch& batch = SpriteModule::install(world, pipeline, "World", SpriteBatchConfig{}, 200);

    CHECK(pipeline.task_count(Pipeline::Phase::Update) == 1);
    CHECK(pipeline.task_count(Pipeline::Phase::Draw)   == 1);
    REQUIRE(world.try_resource<SpriteBatches>() != nullptr);
    CHECK(world.resource<SpriteBatches>().find("World") == &batch);
    CHECK(world.resource<SpriteBatches>().find("HUD") == nullptr);

    batch.add(TextureRef{1, 1, 1, 1, 7});
    pipeline.update(world, 0.016f);

    CHECK(world.resource<DebugPanel>().read("Sprites", "World") == "1s, 1r");
}

TEST_CASE("SpriteModule — reinstalling a name keeps the replaced batch running", "[module]") {
    ecs::World world;
    Pipeline pipeline;
    world.set_resource(DebugPanel{});

    SpriteBatch& first = SpriteModule::install(world, pipeline, "World", SpriteBatchConfig{}, 0);
    first.add(TextureRef{1, 1, 1, 1, 7});
    first.add(TextureRef{2, 1, 1, 1, 7});

    SpriteBatch& second = SpriteModule::install(world, pipeline, "World", SpriteBatchConfig{}, 0);
    second.add(TextureRef{3, 1, 1, 1, 7});

    CHECK(world.resource<SpriteBatches>().find("World") == &second);
    CHECK(pipeline.task_count(Pipeline::Phase::Update) == 2);

    pipeline.update(world, 0.016f);
    pipeline.render(world);

    CHECK(first.stats().sprites  == 2);
    CHECK(first.stats().rendered == 2);
    CHECK(second.stats().sprites == 1);

    // Both rows stay; read() returns the first one registered
    CHECK(world.resource<DebugPanel>().read("Sprites", "World") == "2s, 2r");
}

TEST_CASE("SpriteModule — batch update runs after lower-priority game logic", "[module]") {
    ecs::World world;
    Pipeline pipeline;

    SpriteBatch& batch = SpriteModule::install(world, pipeline, "World", SpriteBatchConfig{}, 0);
    Sprite& s = batch.add(TextureRef{1, 1, 1, 1, 7});

    // Game logic at 500 < 0 + 1000: its writes are seen by this frame's update
    pipeline.add_update([&s](ecs::World&, float) { s.position.x += 5.0f; }, 500);

    pipeline.update(world, 0.016f);
    CHECK(s.screen_position.x == 5.0f);
}

// ---------------------------------------------------------------------------
// CameraSystem::apply_input
// ---------------------------------------------------------------------------

TEST_CASE("CameraSystem — pan scales with zoom", "[camera]") {
    MainCamera cam;
    cam.pan_speed = 100.0f;

    CameraSystem::apply_input(cam, {1, 0}, 0, 1.0f);
    CHECK_THAT(cam.target.x, WithinAbs(100.0f, 1e-4f));
    CHECK_THAT(cam.target.y, WithinAbs(0.0f, 1e-4f));

    cam.zoom = 2.0f;
    cam.zoom_index = 0;
    CameraSystem::apply_input(cam, {0, 1}, 0, 1.0f);
    CHECK_THAT(cam.target.y, WithinAbs(50.0f, 1e-4f));
}

TEST_CASE("CameraSystem — zoom index clamps and zoom converges", "[camera]") {
    MainCamera cam;
    CHECK(cam.zoom_index == 1);

    CameraSystem::apply_input(cam, {0, 0}, -1, 0.0f);
    CameraSystem::apply_input(cam, {0, 0}, -1, 0.0f);
    CHECK(cam.zoom_index == 0);

    // Large dt snaps straight to the level
    CameraSystem::apply_input(cam, {0, 0}, 0, 1.0f);
    CHECK_THAT(cam.zoom, WithinAbs(2.0f, 1e-4f));

    CameraSystem::apply_input(cam, {0, 0}, 5, 1.0f);
    CHECK(cam.zoom_index == 2);
    CHECK_THAT(cam.zoom, WithinAbs(0.5f, 1e-4f));
}
