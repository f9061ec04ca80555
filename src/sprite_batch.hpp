#pragma once
#include "camera2d.hpp"
#include "components.hpp"
#include "debug_panel.hpp"
#include "pipeline.hpp"
#include "sprite.hpp"
#include "sprite_renderer.hpp"
#include "texture_order.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Result of a screen transform function. Missing components leave the
// sprite's previous screen-space value in place.
struct ScreenTransform {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> rotation; // added to Sprite::rotation
};

// Camera used for culling by the scheduled update task.
struct NoCulling {};
struct UseDefaultCamera {}; // the World's MainCamera resource
struct CustomCamera {
    const CullCamera* camera = nullptr; // not owned
};
using CameraConfig = std::variant<NoCulling, UseDefaultCamera, CustomCamera>;

struct SpriteBatchConfig {
    std::function<ScreenTransform(const Sprite&)> transform_fn;
    CameraConfig camera = NoCulling{};
    bool cull_in_screen_space = true;
    bool draw_in_screen_space = true;
    std::optional<ShaderRef> shader;
};

// ---------------------------------------------------------------------------
// SpriteBatch — owns a flat list of sprites and renders the visible ones
// sorted by (z, texture).
//
// update(): resolve screen transform → cull → stable sort → debug counters.
// draw():   one renderer draw per render-list sprite, sharing one quad.
//
// Sprites live on the heap; the Sprite& returned by add() stays valid until
// that sprite is removed or the batch is destroyed.
// ---------------------------------------------------------------------------

class SpriteBatch {
public:
    struct Stats {
        std::size_t sprites  = 0;
        std::size_t rendered = 0;
    };

    SpriteBatch() = default;
    explicit SpriteBatch(SpriteBatchConfig config) : config_(std::move(config)) {}

    SpriteBatch(const SpriteBatch&)            = delete;
    SpriteBatch& operator=(const SpriteBatch&) = delete;

    Sprite& add(TextureRef texture);

    // Removes the first entry that is this exact sprite. No-op if absent.
    void remove(const Sprite& sprite);

    // camera == nullptr disables culling; only `visible` is consulted.
    void update(const CullCamera* camera = nullptr);

    void draw(SpriteRenderer& renderer);

    // Update task at order + 1000, draw task at order. Both tasks hold a
    // reference to the batch, so it lives as long as the pipeline does.
    static void register_tasks(const std::shared_ptr<SpriteBatch>& batch,
                               sprite2d::Pipeline& pipeline, int order);

    // "<N>s, <M>r" under the "Sprites" section; the row keeps the batch alive.
    static void add_debug_watch(const std::shared_ptr<SpriteBatch>& batch,
                                const std::string& name, DebugPanel& panel);

    // "<N>s, <M>r" from the last update.
    std::string debug_summary() const;

    // Camera the scheduled update task culls against. nullptr = no culling.
    static const CullCamera* resolve_camera(const CameraConfig& camera, ecs::World& world);

    const std::vector<std::unique_ptr<Sprite>>& sprites() const { return sprites_; }
    const std::vector<Sprite*>& render_list() const { return render_list_; }
    const Stats& stats() const { return stats_; }

    SpriteBatchConfig&       config()       { return config_; }
    const SpriteBatchConfig& config() const { return config_; }

private:
    void resolve_transforms();
    void cull(const CullCamera* camera);
    void sort_render_list();

    SpriteBatchConfig                     config_;
    std::vector<std::unique_ptr<Sprite>>  sprites_;
    std::vector<Sprite*>                  render_list_;
    TextureOrderRegistry                  texture_order_;
    QuadRegion                            quad_;
    Stats                                 stats_;
};
