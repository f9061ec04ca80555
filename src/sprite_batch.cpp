#include "sprite_batch.hpp"
#include "math_util.hpp"
#include <algorithm>
#include <cstdio>

using namespace sprite2d;

Sprite& SpriteBatch::add(TextureRef texture) {
    sprites_.push_back(std::make_unique<Sprite>(texture));
    return *sprites_.back();
}

void SpriteBatch::remove(const Sprite& sprite) {
    auto it = std::find_if(sprites_.begin(), sprites_.end(),
        [&](const std::unique_ptr<Sprite>& s) { return s.get() == &sprite; });
    if (it == sprites_.end()) return;

    // Drop any dangling pointer before the sprite is freed
    render_list_.erase(std::remove(render_list_.begin(), render_list_.end(), it->get()),
                       render_list_.end());
    sprites_.erase(it);
}

void SpriteBatch::update(const CullCamera* camera) {
    resolve_transforms();
    cull(camera);
    sort_render_list();

    stats_.sprites  = sprites_.size();
    stats_.rendered = render_list_.size();
}

void SpriteBatch::resolve_transforms() {
    if (config_.transform_fn) {
        // Partial write: whatever the function leaves out keeps last frame's value
        for (auto& s : sprites_) {
            ScreenTransform t = config_.transform_fn(*s);
            if (t.x)        s->screen_position.x = *t.x;
            if (t.y)        s->screen_position.y = *t.y;
            if (t.rotation) s->screen_rotation   = *t.rotation + s->rotation;
        }
    } else {
        for (auto& s : sprites_) {
            s->screen_position = math::add(s->position, s->offset);
            s->screen_rotation = s->rotation;
        }
    }
}

void SpriteBatch::cull(const CullCamera* camera) {
    render_list_.clear();
    render_list_.reserve(sprites_.size());

    // on_screen is rewritten for every sprite, not only those kept
    for (auto& s : sprites_) {
        bool keep = s->visible;
        if (keep && camera) {
            const ecs::Vec2& pos = config_.cull_in_screen_space ? s->screen_position : s->position;
            keep = camera->aabb_on_screen(pos, s->size);
        }
        s->on_screen = keep;
        if (keep) render_list_.push_back(s.get());
    }
}

void SpriteBatch::sort_render_list() {
    struct Key {
        float   z;
        int     texture_rank;
        Sprite* sprite;
    };

    // Rank in render-list order so "first seen" does not depend on the
    // comparison order of the sort.
    std::vector<Key> keys;
    keys.reserve(render_list_.size());
    for (Sprite* s : render_list_) {
        keys.push_back({s->z, texture_order_.rank(s->texture), s});
    }

    std::stable_sort(keys.begin(), keys.end(), [](const Key& a, const Key& b) {
        if (a.z == b.z) return a.texture_rank < b.texture_rank;
        return a.z < b.z;
    });

    for (std::size_t i = 0; i < keys.size(); ++i) render_list_[i] = keys[i].sprite;
}

void SpriteBatch::draw(SpriteRenderer& renderer) {
    renderer.set_color(Colors::White);
    renderer.set_shader(config_.shader);
    for (Sprite* s : render_list_) {
        s->draw(quad_, config_.draw_in_screen_space, renderer);
    }
}

const CullCamera* SpriteBatch::resolve_camera(const CameraConfig& camera, ecs::World& world) {
    if (std::holds_alternative<UseDefaultCamera>(camera)) {
        return world.try_resource<MainCamera>();
    }
    if (const auto* custom = std::get_if<CustomCamera>(&camera)) {
        return custom->camera;
    }
    return nullptr;
}

void SpriteBatch::register_tasks(const std::shared_ptr<SpriteBatch>& batch,
                                 Pipeline& pipeline, int order) {
    pipeline.add_update([batch](ecs::World& w, float) {
        batch->update(resolve_camera(batch->config_.camera, w));
    }, order + 1000);

    pipeline.add_render([batch](ecs::World& w, float) {
        auto* renderer = w.try_resource<std::shared_ptr<SpriteRenderer>>();
        if (!renderer || !*renderer) return;
        batch->draw(**renderer);
    }, order);
}

void SpriteBatch::add_debug_watch(const std::shared_ptr<SpriteBatch>& batch,
                                  const std::string& name, DebugPanel& panel) {
    panel.watch("Sprites", name, [batch]() { return batch->debug_summary(); });
}

std::string SpriteBatch::debug_summary() const {
    char b[48];
    std::snprintf(b, sizeof(b), "%zus, %zur", stats_.sprites, stats_.rendered);
    return std::string(b);
}
