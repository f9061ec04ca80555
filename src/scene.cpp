#include "scene.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec2 parse_vec2(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>()};
}

static ecs::Vec2 vec2_or(const json& obj, const char* key, ecs::Vec2 fallback) {
    return obj.contains(key) ? parse_vec2(obj[key]) : fallback;
}

static CameraConfig parse_camera(const std::string& s) {
    if (s == "none")    return NoCulling{};
    if (s == "default") return UseDefaultCamera{};
    throw std::runtime_error("SpriteSceneLoader: unknown camera mode '" + s + "'");
}

// Fully-parsed sprite entry, applied only once the whole file is valid.
struct SpriteDef {
    TextureRef texture;
    ecs::Vec2  position, size, offset, frame_size, frame;
    float      z, rotation;
    bool       visible, flip_x, flip_y;
};

static SpriteDef parse_sprite(const json& e, const SpriteSceneLoader::TextureResolver& textures) {
    const std::string name = e.at("texture").get<std::string>();
    std::optional<TextureRef> tex = textures ? textures(name) : std::nullopt;
    if (!tex) throw std::runtime_error("SpriteSceneLoader: unknown texture '" + name + "'");

    SpriteDef d;
    d.texture    = *tex;
    d.position   = vec2_or(e, "position",   {0, 0});
    d.size       = vec2_or(e, "size",       {0, 0});
    d.offset     = vec2_or(e, "offset",     {0, 0});
    d.frame_size = vec2_or(e, "frame_size", {1, 1});
    d.frame      = vec2_or(e, "frame",      {0, 0});
    d.z          = e.value("z",        0.0f);
    d.rotation   = e.value("rotation", 0.0f);
    d.visible    = e.value("visible",  true);
    d.flip_x     = e.value("flip_x",   false);
    d.flip_y     = e.value("flip_y",   false);
    return d;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void SpriteSceneLoader::parse_batch_options(const json& options, SpriteBatchConfig& config) {
    if (options.contains("camera")) config.camera = parse_camera(options["camera"].get<std::string>());
    config.cull_in_screen_space = options.value("cull_screen", config.cull_in_screen_space);
    config.draw_in_screen_space = options.value("draw_screen", config.draw_in_screen_space);
}

bool SpriteSceneLoader::load_from_string(const std::string& json_str,
                                         const TextureResolver& textures,
                                         SpriteBatch& batch) {
    try {
        json scene = json::parse(json_str);

        SpriteBatchConfig config = batch.config();
        if (scene.contains("batch")) parse_batch_options(scene["batch"], config);

        std::vector<SpriteDef> defs;
        if (scene.contains("sprites")) {
            for (const auto& entry : scene["sprites"]) defs.push_back(parse_sprite(entry, textures));
        }

        batch.config() = std::move(config);
        for (const auto& d : defs) {
            Sprite& s    = batch.add(d.texture);
            s.position   = d.position;
            s.size       = d.size;
            s.offset     = d.offset;
            s.frame_size = d.frame_size;
            s.frame      = d.frame;
            s.z          = d.z;
            s.rotation   = d.rotation;
            s.visible    = d.visible;
            s.flip_x     = d.flip_x;
            s.flip_y     = d.flip_y;
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SpriteSceneLoader::load(const std::string& path, const TextureResolver& textures,
                             SpriteBatch& batch) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, textures, batch);
}
