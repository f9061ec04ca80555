#pragma once
#include "components.hpp"
#include "sprite_batch.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// SpriteSceneLoader — reads a JSON sprite scene into a SpriteBatch.
//
// The "batch" object overrides camera / cull_screen / draw_screen on the
// batch config; each "sprites" entry becomes one SpriteBatch::add(). The whole
// document is parsed and every texture resolved before the batch is touched,
// so a failed load leaves it unchanged.
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class SpriteSceneLoader {
public:
    // Maps a texture name from the scene file to a loaded texture.
    using TextureResolver = std::function<std::optional<TextureRef>(const std::string&)>;

    // Returns false if the file cannot be opened or its contents are invalid.
    static bool load(const std::string& path, const TextureResolver& textures,
                     SpriteBatch& batch);

    // Applies a "batch" object (camera / cull_screen / draw_screen) to config.
    // Absent keys leave config as is. Throws std::runtime_error on an unknown
    // camera mode and nlohmann::json errors on wrong value types.
    static void parse_batch_options(const nlohmann::json& options, SpriteBatchConfig& config);

    // Same as load() without file I/O. Returns false on malformed JSON,
    // unknown camera mode or an unresolved texture name.
    static bool load_from_string(const std::string& json, const TextureResolver& textures,
                                 SpriteBatch& batch);
};
