#pragma once
#include "components.hpp"
#include <raylib.h>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// AssetResource — named textures for the sprite scene (World resource).
//
// Textures are generated at load() so the demo runs without image files.
// Must be created after InitWindow() and unloaded before CloseWindow().
// ---------------------------------------------------------------------------

struct AssetResource {
    std::unordered_map<std::string, Texture2D> textures;

    void load() {
        // 4-frame atlas, 32x32 cells: a ball that grows across the strip
        Image atlas = GenImageColor(128, 32, BLANK);
        for (int i = 0; i < 4; ++i) {
            ImageDrawCircle(&atlas, i * 32 + 16, 16, 6 + i * 3, ORANGE);
            ImageDrawCircle(&atlas, i * 32 + 16, 16, 3 + i, YELLOW);
        }
        add("ball", atlas);

        add("checker", GenImageChecked(64, 64, 16, 16, DARKGRAY, GRAY));

        // 2x2 atlas of tiles, 16x16 cells
        Image tiles = GenImageColor(32, 32, BLANK);
        ImageDrawRectangle(&tiles, 0,  0,  16, 16, DARKGREEN);
        ImageDrawRectangle(&tiles, 16, 0,  16, 16, BROWN);
        ImageDrawRectangle(&tiles, 0,  16, 16, 16, DARKBLUE);
        ImageDrawRectangle(&tiles, 16, 16, 16, 16, MAROON);
        add("tiles", tiles);

        std::cout << "Assets loaded: " << textures.size() << " textures." << std::endl;
    }

    void unload() {
        for (auto& [name, tex] : textures) UnloadTexture(tex);
        textures.clear();
    }

    std::optional<TextureRef> texture(const std::string& name) const {
        auto it = textures.find(name);
        if (it == textures.end()) return std::nullopt;
        const Texture2D& t = it->second;
        return TextureRef{t.id, t.width, t.height, t.mipmaps, t.format};
    }

private:
    void add(const std::string& name, Image image) {
        textures[name] = LoadTextureFromImage(image);
        UnloadImage(image);
    }
};
