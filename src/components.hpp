#pragma once

// ---------------------------------------------------------------------------
// Engine-neutral value types shared by the sprite core and the raylib backend.
// No raylib include here: the headless test target compiles against this file.
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White = {1.0f, 1.0f, 1.0f, 1.0f};
}

// Texture as seen by the sprite core. Identity (batching, ordering) is the
// GPU id; width/height/mipmaps/format let the backend rebuild a Texture2D.
struct TextureRef {
    unsigned int id = 0;
    int width = 0;
    int height = 0;
    int mipmaps = 1;
    int format = 7; // PIXELFORMAT_UNCOMPRESSED_R8G8B8A8
};

inline bool operator==(const TextureRef& a, const TextureRef& b) { return a.id == b.id; }
inline bool operator!=(const TextureRef& a, const TextureRef& b) { return a.id != b.id; }

struct ShaderRef {
    unsigned int id = 0;
    int* locs = nullptr;
};

// Sub-rectangle of a texture in atlas pixel space. One instance is reused for
// every sprite in a draw pass.
struct QuadRegion {
    float x = 0.0f;
    float y = 0.0f;
    float w = 1.0f;
    float h = 1.0f;

    void set_viewport(float nx, float ny, float nw, float nh) {
        x = nx; y = ny; w = nw; h = nh;
    }
};
