#pragma once
#include "components.hpp"
#include <cstddef>
#include <unordered_map>

// ---------------------------------------------------------------------------
// TextureOrderRegistry — first-seen rank per texture id.
//
// Only used as the secondary sort key in SpriteBatch so sprites sharing a
// texture end up adjacent inside a z layer. Ranks depend on lookup order and
// are not stable across runs.
// ---------------------------------------------------------------------------

class TextureOrderRegistry {
public:
    int rank(const TextureRef& tex) {
        auto it = ranks_.find(tex.id);
        if (it != ranks_.end()) return it->second;
        int r = static_cast<int>(ranks_.size());
        ranks_.emplace(tex.id, r);
        return r;
    }

    std::size_t size() const { return ranks_.size(); }

private:
    std::unordered_map<unsigned int, int> ranks_;
};
