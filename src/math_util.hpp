#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cmath>

namespace sprite2d::math {

inline ecs::Vec2 add(const ecs::Vec2& a, const ecs::Vec2& b) {
    return {a.x + b.x, a.y + b.y};
}

inline ecs::Vec2 scale(const ecs::Vec2& v, float s) {
    return {v.x * s, v.y * s};
}

inline float rad_to_deg(float rad) {
    return rad * (180.0f / 3.1415926535f);
}

/**
 * @brief Overlap test for two centre/extent boxes.
 * Touching edges count as overlapping.
 */
inline bool aabb_overlap(const ecs::Vec2& a_centre, const ecs::Vec2& a_size,
                         const ecs::Vec2& b_centre, const ecs::Vec2& b_size) {
    float dx = std::abs(a_centre.x - b_centre.x);
    float dy = std::abs(a_centre.y - b_centre.y);
    return dx <= 0.5f * (std::abs(a_size.x) + std::abs(b_size.x)) &&
           dy <= 0.5f * (std::abs(a_size.y) + std::abs(b_size.y));
}

} // namespace sprite2d::math
