#pragma once

#include <glm/glm.hpp>
#include <cmath>

namespace arpg::core {

// Vector types (world space is 2D, in pixels)
using Vec2 = glm::vec2;

// Squared Euclidean distance, avoids the sqrt for radius checks
inline float distance_squared(const Vec2& a, const Vec2& b) {
    Vec2 d = b - a;
    return glm::dot(d, d);
}

// Inclusive radius check
inline bool within_radius(const Vec2& a, const Vec2& b, float radius) {
    return distance_squared(a, b) <= radius * radius;
}

// Replace NaN/inf with a fallback value
inline float finite_or(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

} // namespace arpg::core
