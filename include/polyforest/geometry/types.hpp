// PolyForest Geometry
// types.hpp - Vertex, triangle and colour types shared by all meshes

#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cstdint>

namespace polyforest::geometry {

// ============================================================================
// Mesh Element Types (using GLM)
// ============================================================================

// Vertex position. Z is up.
using Vec3 = glm::dvec3;

// Three 0-based indices into a vertex array
using Triangle = glm::u32vec3;

// Fixed four-channel 8-bit colour
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    [[nodiscard]] constexpr bool operator==(const Color& other) const = default;
};

// Base colour without alpha, channels may be perturbed before use
struct ColorRGB {
    int32_t r = 0;
    int32_t g = 0;
    int32_t b = 0;
};

// Clamp a channel value into [0, 255]
[[nodiscard]] constexpr uint8_t clamp_channel(int32_t value) {
    return static_cast<uint8_t>(std::clamp(value, 0, 255));
}

[[nodiscard]] constexpr Color opaque(const ColorRGB& rgb) {
    return Color{clamp_channel(rgb.r), clamp_channel(rgb.g), clamp_channel(rgb.b), 255};
}

// ============================================================================
// Axis-Aligned Extent
// ============================================================================

struct BoundingExtent {
    Vec3 min{0.0};
    Vec3 max{0.0};
};

}  // namespace polyforest::geometry
