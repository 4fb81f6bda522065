// PolyForest Geometry
// primitive_factory.hpp - Low-poly trunk and crown solids

#pragma once

#include "solid.hpp"
#include "types.hpp"

#include <cstdint>

namespace polyforest::core {
class RandomSource;
}

namespace polyforest::geometry {

// Fixed trunk colour (opaque brown)
inline constexpr Color TRUNK_COLOR{101, 67, 33, 255};

// Default per-channel colour jitter
inline constexpr int32_t DEFAULT_COLOR_VARIANCE = 25;

struct PrimitiveConfig {
    uint32_t trunk_sections = 5;       // Segments around the trunk cylinder
    uint32_t sphere_subdivisions = 1;  // Icosahedron subdivision passes for round crowns
    Color trunk_color = TRUNK_COLOR;
};

// Builds the elementary solids trees are made of.
//
// Only the trunk is anchored: its base sits on local Z=0. Round crowns are
// centred on the origin and cones span Z in [-height/2, +height/2]. Stacking
// works from current extents, so crowns must stay unanchored.
class PrimitiveFactory {
public:
    explicit PrimitiveFactory(const PrimitiveConfig& config = {});

    // Closed cylinder from Z=0 to Z=height
    [[nodiscard]] Solid make_trunk(double height, double radius) const;

    // Subdivided icosahedron of the given radius centred on the origin
    [[nodiscard]] Solid make_round_crown(double radius, const Color& color) const;

    // Closed cone, base circle at Z=-height/2, apex at Z=+height/2
    [[nodiscard]] Solid make_cone_crown(double radius, double height, uint32_t sections, const Color& color) const;

    // Jitter each RGB channel by an integer in [-variance, variance), clamp to [0,255].
    // Alpha is always 255. Channels are drawn in R, G, B order.
    [[nodiscard]] static Color randomize_color(const ColorRGB& base, core::RandomSource& rng,
                                               int32_t variance = DEFAULT_COLOR_VARIANCE);

private:
    PrimitiveConfig config_;
};

}  // namespace polyforest::geometry
