// PolyForest Geometry
// stack_aligner.hpp - Vertical stacking of one solid onto another

#pragma once

#include "solid.hpp"

#include <optional>

namespace polyforest::geometry {

// Vertical interpenetration used for every join in a tree
inline constexpr double DEFAULT_OVERLAP = 0.5;

// Z shift that puts `top`'s lowest point exactly `overlap` below `bottom`'s
// highest point. Both extents are taken from current vertex positions.
// Empty when either solid has no vertices or overlap is negative.
[[nodiscard]] std::optional<double> compute_stack_shift(const Solid& bottom, const Solid& top,
                                                        double overlap = DEFAULT_OVERLAP);

// Translate `top` along Z by compute_stack_shift(). X and Y are untouched.
// Returns false (and leaves `top` unchanged) when no shift can be computed.
bool stack_on_top(const Solid& bottom, Solid& top, double overlap = DEFAULT_OVERLAP);

}  // namespace polyforest::geometry
