// PolyForest Geometry
// stack_aligner.cpp - Vertical stacking of one solid onto another

#include <polyforest/core/logger.hpp>
#include <polyforest/geometry/stack_aligner.hpp>

namespace polyforest::geometry {

std::optional<double> compute_stack_shift(const Solid& bottom, const Solid& top, double overlap) {
    if (overlap < 0.0) {
        POLYFOREST_LOG_ERROR(core::log_category::GEOMETRY, "Stack overlap must be non-negative, got {}", overlap);
        return std::nullopt;
    }

    const auto bottom_extent = bottom.extent();
    const auto top_extent = top.extent();
    if (!bottom_extent || !top_extent) {
        POLYFOREST_LOG_ERROR(core::log_category::GEOMETRY, "Cannot stack: {} solid has no vertices",
                             bottom_extent ? "top" : "bottom");
        return std::nullopt;
    }

    const double bottom_top_z = bottom_extent->max.z;
    const double top_bottom_z = top_extent->min.z;
    return (bottom_top_z - overlap) - top_bottom_z;
}

bool stack_on_top(const Solid& bottom, Solid& top, double overlap) {
    const auto shift_z = compute_stack_shift(bottom, top, overlap);
    if (!shift_z) {
        return false;
    }

    top.translate(Vec3(0.0, 0.0, *shift_z));
    return true;
}

}  // namespace polyforest::geometry
