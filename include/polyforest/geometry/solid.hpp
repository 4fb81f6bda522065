// PolyForest Geometry
// solid.hpp - Self-contained triangle mesh with per-triangle colour

#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace polyforest::geometry {

// Owned triangle mesh. Every triangle indexes this solid's own vertices and
// carries exactly one colour, so colors.size() == triangles.size() always.
struct Solid {
    std::vector<Vec3> vertices;
    std::vector<Triangle> triangles;
    std::vector<Color> colors;

    [[nodiscard]] size_t vertex_count() const { return vertices.size(); }
    [[nodiscard]] size_t triangle_count() const { return triangles.size(); }
    [[nodiscard]] bool is_empty() const { return triangles.empty(); }

    // Append a vertex and return its index
    uint32_t add_vertex(const Vec3& position);

    void add_triangle(uint32_t a, uint32_t b, uint32_t c, const Color& color);

    // Repaint every triangle
    void set_color(const Color& color);

    // Rigidly move every vertex
    void translate(const Vec3& offset);

    // Extent of the current vertex positions; empty when there are no vertices
    [[nodiscard]] std::optional<BoundingExtent> extent() const;

    // True when all indices are in range and colour count matches triangle count
    [[nodiscard]] bool is_valid() const;

    // Concatenate another solid, offsetting its indices by this solid's vertex count.
    // Throws std::logic_error if either solid breaks the index or colour invariant.
    void append(const Solid& other);

    void reserve(size_t vertex_capacity, size_t triangle_capacity);
    void clear();
};

// Merge solids in order into a new solid
[[nodiscard]] Solid merge_solids(std::span<const Solid> parts);

}  // namespace polyforest::geometry
