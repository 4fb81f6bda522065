// PolyForest Geometry
// solid.cpp - Triangle mesh operations

#include <polyforest/geometry/solid.hpp>

#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace polyforest::geometry {

uint32_t Solid::add_vertex(const Vec3& position) {
    vertices.push_back(position);
    return static_cast<uint32_t>(vertices.size() - 1);
}

void Solid::add_triangle(uint32_t a, uint32_t b, uint32_t c, const Color& color) {
    triangles.emplace_back(a, b, c);
    colors.push_back(color);
}

void Solid::set_color(const Color& color) {
    colors.assign(triangles.size(), color);
}

void Solid::translate(const Vec3& offset) {
    for (auto& v : vertices) {
        v += offset;
    }
}

std::optional<BoundingExtent> Solid::extent() const {
    if (vertices.empty()) {
        return std::nullopt;
    }

    BoundingExtent result{vertices.front(), vertices.front()};
    for (const auto& v : vertices) {
        result.min = glm::min(result.min, v);
        result.max = glm::max(result.max, v);
    }
    return result;
}

bool Solid::is_valid() const {
    if (colors.size() != triangles.size()) {
        return false;
    }

    const auto count = vertices.size();
    for (const auto& tri : triangles) {
        if (tri.x >= count || tri.y >= count || tri.z >= count) {
            return false;
        }
    }
    return true;
}

void Solid::append(const Solid& other) {
    // Index bounds of the destination are not rescanned; appending a valid
    // source cannot break them
    if (colors.size() != triangles.size()) {
        throw std::logic_error(fmt::format("Solid::append: destination solid has {} triangles but {} colors",
                                           triangles.size(), colors.size()));
    }
    if (!other.is_valid()) {
        throw std::logic_error(fmt::format("Solid::append: source solid is malformed ({} vertices, "
                                           "{} triangles, {} colors)",
                                           other.vertices.size(), other.triangles.size(), other.colors.size()));
    }
    if (vertices.size() + other.vertices.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::logic_error("Solid::append: merged vertex count exceeds 32-bit index range");
    }

    const auto offset = static_cast<uint32_t>(vertices.size());

    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());

    triangles.reserve(triangles.size() + other.triangles.size());
    for (const auto& tri : other.triangles) {
        triangles.push_back(tri + Triangle(offset));
    }

    colors.insert(colors.end(), other.colors.begin(), other.colors.end());
}

void Solid::reserve(size_t vertex_capacity, size_t triangle_capacity) {
    vertices.reserve(vertex_capacity);
    triangles.reserve(triangle_capacity);
    colors.reserve(triangle_capacity);
}

void Solid::clear() {
    vertices.clear();
    triangles.clear();
    colors.clear();
}

Solid merge_solids(std::span<const Solid> parts) {
    size_t vertex_total = 0;
    size_t triangle_total = 0;
    for (const auto& part : parts) {
        vertex_total += part.vertex_count();
        triangle_total += part.triangle_count();
    }

    Solid merged;
    merged.reserve(vertex_total, triangle_total);
    for (const auto& part : parts) {
        merged.append(part);
    }
    return merged;
}

}  // namespace polyforest::geometry
