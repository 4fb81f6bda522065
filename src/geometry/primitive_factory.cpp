// PolyForest Geometry
// primitive_factory.cpp - Cylinder, icosphere and cone construction

#include <polyforest/core/logger.hpp>
#include <polyforest/core/random_source.hpp>
#include <polyforest/geometry/primitive_factory.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <glm/gtc/constants.hpp>
#include <unordered_map>
#include <utility>

namespace polyforest::geometry {

namespace {

// Point on a horizontal circle of the given radius at height z
[[nodiscard]] Vec3 ring_point(double radius, uint32_t index, uint32_t sections, double z) {
    const double angle = glm::two_pi<double>() * static_cast<double>(index) / static_cast<double>(sections);
    return Vec3(radius * std::cos(angle), radius * std::sin(angle), z);
}

// Regular icosahedron on the unit sphere
void build_icosahedron(std::vector<Vec3>& vertices, std::vector<Triangle>& faces) {
    const double t = (1.0 + std::sqrt(5.0)) / 2.0;

    const std::array<Vec3, 12> corners = {
        Vec3(-1, t, 0), Vec3(1, t, 0), Vec3(-1, -t, 0), Vec3(1, -t, 0),
        Vec3(0, -1, t), Vec3(0, 1, t), Vec3(0, -1, -t), Vec3(0, 1, -t),
        Vec3(t, 0, -1), Vec3(t, 0, 1), Vec3(-t, 0, -1), Vec3(-t, 0, 1),
    };
    for (const auto& c : corners) {
        vertices.push_back(glm::normalize(c));
    }

    faces = {
        Triangle(0, 11, 5), Triangle(0, 5, 1),   Triangle(0, 1, 7),   Triangle(0, 7, 10), Triangle(0, 10, 11),
        Triangle(1, 5, 9),  Triangle(5, 11, 4),  Triangle(11, 10, 2), Triangle(10, 7, 6), Triangle(7, 1, 8),
        Triangle(3, 9, 4),  Triangle(3, 4, 2),   Triangle(3, 2, 6),   Triangle(3, 6, 8),  Triangle(3, 8, 9),
        Triangle(4, 9, 5),  Triangle(2, 4, 11),  Triangle(6, 2, 10),  Triangle(8, 6, 7),  Triangle(9, 8, 1),
    };
}

// Split every face into four, pushing new edge midpoints onto the unit sphere
void subdivide_sphere(std::vector<Vec3>& vertices, std::vector<Triangle>& faces) {
    std::unordered_map<uint64_t, uint32_t> midpoint_cache;

    auto midpoint = [&](uint32_t a, uint32_t b) -> uint32_t {
        const uint64_t lo = std::min(a, b);
        const uint64_t hi = std::max(a, b);
        const uint64_t key = (lo << 32) | hi;

        auto it = midpoint_cache.find(key);
        if (it != midpoint_cache.end()) {
            return it->second;
        }

        vertices.push_back(glm::normalize((vertices[a] + vertices[b]) * 0.5));
        const auto index = static_cast<uint32_t>(vertices.size() - 1);
        midpoint_cache.emplace(key, index);
        return index;
    };

    std::vector<Triangle> refined;
    refined.reserve(faces.size() * 4);
    for (const auto& f : faces) {
        const uint32_t ab = midpoint(f.x, f.y);
        const uint32_t bc = midpoint(f.y, f.z);
        const uint32_t ca = midpoint(f.z, f.x);

        refined.emplace_back(f.x, ab, ca);
        refined.emplace_back(f.y, bc, ab);
        refined.emplace_back(f.z, ca, bc);
        refined.emplace_back(ab, bc, ca);
    }
    faces = std::move(refined);
}

}  // namespace

PrimitiveFactory::PrimitiveFactory(const PrimitiveConfig& config) : config_(config) {}

Solid PrimitiveFactory::make_trunk(double height, double radius) const {
    const uint32_t n = config_.trunk_sections;

    Solid trunk;
    trunk.reserve(2 * n + 2, 4 * n);

    for (uint32_t i = 0; i < n; ++i) {
        trunk.add_vertex(ring_point(radius, i, n, 0.0));
    }
    for (uint32_t i = 0; i < n; ++i) {
        trunk.add_vertex(ring_point(radius, i, n, height));
    }
    const uint32_t bottom_center = trunk.add_vertex(Vec3(0.0, 0.0, 0.0));
    const uint32_t top_center = trunk.add_vertex(Vec3(0.0, 0.0, height));

    const Color color = config_.trunk_color;
    for (uint32_t i = 0; i < n; ++i) {
        const uint32_t j = (i + 1) % n;
        const uint32_t bi = i;
        const uint32_t bj = j;
        const uint32_t ti = n + i;
        const uint32_t tj = n + j;

        // Side quad, outward facing
        trunk.add_triangle(bi, bj, tj, color);
        trunk.add_triangle(bi, tj, ti, color);

        // Caps
        trunk.add_triangle(bottom_center, bj, bi, color);
        trunk.add_triangle(top_center, ti, tj, color);
    }

    POLYFOREST_LOG_TRACE(core::log_category::GEOMETRY, "Trunk h={:.3f} r={:.3f}: {} vertices, {} triangles",
                         height, radius, trunk.vertex_count(), trunk.triangle_count());
    return trunk;
}

Solid PrimitiveFactory::make_round_crown(double radius, const Color& color) const {
    std::vector<Vec3> unit_vertices;
    std::vector<Triangle> faces;
    build_icosahedron(unit_vertices, faces);
    for (uint32_t pass = 0; pass < config_.sphere_subdivisions; ++pass) {
        subdivide_sphere(unit_vertices, faces);
    }

    Solid crown;
    crown.reserve(unit_vertices.size(), faces.size());
    for (const auto& v : unit_vertices) {
        crown.add_vertex(v * radius);
    }
    for (const auto& f : faces) {
        crown.add_triangle(f.x, f.y, f.z, color);
    }

    POLYFOREST_LOG_TRACE(core::log_category::GEOMETRY, "Round crown r={:.3f}: {} vertices, {} triangles", radius,
                         crown.vertex_count(), crown.triangle_count());
    return crown;
}

Solid PrimitiveFactory::make_cone_crown(double radius, double height, uint32_t sections, const Color& color) const {
    const double half = height * 0.5;

    Solid cone;
    cone.reserve(sections + 2, 2 * sections);

    for (uint32_t i = 0; i < sections; ++i) {
        cone.add_vertex(ring_point(radius, i, sections, -half));
    }
    const uint32_t apex = cone.add_vertex(Vec3(0.0, 0.0, half));
    const uint32_t base_center = cone.add_vertex(Vec3(0.0, 0.0, -half));

    for (uint32_t i = 0; i < sections; ++i) {
        const uint32_t j = (i + 1) % sections;
        cone.add_triangle(i, j, apex, color);
        cone.add_triangle(base_center, j, i, color);
    }

    POLYFOREST_LOG_TRACE(core::log_category::GEOMETRY, "Cone crown r={:.3f} h={:.3f} sections={}", radius, height,
                         sections);
    return cone;
}

Color PrimitiveFactory::randomize_color(const ColorRGB& base, core::RandomSource& rng, int32_t variance) {
    const int32_t dr = rng.uniform_int(-variance, variance);
    const int32_t dg = rng.uniform_int(-variance, variance);
    const int32_t db = rng.uniform_int(-variance, variance);
    return opaque(ColorRGB{base.r + dr, base.g + dg, base.b + db});
}

}  // namespace polyforest::geometry
