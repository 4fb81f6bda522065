// PolyForest Forest Generation
// forest_builder.hpp - Tree scattering and scene buffer assembly

#pragma once

#include "generation_config.hpp"
#include "tree_assembler.hpp"

#include <polyforest/geometry/solid.hpp>

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace polyforest::core {
class Config;
class RandomSource;
}  // namespace polyforest::core

namespace polyforest::forest {

// ============================================================================
// Ground Plane
// ============================================================================

inline constexpr double GROUND_Z = -0.1;
inline constexpr double GROUND_EXTENT_DIVISOR = 1.8;  // Half-width = plot_size / 1.8
inline constexpr geometry::Color GROUND_COLOR{160, 200, 120, 255};

/// Flat two-triangle quad centred on the origin, corners at +-plot_size/1.8
[[nodiscard]] geometry::Solid make_ground_quad(double plot_size);

// ============================================================================
// Forest Buffer
// ============================================================================

/// Where one tree ended up and which slice of the buffer it owns
struct TreePlacement {
    TreeArchetype archetype = TreeArchetype::Roundy;
    glm::dvec2 position{0.0};
    uint32_t first_vertex = 0;
    uint32_t vertex_count = 0;
    uint32_t first_triangle = 0;
    uint32_t triangle_count = 0;
};

struct ForestStats {
    std::array<uint32_t, TREE_ARCHETYPE_COUNT> archetype_counts{};
    uint32_t tree_count = 0;
    size_t vertex_count = 0;
    size_t triangle_count = 0;
    double generation_time_ms = 0.0;

    [[nodiscard]] uint32_t count(TreeArchetype archetype) const {
        return archetype_counts[static_cast<size_t>(archetype)];
    }
};

/// Final merged scene: all trees in index order followed by the ground quad.
/// Immutable once built.
class Forest {
public:
    Forest(geometry::Solid mesh, std::vector<TreePlacement> trees, double plot_size, ForestStats stats);

    [[nodiscard]] std::span<const geometry::Vec3> vertices() const { return mesh_.vertices; }
    [[nodiscard]] std::span<const geometry::Triangle> triangles() const { return mesh_.triangles; }
    [[nodiscard]] std::span<const geometry::Color> colors() const { return mesh_.colors; }

    [[nodiscard]] const geometry::Solid& mesh() const { return mesh_; }
    [[nodiscard]] std::span<const TreePlacement> trees() const { return trees_; }
    [[nodiscard]] double plot_size() const { return plot_size_; }
    [[nodiscard]] const ForestStats& stats() const { return stats_; }

    // Ground quad triangles follow every tree triangle
    [[nodiscard]] uint32_t ground_first_triangle() const;
    [[nodiscard]] uint32_t ground_first_vertex() const;

private:
    geometry::Solid mesh_;
    std::vector<TreePlacement> trees_;
    double plot_size_;
    ForestStats stats_;
};

// ============================================================================
// Forest Builder
// ============================================================================

struct ForestBuilderConfig {
    TreeAssemblerConfig assembler;
    uint32_t worker_threads = 1;            // 1 = build on the calling thread
    bool enforce_recognized_ranges = true;  // Reject tree/plot values outside recognized ranges

    // Read "generation.overlap", "performance.worker_threads" and
    // "debug.enforce_recognized_ranges"
    [[nodiscard]] static ForestBuilderConfig from_config(const core::Config& config);
};

class ForestBuilder {
public:
    explicit ForestBuilder(const ForestBuilderConfig& config = {});
    ~ForestBuilder();

    // Non-copyable but movable
    ForestBuilder(const ForestBuilder&) = delete;
    ForestBuilder& operator=(const ForestBuilder&) = delete;
    ForestBuilder(ForestBuilder&&) noexcept;
    ForestBuilder& operator=(ForestBuilder&&) noexcept;

    /// Validate `config` and build the full scene buffer.
    ///
    /// Ground positions (x then y per tree) and archetype selectors are drawn
    /// from `rng` in tree order; each tree's dimensions and colours come from
    /// rng.split(tree_index), so the result is identical for any worker count.
    /// Returns nullopt (after logging) if validation fails; no work is done then.
    [[nodiscard]] std::optional<Forest> build(const GenerationConfig& config, core::RandomSource& rng) const;

    /// Validation result build() would act on
    [[nodiscard]] ConfigError check(const GenerationConfig& config) const;


private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace polyforest::forest
