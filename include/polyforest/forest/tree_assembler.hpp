// PolyForest Forest Generation
// tree_assembler.hpp - Trunk and crown stacking into finished trees

#pragma once

#include <polyforest/geometry/primitive_factory.hpp>
#include <polyforest/geometry/solid.hpp>
#include <polyforest/geometry/stack_aligner.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace polyforest::core {
class RandomSource;
}

namespace polyforest::forest {

// ============================================================================
// Tree Recipes
// ============================================================================

/// Tree shape identifier
enum class TreeArchetype : uint8_t { Roundy = 0, Pointy, Stacked, Count };

inline constexpr size_t TREE_ARCHETYPE_COUNT = static_cast<size_t>(TreeArchetype::Count);

[[nodiscard]] const char* to_string(TreeArchetype archetype);

// Selector thresholds: r < 0.4 Roundy, r < 0.75 Pointy, otherwise Stacked
inline constexpr double ROUNDY_SELECTOR_LIMIT = 0.4;
inline constexpr double POINTY_SELECTOR_LIMIT = 0.75;

/// Map a uniform draw in [0, 1) to an archetype
[[nodiscard]] TreeArchetype select_archetype(double selector);

/// Uniform range a dimension is drawn from; min == max means fixed (no draw)
struct SampleRange {
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] bool is_fixed() const { return min == max; }
};

enum class CrownShape : uint8_t { Sphere, Cone };

struct TrunkRecipe {
    SampleRange height;
    double radius = 0.7;
};

struct CrownRecipe {
    CrownShape shape = CrownShape::Sphere;
    SampleRange radius;
    SampleRange height;        // Cones only
    uint32_t sections = 0;     // Cones only
    geometry::ColorRGB base_color;
};

/// Complete description of one archetype. Crowns stack bottom to top.
struct TreeRecipe {
    TreeArchetype archetype = TreeArchetype::Roundy;
    std::string name;
    TrunkRecipe trunk;
    std::vector<CrownRecipe> crowns;
};

// ============================================================================
// Tree Assembler
// ============================================================================

struct TreeAssemblerConfig {
    double overlap = geometry::DEFAULT_OVERLAP;  // Interpenetration at every join
    int32_t color_variance = geometry::DEFAULT_COLOR_VARIANCE;
    geometry::PrimitiveConfig primitives;
};

class TreeAssembler {
public:
    explicit TreeAssembler(const TreeAssemblerConfig& config = {});
    ~TreeAssembler();

    // Non-copyable but movable
    TreeAssembler(const TreeAssembler&) = delete;
    TreeAssembler& operator=(const TreeAssembler&) = delete;
    TreeAssembler(TreeAssembler&&) noexcept;
    TreeAssembler& operator=(TreeAssembler&&) noexcept;

    /// Build one tree standing at (position.x, position.y, 0).
    /// Draw order: trunk height, then per crown: height (cones), radius, colour.
    /// Safe to call concurrently as long as each call has its own RandomSource.
    [[nodiscard]] geometry::Solid assemble(TreeArchetype archetype, const glm::dvec2& position,
                                           core::RandomSource& rng) const;

    [[nodiscard]] const TreeRecipe& get_recipe(TreeArchetype archetype) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace polyforest::forest
