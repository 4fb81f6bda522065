// PolyForest Forest Generation
// tree_assembler.cpp - Trunk and crown stacking into finished trees

#include <polyforest/core/logger.hpp>
#include <polyforest/core/random_source.hpp>
#include <polyforest/forest/tree_assembler.hpp>

#include <array>
#include <fmt/format.h>
#include <stdexcept>

namespace polyforest::forest {

const char* to_string(TreeArchetype archetype) {
    switch (archetype) {
        case TreeArchetype::Roundy:
            return "Roundy";
        case TreeArchetype::Pointy:
            return "Pointy";
        case TreeArchetype::Stacked:
            return "Stacked";
        default:
            return "Unknown";
    }
}

TreeArchetype select_archetype(double selector) {
    if (selector < ROUNDY_SELECTOR_LIMIT) {
        return TreeArchetype::Roundy;
    }
    if (selector < POINTY_SELECTOR_LIMIT) {
        return TreeArchetype::Pointy;
    }
    return TreeArchetype::Stacked;
}

// ============================================================================
// Implementation Details
// ============================================================================

struct TreeAssembler::Impl {
    TreeAssemblerConfig config;
    geometry::PrimitiveFactory factory;
    std::array<TreeRecipe, TREE_ARCHETYPE_COUNT> recipes;

    explicit Impl(const TreeAssemblerConfig& cfg) : config(cfg), factory(cfg.primitives) { initialize_recipes(); }

    void initialize_recipes() {
        // Roundy - faceted ball on a medium trunk
        recipes[static_cast<size_t>(TreeArchetype::Roundy)] = {
            .archetype = TreeArchetype::Roundy,
            .name = "Roundy",
            .trunk = {.height = {3.0, 6.0}, .radius = 0.7},
            .crowns = {{.shape = CrownShape::Sphere, .radius = {2.5, 4.5}, .base_color = {124, 204, 57}}}};

        // Pointy - single tall cone on a short trunk
        recipes[static_cast<size_t>(TreeArchetype::Pointy)] = {
            .archetype = TreeArchetype::Pointy,
            .name = "Pointy",
            .trunk = {.height = {2.0, 4.0}, .radius = 0.6},
            .crowns = {{.shape = CrownShape::Cone,
                        .radius = {2.5, 4.0},
                        .height = {6.0, 10.0},
                        .sections = 6,
                        .base_color = {34, 139, 34}}}};

        // Stacked - wide lower cone with a smaller fixed-radius cone on top
        recipes[static_cast<size_t>(TreeArchetype::Stacked)] = {
            .archetype = TreeArchetype::Stacked,
            .name = "Stacked",
            .trunk = {.height = {2.0, 3.0}, .radius = 0.7},
            .crowns = {{.shape = CrownShape::Cone,
                        .radius = {3.0, 4.0},
                        .height = {3.0, 5.0},
                        .sections = 7,
                        .base_color = {46, 139, 87}},
                       {.shape = CrownShape::Cone,
                        .radius = {2.0, 2.0},
                        .height = {2.0, 4.0},
                        .sections = 7,
                        .base_color = {143, 188, 143}}}};
    }

    [[nodiscard]] static double sample(const SampleRange& range, core::RandomSource& rng) {
        if (range.is_fixed()) {
            return range.min;
        }
        return rng.uniform(range.min, range.max);
    }

    [[nodiscard]] geometry::Solid make_crown(const CrownRecipe& recipe, core::RandomSource& rng) const {
        if (recipe.shape == CrownShape::Sphere) {
            const double radius = sample(recipe.radius, rng);
            const auto color = geometry::PrimitiveFactory::randomize_color(recipe.base_color, rng,
                                                                            config.color_variance);
            return factory.make_round_crown(radius, color);
        }

        const double height = sample(recipe.height, rng);
        const double radius = sample(recipe.radius, rng);
        const auto color =
            geometry::PrimitiveFactory::randomize_color(recipe.base_color, rng, config.color_variance);
        return factory.make_cone_crown(radius, height, recipe.sections, color);
    }
};

TreeAssembler::TreeAssembler(const TreeAssemblerConfig& config) : impl_(std::make_unique<Impl>(config)) {}

TreeAssembler::~TreeAssembler() = default;

TreeAssembler::TreeAssembler(TreeAssembler&&) noexcept = default;
TreeAssembler& TreeAssembler::operator=(TreeAssembler&&) noexcept = default;

geometry::Solid TreeAssembler::assemble(TreeArchetype archetype, const glm::dvec2& position,
                                        core::RandomSource& rng) const {
    const TreeRecipe& recipe = get_recipe(archetype);

    std::vector<geometry::Solid> parts;
    parts.reserve(1 + recipe.crowns.size());

    const double trunk_height = Impl::sample(recipe.trunk.height, rng);
    parts.push_back(impl_->factory.make_trunk(trunk_height, recipe.trunk.radius));

    for (const auto& crown_recipe : recipe.crowns) {
        geometry::Solid crown = impl_->make_crown(crown_recipe, rng);
        if (!geometry::stack_on_top(parts.back(), crown, impl_->config.overlap)) {
            throw std::logic_error(
                fmt::format("TreeAssembler: failed to stack {} crown {}", recipe.name, parts.size()));
        }
        parts.push_back(std::move(crown));
    }

    geometry::Solid tree = geometry::merge_solids(parts);
    tree.translate(geometry::Vec3(position.x, position.y, 0.0));

    POLYFOREST_LOG_TRACE(core::log_category::FOREST, "{} tree at ({:.2f}, {:.2f}): trunk {:.2f}, {} triangles",
                         recipe.name, position.x, position.y, trunk_height, tree.triangle_count());
    return tree;
}

const TreeRecipe& TreeAssembler::get_recipe(TreeArchetype archetype) const {
    const auto index = static_cast<size_t>(archetype);
    if (index >= TREE_ARCHETYPE_COUNT) {
        throw std::out_of_range(fmt::format("TreeAssembler: invalid archetype {}", index));
    }
    return impl_->recipes[index];
}

}  // namespace polyforest::forest
