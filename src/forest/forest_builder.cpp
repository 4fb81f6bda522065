// PolyForest Forest Generation
// forest_builder.cpp - Tree scattering and scene buffer assembly

#include <polyforest/core/config.hpp>
#include <polyforest/core/logger.hpp>
#include <polyforest/core/random_source.hpp>
#include <polyforest/forest/forest_builder.hpp>
#include <polyforest/platform/timer.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace polyforest::forest {

geometry::Solid make_ground_quad(double plot_size) {
    const double s = plot_size / GROUND_EXTENT_DIVISOR;

    geometry::Solid ground;
    ground.reserve(4, 2);
    ground.add_vertex(geometry::Vec3(-s, -s, GROUND_Z));
    ground.add_vertex(geometry::Vec3(s, -s, GROUND_Z));
    ground.add_vertex(geometry::Vec3(s, s, GROUND_Z));
    ground.add_vertex(geometry::Vec3(-s, s, GROUND_Z));

    // Fan around vertex 0
    ground.add_triangle(0, 1, 2, GROUND_COLOR);
    ground.add_triangle(0, 2, 3, GROUND_COLOR);
    return ground;
}

// ============================================================================
// Forest
// ============================================================================

Forest::Forest(geometry::Solid mesh, std::vector<TreePlacement> trees, double plot_size, ForestStats stats)
    : mesh_(std::move(mesh)), trees_(std::move(trees)), plot_size_(plot_size), stats_(stats) {}

uint32_t Forest::ground_first_triangle() const {
    if (trees_.empty()) {
        return 0;
    }
    const auto& last = trees_.back();
    return last.first_triangle + last.triangle_count;
}

uint32_t Forest::ground_first_vertex() const {
    if (trees_.empty()) {
        return 0;
    }
    const auto& last = trees_.back();
    return last.first_vertex + last.vertex_count;
}

// ============================================================================
// Forest Builder
// ============================================================================

ForestBuilderConfig ForestBuilderConfig::from_config(const core::Config& config) {
    ForestBuilderConfig result;
    result.assembler.overlap =
        config.get_double(core::config_section::GENERATION, core::config_key::OVERLAP, geometry::DEFAULT_OVERLAP);

    const int threads = config.get_int(core::config_section::PERFORMANCE, core::config_key::WORKER_THREADS, 1);
    result.worker_threads = static_cast<uint32_t>(std::max(threads, 1));

    result.enforce_recognized_ranges =
        config.get_bool(core::config_section::DEBUG, core::config_key::ENFORCE_RECOGNIZED_RANGES, true);
    return result;
}

struct ForestBuilder::Impl {
    ForestBuilderConfig config;
    TreeAssembler assembler;

    explicit Impl(const ForestBuilderConfig& cfg) : config(cfg), assembler(cfg.assembler) {}

    // Build trees[i] for every index, on worker threads when configured
    void build_trees(std::span<const TreeArchetype> archetypes, std::span<const glm::dvec2> positions,
                     std::vector<std::unique_ptr<core::RandomSource>>& streams,
                     std::vector<geometry::Solid>& trees) const {
        const size_t count = archetypes.size();
        const size_t thread_count = std::min<size_t>(std::max<uint32_t>(config.worker_threads, 1), count);

        if (thread_count <= 1) {
            for (size_t i = 0; i < count; ++i) {
                trees[i] = assembler.assemble(archetypes[i], positions[i], *streams[i]);
            }
            return;
        }

        std::exception_ptr failure;
        std::mutex failure_mutex;
        std::vector<std::thread> threads;
        threads.reserve(thread_count);

        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t]() {
                try {
                    // Each worker owns every thread_count-th tree; slots never overlap
                    for (size_t i = t; i < count; i += thread_count) {
                        trees[i] = assembler.assemble(archetypes[i], positions[i], *streams[i]);
                    }
                } catch (...) {
                    std::lock_guard lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
    }
};

ForestBuilder::ForestBuilder(const ForestBuilderConfig& config) : impl_(std::make_unique<Impl>(config)) {}

ForestBuilder::~ForestBuilder() = default;

ForestBuilder::ForestBuilder(ForestBuilder&&) noexcept = default;
ForestBuilder& ForestBuilder::operator=(ForestBuilder&&) noexcept = default;

ConfigError ForestBuilder::check(const GenerationConfig& config) const {
    if (impl_->config.assembler.overlap < 0.0) {
        return ConfigError::NegativeOverlap;
    }
    return validate(config, impl_->config.enforce_recognized_ranges);
}

std::optional<Forest> ForestBuilder::build(const GenerationConfig& config, core::RandomSource& rng) const {
    const ConfigError error = check(config);
    if (error != ConfigError::None) {
        POLYFOREST_LOG_ERROR(core::log_category::FOREST, "Invalid configuration (trees={}, plot_size={}): {}",
                             config.tree_count, config.plot_size, to_string(error));
        return std::nullopt;
    }

    platform::Timer timer;
    const auto tree_count = static_cast<size_t>(config.tree_count);
    const double half_plot = static_cast<double>(config.plot_size) / 2.0;

    // Root stream: all positions first, then one selector per tree
    std::vector<glm::dvec2> positions(tree_count);
    for (auto& position : positions) {
        position.x = rng.uniform(-half_plot, half_plot);
        position.y = rng.uniform(-half_plot, half_plot);
    }

    std::vector<TreeArchetype> archetypes(tree_count);
    for (auto& archetype : archetypes) {
        archetype = select_archetype(rng.unit());
    }

    std::vector<std::unique_ptr<core::RandomSource>> streams;
    streams.reserve(tree_count);
    for (size_t i = 0; i < tree_count; ++i) {
        streams.push_back(rng.split(i));
    }

    std::vector<geometry::Solid> trees(tree_count);
    impl_->build_trees(archetypes, positions, streams, trees);

    // Merge in tree index order, recording each tree's slice of the buffer
    ForestStats stats;
    std::vector<TreePlacement> placements;
    placements.reserve(tree_count);

    geometry::Solid ground = make_ground_quad(static_cast<double>(config.plot_size));

    size_t vertex_total = ground.vertex_count();
    size_t triangle_total = ground.triangle_count();
    for (const auto& tree : trees) {
        vertex_total += tree.vertex_count();
        triangle_total += tree.triangle_count();
    }

    geometry::Solid mesh;
    mesh.reserve(vertex_total, triangle_total);
    for (size_t i = 0; i < tree_count; ++i) {
        TreePlacement placement;
        placement.archetype = archetypes[i];
        placement.position = positions[i];
        placement.first_vertex = static_cast<uint32_t>(mesh.vertex_count());
        placement.vertex_count = static_cast<uint32_t>(trees[i].vertex_count());
        placement.first_triangle = static_cast<uint32_t>(mesh.triangle_count());
        placement.triangle_count = static_cast<uint32_t>(trees[i].triangle_count());

        mesh.append(trees[i]);
        placements.push_back(placement);
        ++stats.archetype_counts[static_cast<size_t>(archetypes[i])];
    }
    trees.clear();

    mesh.append(ground);

    stats.tree_count = static_cast<uint32_t>(tree_count);
    stats.vertex_count = mesh.vertex_count();
    stats.triangle_count = mesh.triangle_count();
    stats.generation_time_ms = timer.elapsed_milliseconds();

    POLYFOREST_LOG_INFO(core::log_category::FOREST,
                        "Built forest: {} trees ({} roundy, {} pointy, {} stacked), {} vertices, {} triangles "
                        "in {:.2f}ms",
                        stats.tree_count, stats.count(TreeArchetype::Roundy), stats.count(TreeArchetype::Pointy),
                        stats.count(TreeArchetype::Stacked), stats.vertex_count, stats.triangle_count,
                        stats.generation_time_ms);

    return Forest(std::move(mesh), std::move(placements), static_cast<double>(config.plot_size), stats);
}

}  // namespace polyforest::forest
