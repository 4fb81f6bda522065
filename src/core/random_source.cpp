// PolyForest Core
// random_source.cpp - Seeded random source implementation

#include <polyforest/core/random_source.hpp>

#include <cmath>

namespace polyforest::core {

namespace {

// SplitMix64 finalizer, spreads nearby seeds across the whole 64-bit range
[[nodiscard]] uint64_t mix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

[[nodiscard]] std::seed_seq::result_type low_word(uint64_t v) {
    return static_cast<std::seed_seq::result_type>(v & 0xFFFFFFFFULL);
}

[[nodiscard]] std::seed_seq::result_type high_word(uint64_t v) {
    return static_cast<std::seed_seq::result_type>(v >> 32);
}

}  // namespace

SeededRandomSource::SeededRandomSource(uint64_t seed) : seed_(seed) {
    std::seed_seq seq{low_word(seed), high_word(seed)};
    engine_.seed(seq);
}

uint64_t SeededRandomSource::entropy_seed() {
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | static_cast<uint64_t>(device());
}

double SeededRandomSource::uniform(double low, double high) {
    if (!(low < high)) {
        return low;
    }
    std::uniform_real_distribution<double> dist(low, high);
    return dist(engine_);
}

int32_t SeededRandomSource::uniform_int(int32_t low, int32_t high) {
    if (high <= low) {
        return low;
    }
    std::uniform_int_distribution<int32_t> dist(low, high - 1);
    return dist(engine_);
}

double SeededRandomSource::unit() {
    // generate_canonical may round up to 1.0 on some standard libraries
    const double value = uniform(0.0, 1.0);
    return value < 1.0 ? value : std::nextafter(1.0, 0.0);
}

std::unique_ptr<RandomSource> SeededRandomSource::split(uint64_t stream) const {
    return std::make_unique<SeededRandomSource>(mix64(seed_ ^ mix64(stream)));
}

}  // namespace polyforest::core
