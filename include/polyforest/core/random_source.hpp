// PolyForest Core
// random_source.hpp - Explicit random number capability passed through generation

#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace polyforest::core {

// Source of random draws. Generation code never touches a global generator;
// every call that needs randomness receives one of these.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform real in [low, high)
    [[nodiscard]] virtual double uniform(double low, double high) = 0;

    // Uniform integer in [low, high); returns low when the range is empty
    [[nodiscard]] virtual int32_t uniform_int(int32_t low, int32_t high) = 0;

    // Uniform real in [0, 1), used for weighted choices
    [[nodiscard]] virtual double unit() = 0;

    // Independent stream identified by `stream`. The result depends only on
    // this source's seed and `stream`, never on how many draws were made.
    [[nodiscard]] virtual std::unique_ptr<RandomSource> split(uint64_t stream) const = 0;
};

// Mersenne Twister backed source
class SeededRandomSource final : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    // Seed from std::random_device
    [[nodiscard]] static uint64_t entropy_seed();

    [[nodiscard]] uint64_t seed() const { return seed_; }

    [[nodiscard]] double uniform(double low, double high) override;
    [[nodiscard]] int32_t uniform_int(int32_t low, int32_t high) override;
    [[nodiscard]] double unit() override;
    [[nodiscard]] std::unique_ptr<RandomSource> split(uint64_t stream) const override;

private:
    uint64_t seed_;
    std::mt19937 engine_;
};

}  // namespace polyforest::core
