// PolyForest Core Tests
// random_source_test.cpp - Seeded random source tests

#include <gtest/gtest.h>

#include <polyforest/core/random_source.hpp>
#include <vector>

namespace polyforest::core {
namespace {

std::vector<double> draw(RandomSource& rng, int count) {
    std::vector<double> values;
    values.reserve(count);
    for (int i = 0; i < count; ++i) {
        values.push_back(rng.uniform(-10.0, 10.0));
    }
    return values;
}

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(12345);
    SeededRandomSource b(12345);
    EXPECT_EQ(draw(a, 100), draw(b, 100));
}

TEST(SeededRandomSourceTest, DifferentSeedsDiffer) {
    SeededRandomSource a(1);
    SeededRandomSource b(2);
    EXPECT_NE(draw(a, 16), draw(b, 16));
}

TEST(SeededRandomSourceTest, ReportsSeed) {
    SeededRandomSource rng(0xDEADBEEFCAFEULL);
    EXPECT_EQ(rng.seed(), 0xDEADBEEFCAFEULL);
}

TEST(SeededRandomSourceTest, UniformStaysInHalfOpenRange) {
    SeededRandomSource rng(99);
    for (int i = 0; i < 10000; ++i) {
        const double value = rng.uniform(2.5, 4.5);
        EXPECT_GE(value, 2.5);
        EXPECT_LT(value, 4.5);
    }
}

TEST(SeededRandomSourceTest, UnitStaysBelowOne) {
    SeededRandomSource rng(7);
    for (int i = 0; i < 10000; ++i) {
        const double value = rng.unit();
        EXPECT_GE(value, 0.0);
        EXPECT_LT(value, 1.0);
    }
}

TEST(SeededRandomSourceTest, UniformIntExcludesUpperBound) {
    SeededRandomSource rng(31);
    bool saw_low = false;
    bool saw_top = false;
    for (int i = 0; i < 10000; ++i) {
        const int32_t value = rng.uniform_int(-25, 25);
        EXPECT_GE(value, -25);
        EXPECT_LT(value, 25);
        saw_low = saw_low || value == -25;
        saw_top = saw_top || value == 24;
    }
    EXPECT_TRUE(saw_low);
    EXPECT_TRUE(saw_top);
}

TEST(SeededRandomSourceTest, EmptyRangesReturnLow) {
    SeededRandomSource rng(5);
    EXPECT_DOUBLE_EQ(rng.uniform(2.0, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(rng.uniform(3.0, 1.0), 3.0);
    EXPECT_EQ(rng.uniform_int(4, 4), 4);
    EXPECT_EQ(rng.uniform_int(4, -4), 4);
}

TEST(SeededRandomSourceTest, SplitIgnoresParentDraws) {
    SeededRandomSource fresh(2024);
    SeededRandomSource used(2024);
    (void)draw(used, 50);

    auto a = fresh.split(3);
    auto b = used.split(3);
    EXPECT_EQ(draw(*a, 32), draw(*b, 32));
}

TEST(SeededRandomSourceTest, SplitStreamsAreDistinct) {
    SeededRandomSource rng(2024);
    auto first = rng.split(0);
    auto second = rng.split(1);
    EXPECT_NE(draw(*first, 16), draw(*second, 16));

    // A split stream is not a copy of its parent
    SeededRandomSource parent(2024);
    auto child = parent.split(0);
    EXPECT_NE(draw(parent, 16), draw(*child, 16));
}

TEST(SeededRandomSourceTest, SplitDoesNotAdvanceParent) {
    SeededRandomSource a(77);
    SeededRandomSource b(77);
    (void)a.split(10);
    EXPECT_EQ(draw(a, 8), draw(b, 8));
}

}  // namespace
}  // namespace polyforest::core
