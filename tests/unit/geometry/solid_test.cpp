// PolyForest Geometry Tests
// solid_test.cpp - Unit tests for Solid mesh operations

#include <gtest/gtest.h>

#include <polyforest/geometry/solid.hpp>
#include <stdexcept>
#include <vector>

namespace polyforest::geometry {
namespace {

constexpr Color RED{255, 0, 0, 255};
constexpr Color BLUE{0, 0, 255, 255};

// Single triangle with corners at the given Z offset
Solid make_triangle(double z, const Color& color) {
    Solid solid;
    solid.add_vertex(Vec3(0.0, 0.0, z));
    solid.add_vertex(Vec3(1.0, 0.0, z));
    solid.add_vertex(Vec3(0.0, 1.0, z + 1.0));
    solid.add_triangle(0, 1, 2, color);
    return solid;
}

TEST(SolidTest, EmptyByDefault) {
    Solid solid;
    EXPECT_TRUE(solid.is_empty());
    EXPECT_EQ(solid.vertex_count(), 0u);
    EXPECT_EQ(solid.triangle_count(), 0u);
    EXPECT_FALSE(solid.extent().has_value());
    EXPECT_TRUE(solid.is_valid());
}

TEST(SolidTest, AddVertexReturnsIndex) {
    Solid solid;
    EXPECT_EQ(solid.add_vertex(Vec3(0.0)), 0u);
    EXPECT_EQ(solid.add_vertex(Vec3(1.0)), 1u);
    EXPECT_EQ(solid.add_vertex(Vec3(2.0)), 2u);
}

TEST(SolidTest, OneColorPerTriangle) {
    Solid solid = make_triangle(0.0, RED);
    EXPECT_EQ(solid.colors.size(), solid.triangles.size());
    EXPECT_EQ(solid.colors[0], RED);
    EXPECT_TRUE(solid.is_valid());
}

TEST(SolidTest, ExtentTracksCurrentPositions) {
    Solid solid = make_triangle(2.0, RED);

    auto extent = solid.extent();
    ASSERT_TRUE(extent.has_value());
    EXPECT_DOUBLE_EQ(extent->min.z, 2.0);
    EXPECT_DOUBLE_EQ(extent->max.z, 3.0);
    EXPECT_DOUBLE_EQ(extent->max.x, 1.0);

    solid.translate(Vec3(0.0, 0.0, -5.0));
    extent = solid.extent();
    ASSERT_TRUE(extent.has_value());
    EXPECT_DOUBLE_EQ(extent->min.z, -3.0);
    EXPECT_DOUBLE_EQ(extent->max.z, -2.0);
}

TEST(SolidTest, TranslateMovesEveryVertex) {
    Solid solid = make_triangle(0.0, RED);
    const auto before = solid.vertices;

    solid.translate(Vec3(1.5, -2.0, 3.25));

    ASSERT_EQ(solid.vertices.size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_DOUBLE_EQ(solid.vertices[i].x, before[i].x + 1.5);
        EXPECT_DOUBLE_EQ(solid.vertices[i].y, before[i].y - 2.0);
        EXPECT_DOUBLE_EQ(solid.vertices[i].z, before[i].z + 3.25);
    }
}

TEST(SolidTest, SetColorRepaintsAllTriangles) {
    Solid solid = make_triangle(0.0, RED);
    solid.append(make_triangle(1.0, RED));

    solid.set_color(BLUE);

    ASSERT_EQ(solid.colors.size(), 2u);
    EXPECT_EQ(solid.colors[0], BLUE);
    EXPECT_EQ(solid.colors[1], BLUE);
}

TEST(SolidTest, AppendOffsetsIndices) {
    Solid merged = make_triangle(0.0, RED);
    merged.append(make_triangle(5.0, BLUE));

    ASSERT_EQ(merged.vertex_count(), 6u);
    ASSERT_EQ(merged.triangle_count(), 2u);
    EXPECT_EQ(merged.triangles[0], Triangle(0, 1, 2));
    EXPECT_EQ(merged.triangles[1], Triangle(3, 4, 5));
    EXPECT_EQ(merged.colors[0], RED);
    EXPECT_EQ(merged.colors[1], BLUE);
    EXPECT_DOUBLE_EQ(merged.vertices[3].z, 5.0);
    EXPECT_TRUE(merged.is_valid());
}

TEST(SolidTest, DetectsOutOfRangeIndex) {
    Solid solid = make_triangle(0.0, RED);
    solid.triangles[0].z = 3;
    EXPECT_FALSE(solid.is_valid());
}

TEST(SolidTest, DetectsColorCountMismatch) {
    Solid solid = make_triangle(0.0, RED);
    solid.colors.push_back(BLUE);
    EXPECT_FALSE(solid.is_valid());
}

TEST(SolidTest, AppendRejectsMalformedSource) {
    Solid merged = make_triangle(0.0, RED);
    Solid broken = make_triangle(0.0, RED);
    broken.triangles[0].y = 42;

    EXPECT_THROW(merged.append(broken), std::logic_error);
}

TEST(SolidTest, AppendRejectsMalformedDestination) {
    Solid broken = make_triangle(0.0, RED);
    broken.colors.clear();

    EXPECT_THROW(broken.append(make_triangle(1.0, BLUE)), std::logic_error);
}

TEST(SolidTest, AppendChecksOnlyTheSourceIndices) {
    // Destination index bounds are the caller's responsibility; append only
    // validates what it copies in
    Solid merged = make_triangle(0.0, RED);
    merged.triangles[0].z = 9;

    EXPECT_NO_THROW(merged.append(make_triangle(1.0, BLUE)));
    EXPECT_EQ(merged.triangle_count(), 2u);
    EXPECT_EQ(merged.triangles[1], Triangle(3, 4, 5));
    EXPECT_FALSE(merged.is_valid());
}

TEST(SolidTest, RepeatedAppendStaysValid) {
    Solid merged;
    for (int i = 0; i < 64; ++i) {
        merged.append(make_triangle(static_cast<double>(i), i % 2 == 0 ? RED : BLUE));
    }

    EXPECT_EQ(merged.vertex_count(), 192u);
    EXPECT_EQ(merged.triangles.back(), Triangle(189, 190, 191));
    EXPECT_TRUE(merged.is_valid());
}

TEST(SolidTest, MergeSolidsPreservesOrder) {
    std::vector<Solid> parts;
    parts.push_back(make_triangle(0.0, RED));
    parts.push_back(make_triangle(1.0, BLUE));
    parts.push_back(make_triangle(2.0, RED));

    Solid merged = merge_solids(parts);

    ASSERT_EQ(merged.vertex_count(), 9u);
    ASSERT_EQ(merged.triangle_count(), 3u);
    EXPECT_EQ(merged.triangles[2], Triangle(6, 7, 8));
    EXPECT_EQ(merged.colors[1], BLUE);
    EXPECT_DOUBLE_EQ(merged.vertices[6].z, 2.0);

    for (const auto& tri : merged.triangles) {
        EXPECT_LT(tri.x, merged.vertex_count());
        EXPECT_LT(tri.y, merged.vertex_count());
        EXPECT_LT(tri.z, merged.vertex_count());
    }
}

TEST(SolidTest, MergeOfNothingIsEmpty) {
    std::vector<Solid> parts;
    Solid merged = merge_solids(parts);
    EXPECT_TRUE(merged.is_empty());
}

TEST(SolidTest, ClearRemovesEverything) {
    Solid solid = make_triangle(0.0, RED);
    solid.clear();
    EXPECT_EQ(solid.vertex_count(), 0u);
    EXPECT_EQ(solid.triangle_count(), 0u);
    EXPECT_TRUE(solid.colors.empty());
}

}  // namespace
}  // namespace polyforest::geometry
