#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "geostream/geometry/GeometryRepair.h"

namespace {
constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
constexpr float kInf = std::numeric_limits<float>::infinity();

GeometryBuffer triangle(float x0, float x1, float x2) {
    GeometryBuffer buffer;
    buffer.positions = {x0, 0.0f, 0.0f, x1, 1.0f, 0.0f, x2, 0.0f, 1.0f};
    return buffer;
}
}  // namespace

TEST(GeometryRepair, NonFiniteCoordinatesAreZeroed) {
    GeometryBuffer buffer = triangle(kNaN, kInf, -kInf);
    buffer.positions[4] = kNaN;

    const RepairResult result = GeometryRepair::repair(std::move(buffer));

    EXPECT_EQ(result.fixedCount, 4u);
    for (float value : result.buffer.positions) {
        EXPECT_TRUE(std::isfinite(value));
    }
    EXPECT_FLOAT_EQ(result.buffer.positions[0], 0.0f);
    EXPECT_FLOAT_EQ(result.buffer.positions[4], 0.0f);
    EXPECT_FALSE(result.issues.empty());
    EXPECT_EQ(result.meshCount, 1u);
}

TEST(GeometryRepair, CleanGeometryIsUntouched) {
    const RepairResult result = GeometryRepair::repair(triangle(0.0f, 1.0f, 2.0f));

    EXPECT_EQ(result.fixedCount, 0u);
    EXPECT_EQ(result.degenerateTriangles, 0u);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_FALSE(result.usedFallbackSphere);
    EXPECT_GT(result.boundingSphere.radius, 0.0f);
}

TEST(GeometryRepair, DegenerateTrianglesAreFlaggedNotRemoved) {
    GeometryBuffer buffer;
    buffer.positions = {0, 0, 0, 1, 0, 0, 0, 1, 0};
    buffer.indices = {0, 1, 2, 1, 1, 1, 2, 2, 2};

    const RepairResult result = GeometryRepair::repair(std::move(buffer));

    EXPECT_EQ(result.degenerateTriangles, 2u);
    EXPECT_EQ(result.buffer.indices.size(), 9u);
    EXPECT_EQ(result.buffer.triangleCount(), 3u);
}

TEST(GeometryRepair, CoincidentVerticesCountAsDegenerate) {
    GeometryBuffer buffer;
    buffer.positions = {5, 5, 5, 5, 5, 5, 5, 5, 5};
    const RepairResult result = GeometryRepair::repair(std::move(buffer));
    EXPECT_EQ(result.degenerateTriangles, 1u);
    EXPECT_EQ(result.buffer.vertexCount(), 3u);
}

TEST(GeometryRepair, OutOfRangeTrianglesAreRemoved) {
    GeometryBuffer buffer;
    buffer.positions = {0, 0, 0, 1, 0, 0, 0, 1, 0};
    buffer.indices = {0, 1, 2, 0, 1, 7, 2, 1};

    const RepairResult result = GeometryRepair::repair(std::move(buffer));

    ASSERT_EQ(result.buffer.indices.size(), 3u);
    EXPECT_EQ(result.buffer.indices[2], 2u);
}

TEST(GeometryRepair, PartialVertexIsDropped) {
    GeometryBuffer buffer = triangle(0.0f, 1.0f, 2.0f);
    buffer.positions.push_back(4.0f);
    const RepairResult result = GeometryRepair::repair(std::move(buffer));
    EXPECT_EQ(result.buffer.positions.size(), 9u);
}

TEST(GeometryRepair, NonFiniteInDroppedVertexIsStillCounted) {
    GeometryBuffer buffer = triangle(kNaN, 1.0f, 2.0f);
    buffer.positions.push_back(kInf);
    buffer.positions.push_back(kNaN);
    const RepairResult result = GeometryRepair::repair(std::move(buffer));
    EXPECT_EQ(result.fixedCount, 3u);
    EXPECT_EQ(result.buffer.positions.size(), 9u);
    EXPECT_FLOAT_EQ(result.buffer.positions[0], 0.0f);
}

TEST(GeometryRepair, OverflowingExtentsUseFallbackSphere) {
    GeometryBuffer buffer;
    buffer.positions = {-3e38f, -3e38f, -3e38f, 3e38f, 3e38f, 3e38f, 0.0f, 0.0f, 0.0f};

    const RepairResult result = GeometryRepair::repair(std::move(buffer));

    EXPECT_TRUE(result.usedFallbackSphere);
    EXPECT_FLOAT_EQ(result.boundingSphere.radius, GeometryRepair::kFallbackRadius);
    EXPECT_TRUE(std::isfinite(result.boundingSphere.center.x));
    EXPECT_FLOAT_EQ(result.boundingSphere.center.x, 0.0f);
}

TEST(GeometryRepair, AllNaNInputBecomesFiniteOrigin) {
    GeometryBuffer buffer = triangle(kNaN, kNaN, kNaN);
    for (float& value : buffer.positions) {
        value = kNaN;
    }

    const RepairResult result = GeometryRepair::repair(std::move(buffer));

    EXPECT_EQ(result.fixedCount, 9u);
    EXPECT_TRUE(std::isfinite(result.boundingSphere.radius));
    EXPECT_FLOAT_EQ(result.boundingSphere.center.y, 0.0f);
}

TEST(GeometryRepair, FallbackSphereDefaultsMissingAxes) {
    GeometryBuffer buffer;
    buffer.positions = {kNaN, 2.0f, kNaN, kNaN, 4.0f, kNaN};

    const BoundingSphere sphere = GeometryRepair::fallbackSphere(buffer);

    EXPECT_FLOAT_EQ(sphere.center.x, 0.0f);
    EXPECT_FLOAT_EQ(sphere.center.y, 3.0f);
    EXPECT_FLOAT_EQ(sphere.center.z, 0.0f);
    // Extents (-1, 2, -1) .. (1, 4, 1).
    EXPECT_NEAR(sphere.radius, std::sqrt(3.0f), 1e-5f);
}

TEST(GeometryRepair, EmptyBufferStaysEmpty) {
    const RepairResult result = GeometryRepair::repair(GeometryBuffer{});
    EXPECT_TRUE(result.buffer.empty());
    EXPECT_FLOAT_EQ(result.boundingSphere.radius, 0.0f);
}
