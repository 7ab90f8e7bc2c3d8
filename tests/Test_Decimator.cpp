#include <gtest/gtest.h>

#include <stdexcept>

#include "TestGeometry.h"
#include "geostream/geometry/Decimator.h"
#include "geostream/geometry/ObjDecoder.h"

namespace {
GeometryBuffer unindexedTriangles(std::size_t count) {
    GeometryBuffer buffer;
    for (std::size_t t = 0; t < count; ++t) {
        const float x = static_cast<float>(t);
        buffer.positions.insert(buffer.positions.end(), {x, 0, 0, x + 1, 0, 0, x, 1, 0});
    }
    return buffer;
}
}  // namespace

TEST(Decimator, SameInputGivesSameOutput) {
    const GeometryBuffer mesh = ObjDecoder::decode(testgeo::gridObj(10));
    const GeometryBuffer a = Decimator::decimate(mesh, 0.3f);
    const GeometryBuffer b = Decimator::decimate(mesh, 0.3f);
    EXPECT_EQ(a.indices, b.indices);
    EXPECT_EQ(a.positions, b.positions);
}

TEST(Decimator, KeptCountGrowsWithFactor) {
    const GeometryBuffer mesh = ObjDecoder::decode(testgeo::gridObj(10));
    ASSERT_EQ(mesh.triangleCount(), 200u);

    std::size_t previous = 0;
    for (float factor : {0.02f, 0.05f, 0.1f, 0.2f, 0.3f, 0.5f, 1.0f}) {
        const GeometryBuffer out = Decimator::decimate(mesh, factor);
        EXPECT_EQ(out.triangleCount(), Decimator::keptTriangleCount(200, factor)) << factor;
        EXPECT_GE(out.triangleCount(), previous) << factor;
        previous = out.triangleCount();
    }
    EXPECT_EQ(previous, 200u);
}

TEST(Decimator, IndexedOutputIsCompacted) {
    const GeometryBuffer mesh = ObjDecoder::decode(testgeo::gridObj(10));
    const GeometryBuffer out = Decimator::decimate(mesh, 0.1f);

    EXPECT_LT(out.vertexCount(), mesh.vertexCount());
    for (uint32_t index : out.indices) {
        EXPECT_LT(index, out.vertexCount());
    }
}

TEST(Decimator, AlwaysKeepsOneTriangle) {
    const GeometryBuffer mesh = unindexedTriangles(10);
    const GeometryBuffer out = Decimator::decimate(mesh, 0.001f);
    EXPECT_EQ(out.triangleCount(), 1u);
    EXPECT_EQ(out.positions.size(), 9u);
    EXPECT_EQ(Decimator::keptTriangleCount(10, 0.001f), 1u);
}

TEST(Decimator, UnindexedTrianglesAreCopiedWhole) {
    const GeometryBuffer out = Decimator::decimate(unindexedTriangles(10), 0.5f);
    ASSERT_EQ(out.triangleCount(), 5u);
    // Triangles 1, 3, 5, 7 and 9 survive.
    EXPECT_FLOAT_EQ(out.positions[0], 1.0f);
    EXPECT_FLOAT_EQ(out.positions[9], 3.0f);
}

TEST(Decimator, FullFactorReturnsCopy) {
    const GeometryBuffer mesh = unindexedTriangles(4);
    EXPECT_EQ(Decimator::decimate(mesh, 1.0f).positions, mesh.positions);
    EXPECT_EQ(Decimator::decimate(mesh, 2.0f).positions, mesh.positions);
}

TEST(Decimator, RejectsNonPositiveFactor) {
    const GeometryBuffer mesh = unindexedTriangles(4);
    EXPECT_THROW(Decimator::decimate(mesh, 0.0f), std::invalid_argument);
    EXPECT_THROW(Decimator::decimate(mesh, -0.5f), std::invalid_argument);
}

TEST(Decimator, AbortStopsWork) {
    EXPECT_THROW(Decimator::decimate(unindexedTriangles(4), 0.5f, [] { return true; }), DecodeAborted);
}
