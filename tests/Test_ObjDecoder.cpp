#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "TestGeometry.h"
#include "geostream/geometry/ObjDecoder.h"

TEST(ObjDecoder, QuadsAreFanTriangulated) {
    const std::string obj =
        "v 0 0 0\n"
        "v 1 0 0\n"
        "v 1 1 0\n"
        "v 0 1 0\n"
        "f 1 2 3 4\n";

    const GeometryBuffer mesh = ObjDecoder::decode(obj);

    EXPECT_EQ(mesh.vertexCount(), 4u);
    ASSERT_EQ(mesh.triangleCount(), 2u);
    const std::vector<uint32_t> expected = {0, 1, 2, 0, 2, 3};
    EXPECT_EQ(mesh.indices, expected);
}

TEST(ObjDecoder, NegativeIndicesCountFromNewest) {
    const std::string obj =
        "v 0 0 0\n"
        "v 2 0 0\n"
        "v 0 3 0\n"
        "f -3 -2 -1\n";

    const GeometryBuffer mesh = ObjDecoder::decode(obj);

    ASSERT_EQ(mesh.triangleCount(), 1u);
    EXPECT_FLOAT_EQ(mesh.vertex(mesh.indices[1]).x, 2.0f);
    EXPECT_FLOAT_EQ(mesh.vertex(mesh.indices[2]).y, 3.0f);
}

TEST(ObjDecoder, NormalsKeptWhenEveryCornerHasOne) {
    const std::string withNormals =
        "v 0 0 0\nv 1 0 0\nv 0 1 0\n"
        "vn 0 0 1\n"
        "vt 0 0\nvt 1 0\nvt 0 1\n"
        "f 1/1/1 2/2/1 3/3/1\n";
    const GeometryBuffer full = ObjDecoder::decode(withNormals);
    EXPECT_TRUE(full.hasNormals());
    EXPECT_TRUE(full.hasTexcoords());
    EXPECT_EQ(full.normals.size(), 9u);
    EXPECT_EQ(full.texcoords.size(), 6u);

    const std::string mixed =
        "v 0 0 0\nv 1 0 0\nv 0 1 0\nv 1 1 0\n"
        "vn 0 0 1\n"
        "f 1//1 2//1 3//1\n"
        "f 2 4 3\n";
    const GeometryBuffer partial = ObjDecoder::decode(mixed);
    EXPECT_FALSE(partial.hasNormals());
    EXPECT_EQ(partial.triangleCount(), 2u);
}

TEST(ObjDecoder, UnknownRecordsAreSkipped) {
    const std::string obj =
        "# comment\n"
        "mtllib scene.mtl\n"
        "o thing\n"
        "v 0 0 0\r\n"
        "v 1 0 0\r\n"
        "v 0 1 0\r\n"
        "usemtl red\n"
        "s off\n"
        "f 1 2 3\n";
    EXPECT_EQ(ObjDecoder::decode(obj).triangleCount(), 1u);
}

TEST(ObjDecoder, PointsOnlyWithoutFaces) {
    const GeometryBuffer cloud = ObjDecoder::decode(std::string("v 1 2 3\nv 4 5 6\n"));
    EXPECT_FALSE(cloud.indexed());
    EXPECT_EQ(cloud.vertexCount(), 2u);
}

TEST(ObjDecoder, MalformedInputThrows) {
    EXPECT_THROW(ObjDecoder::decode(std::string("")), DecodeError);
    EXPECT_THROW(ObjDecoder::decode(std::string("v 0 0\n")), DecodeError);
    EXPECT_THROW(ObjDecoder::decode(std::string("v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 9\n")), DecodeError);
    EXPECT_THROW(ObjDecoder::decode(std::string("v 0 0 0\nv 1 0 0\nf 1 2\n")), DecodeError);
    EXPECT_THROW(ObjDecoder::decode(std::string("v 0 0 0\nv 1 0 0\nv 0 1 0\nf 0 1 2\n")), DecodeError);
    EXPECT_THROW(ObjDecoder::decode(std::string("v a b c\n")), DecodeError);
}

TEST(ObjDecoder, AbortIsCheckedPerInterval) {
    DecodeCallbacks callbacks;
    int checks = 0;
    callbacks.shouldAbort = [&checks] { return ++checks >= 2; };

    ObjDecoder::Options options;
    options.progressLineInterval = 10;

    EXPECT_THROW(ObjDecoder::decode(testgeo::gridObj(8), callbacks, options), DecodeAborted);
    EXPECT_EQ(checks, 2);
}

TEST(ObjDecoder, ProgressEndsAtOne) {
    DecodeCallbacks callbacks;
    std::vector<float> seen;
    callbacks.onProgress = [&seen](float p) { seen.push_back(p); };

    ObjDecoder::Options options;
    options.progressLineInterval = 16;

    const GeometryBuffer mesh = ObjDecoder::decode(testgeo::gridObj(6), callbacks, options);

    EXPECT_EQ(mesh.triangleCount(), 72u);
    ASSERT_GE(seen.size(), 2u);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i], seen[i - 1]);
    }
    EXPECT_FLOAT_EQ(seen.back(), 1.0f);
}

TEST(ObjDecoder, ByteOverloadMatchesText) {
    const std::string text = testgeo::gridObj(3);
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    const GeometryBuffer fromText = ObjDecoder::decode(text);
    const GeometryBuffer fromBytes = ObjDecoder::decode(bytes);
    EXPECT_EQ(fromText.indices, fromBytes.indices);
    EXPECT_EQ(fromText.positions, fromBytes.positions);
}
