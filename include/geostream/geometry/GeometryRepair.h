#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "geostream/geometry/GeometryBuffer.h"

struct BoundingSphere {
    glm::vec3 center{0.0f};
    float radius = 0.0f;
};

struct RepairResult {
    GeometryBuffer buffer;
    // Coordinate slots that held NaN or Infinity and were replaced by zero.
    std::size_t fixedCount = 0;
    std::size_t meshCount = 0;
    std::size_t degenerateTriangles = 0;
    BoundingSphere boundingSphere;
    bool usedFallbackSphere = false;
    std::vector<std::string> issues;
};

class GeometryRepair {
public:
    static constexpr float kFallbackRadius = 10.0f;
    static constexpr std::size_t kMaxReportedDegenerates = 8;

    // Never throws. The returned buffer is always safe to hand to a renderer.
    static RepairResult repair(GeometryBuffer&& buffer);

    static BoundingSphere computeBoundingSphere(const GeometryBuffer& buffer);
    static BoundingSphere fallbackSphere(const GeometryBuffer& buffer);

private:
    static std::size_t replaceNonFinite(std::vector<float>& values);
    static bool isDegenerate(const GeometryBuffer& buffer, uint32_t a, uint32_t b, uint32_t c);
};
