#include "geostream/geometry/GeometryRepair.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace {
bool isFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
}  // namespace

RepairResult GeometryRepair::repair(GeometryBuffer&& buffer) {
    RepairResult result;
    result.buffer = std::move(buffer);
    result.meshCount = 1;
    GeometryBuffer& mesh = result.buffer;

    // fixedCount covers the slots of a trailing partial vertex too.
    result.fixedCount = replaceNonFinite(mesh.positions);
    if (result.fixedCount > 0) {
        result.issues.push_back("positions: replaced " + std::to_string(result.fixedCount) + " NaN/Infinity values with 0");
    }

    const std::size_t partial = mesh.positions.size() % 3;
    if (partial != 0) {
        mesh.positions.resize(mesh.positions.size() - partial);
        result.issues.push_back("positions: dropped " + std::to_string(partial) + " trailing values of a partial vertex");
    }

    const std::size_t fixedNormals = replaceNonFinite(mesh.normals);
    if (fixedNormals > 0) {
        result.issues.push_back("normals: replaced " + std::to_string(fixedNormals) + " NaN/Infinity values with 0");
    }

    const std::size_t vertexCount = mesh.vertexCount();
    if (mesh.indexed()) {
        const std::size_t trailing = mesh.indices.size() % 3;
        if (trailing != 0) {
            mesh.indices.resize(mesh.indices.size() - trailing);
            result.issues.push_back("indices: dropped " + std::to_string(trailing) + " trailing indices of a partial triangle");
        }

        // Out-of-range triangles cannot be drawn; everything else is kept.
        std::size_t write = 0;
        std::size_t outOfRange = 0;
        for (std::size_t read = 0; read < mesh.indices.size(); read += 3) {
            const uint32_t a = mesh.indices[read];
            const uint32_t b = mesh.indices[read + 1];
            const uint32_t c = mesh.indices[read + 2];
            if (a >= vertexCount || b >= vertexCount || c >= vertexCount) {
                ++outOfRange;
                continue;
            }
            if (isDegenerate(mesh, a, b, c)) {
                if (result.degenerateTriangles < kMaxReportedDegenerates) {
                    result.issues.push_back("degenerate triangle " + std::to_string(write / 3));
                }
                ++result.degenerateTriangles;
            }
            mesh.indices[write] = a;
            mesh.indices[write + 1] = b;
            mesh.indices[write + 2] = c;
            write += 3;
        }
        mesh.indices.resize(write);
        if (outOfRange > 0) {
            result.issues.push_back("indices: removed " + std::to_string(outOfRange) + " triangles referencing missing vertices");
        }
    } else {
        for (std::size_t t = 0; t + 2 < vertexCount; t += 3) {
            const uint32_t a = static_cast<uint32_t>(t);
            if (isDegenerate(mesh, a, a + 1, a + 2)) {
                if (result.degenerateTriangles < kMaxReportedDegenerates) {
                    result.issues.push_back("degenerate triangle " + std::to_string(t / 3));
                }
                ++result.degenerateTriangles;
            }
        }
    }

    if (result.degenerateTriangles > kMaxReportedDegenerates) {
        result.issues.push_back(std::to_string(result.degenerateTriangles) + " degenerate triangles in total");
    }

    result.boundingSphere = computeBoundingSphere(mesh);
    if (!isFinite(result.boundingSphere.center) || !std::isfinite(result.boundingSphere.radius)) {
        result.boundingSphere = fallbackSphere(mesh);
        result.usedFallbackSphere = true;
        result.issues.push_back("bounding sphere: computed from extents fallback");
    }

    if (!result.issues.empty()) {
        std::cerr << "GeometryRepair: " << result.issues.size() << " issue(s), " << result.fixedCount
                  << " coordinates fixed, " << result.degenerateTriangles << " degenerate triangles." << std::endl;
    }

    return result;
}

BoundingSphere GeometryRepair::computeBoundingSphere(const GeometryBuffer& buffer) {
    BoundingSphere sphere;
    const std::size_t count = buffer.vertexCount();
    if (count == 0) {
        return sphere;
    }

    glm::vec3 minCorner = buffer.vertex(0);
    glm::vec3 maxCorner = minCorner;
    for (std::size_t i = 1; i < count; ++i) {
        const glm::vec3 v = buffer.vertex(i);
        minCorner = glm::min(minCorner, v);
        maxCorner = glm::max(maxCorner, v);
    }
    sphere.center = (minCorner + maxCorner) * 0.5f;

    float maxDistanceSq = 0.0f;
    for (std::size_t i = 0; i < count; ++i) {
        const glm::vec3 d = buffer.vertex(i) - sphere.center;
        maxDistanceSq = std::max(maxDistanceSq, glm::dot(d, d));
    }
    sphere.radius = std::sqrt(maxDistanceSq);
    return sphere;
}

BoundingSphere GeometryRepair::fallbackSphere(const GeometryBuffer& buffer) {
    glm::vec3 minCorner(std::numeric_limits<float>::max());
    glm::vec3 maxCorner(std::numeric_limits<float>::lowest());
    glm::bvec3 seen(false);

    for (std::size_t i = 0; i + 2 < buffer.positions.size(); i += 3) {
        for (int axis = 0; axis < 3; ++axis) {
            const float value = buffer.positions[i + axis];
            if (!std::isfinite(value)) {
                continue;
            }
            minCorner[axis] = std::min(minCorner[axis], value);
            maxCorner[axis] = std::max(maxCorner[axis], value);
            seen[axis] = true;
        }
    }

    for (int axis = 0; axis < 3; ++axis) {
        if (!seen[axis]) {
            minCorner[axis] = -1.0f;
            maxCorner[axis] = 1.0f;
        }
    }

    BoundingSphere sphere;
    sphere.center = minCorner * 0.5f + maxCorner * 0.5f;
    if (!isFinite(sphere.center)) {
        sphere.center = glm::vec3(0.0f);
    }
    sphere.radius = glm::length(maxCorner - minCorner) * 0.5f;
    if (!std::isfinite(sphere.radius)) {
        sphere.radius = kFallbackRadius;
    }
    return sphere;
}

std::size_t GeometryRepair::replaceNonFinite(std::vector<float>& values) {
    std::size_t replaced = 0;
    for (float& value : values) {
        if (!std::isfinite(value)) {
            value = 0.0f;
            ++replaced;
        }
    }
    return replaced;
}

bool GeometryRepair::isDegenerate(const GeometryBuffer& buffer, uint32_t a, uint32_t b, uint32_t c) {
    if (a == b && b == c) {
        return true;
    }
    const glm::vec3 va = buffer.vertex(a);
    return va == buffer.vertex(b) && va == buffer.vertex(c);
}
