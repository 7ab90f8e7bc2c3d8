#include "geostream/geometry/GeometryBuffer.h"

#include <array>

std::size_t GeometryBuffer::triangleCount() const {
    if (indexed()) {
        return indices.size() / 3;
    }
    return positions.size() / 9;
}

std::size_t GeometryBuffer::byteSize() const {
    return positions.size() * sizeof(float) + normals.size() * sizeof(float) +
           texcoords.size() * sizeof(float) + indices.size() * sizeof(uint32_t);
}

GeometryBuffer makePlaceholderCube(float halfExtent) {
    static constexpr std::array<float, 24> kCorners = {
        -1.0f, -1.0f, -1.0f,
         1.0f, -1.0f, -1.0f,
         1.0f,  1.0f, -1.0f,
        -1.0f,  1.0f, -1.0f,
        -1.0f, -1.0f,  1.0f,
         1.0f, -1.0f,  1.0f,
         1.0f,  1.0f,  1.0f,
        -1.0f,  1.0f,  1.0f,
    };
    static constexpr std::array<uint32_t, 36> kIndices = {
        0, 2, 1, 0, 3, 2,  // -z
        4, 5, 6, 4, 6, 7,  // +z
        0, 1, 5, 0, 5, 4,  // -y
        3, 7, 6, 3, 6, 2,  // +y
        0, 4, 7, 0, 7, 3,  // -x
        1, 2, 6, 1, 6, 5,  // +x
    };

    GeometryBuffer cube;
    cube.positions.reserve(kCorners.size());
    for (float c : kCorners) {
        cube.positions.push_back(c * halfExtent);
    }
    cube.indices.assign(kIndices.begin(), kIndices.end());
    return cube;
}
