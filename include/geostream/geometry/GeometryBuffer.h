#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Decoded mesh or point data. Stages hand it on by move; once a stage is done
// mutating it the buffer is frozen behind SharedGeometry.
struct GeometryBuffer {
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<float> texcoords;
    std::vector<uint32_t> indices;

    bool indexed() const {
        return !indices.empty();
    }

    bool hasNormals() const {
        return !normals.empty();
    }

    bool hasTexcoords() const {
        return !texcoords.empty();
    }

    std::size_t vertexCount() const {
        return positions.size() / 3;
    }

    std::size_t triangleCount() const;

    glm::vec3 vertex(std::size_t index) const {
        return glm::vec3(positions[index * 3], positions[index * 3 + 1], positions[index * 3 + 2]);
    }

    bool empty() const {
        return positions.empty();
    }

    std::size_t byteSize() const;
};

using SharedGeometry = std::shared_ptr<const GeometryBuffer>;

inline SharedGeometry freezeGeometry(GeometryBuffer&& buffer) {
    return std::make_shared<const GeometryBuffer>(std::move(buffer));
}

// 12-triangle unit cube shown while a real preview is still unavailable.
GeometryBuffer makePlaceholderCube(float halfExtent = 0.5f);
