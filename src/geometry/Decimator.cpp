#include "geostream/geometry/Decimator.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "geostream/geometry/DecodeError.h"

namespace {
constexpr std::size_t kAbortCheckInterval = 65'536;
constexpr uint32_t kUnmapped = std::numeric_limits<uint32_t>::max();

void copyVertex(const GeometryBuffer& source, std::size_t v, GeometryBuffer& out) {
    out.positions.insert(out.positions.end(), source.positions.begin() + v * 3, source.positions.begin() + v * 3 + 3);
    if (source.normals.size() >= (v + 1) * 3) {
        out.normals.insert(out.normals.end(), source.normals.begin() + v * 3, source.normals.begin() + v * 3 + 3);
    }
    if (source.texcoords.size() >= (v + 1) * 2) {
        out.texcoords.insert(out.texcoords.end(), source.texcoords.begin() + v * 2,
                             source.texcoords.begin() + v * 2 + 2);
    }
}
}  // namespace

bool Decimator::keepTriangle(std::size_t t, double factor) {
    return std::floor(static_cast<double>(t + 1) * factor) > std::floor(static_cast<double>(t) * factor);
}

std::size_t Decimator::keptTriangleCount(std::size_t triangleCount, float factor) {
    if (triangleCount == 0 || factor >= 1.0f) {
        return triangleCount;
    }
    const auto kept = static_cast<std::size_t>(std::floor(static_cast<double>(triangleCount) * factor));
    return kept == 0 ? 1 : kept;
}

GeometryBuffer Decimator::decimate(const GeometryBuffer& source, float factor, const std::function<bool()>& shouldAbort) {
    if (!(factor > 0.0f)) {
        throw std::invalid_argument("decimation factor must be positive, got " + std::to_string(factor));
    }

    const std::size_t triangles = source.triangleCount();
    if (factor >= 1.0f || triangles == 0) {
        return source;
    }

    const double f = static_cast<double>(factor);
    GeometryBuffer out;
    const std::size_t expected = keptTriangleCount(triangles, factor);

    if (source.indexed()) {
        std::vector<uint32_t> remap(source.vertexCount(), kUnmapped);
        out.indices.reserve(expected * 3);

        auto mapVertex = [&](uint32_t v) {
            if (v >= remap.size()) {
                throw DecodeError("index " + std::to_string(v) + " references a missing vertex");
            }
            if (remap[v] == kUnmapped) {
                remap[v] = static_cast<uint32_t>(out.vertexCount());
                copyVertex(source, v, out);
            }
            return remap[v];
        };

        for (std::size_t t = 0; t < triangles; ++t) {
            if (t % kAbortCheckInterval == 0 && shouldAbort && shouldAbort()) {
                throw DecodeAborted();
            }
            if (!keepTriangle(t, f)) {
                continue;
            }
            for (std::size_t k = 0; k < 3; ++k) {
                out.indices.push_back(mapVertex(source.indices[t * 3 + k]));
            }
        }

        if (out.indices.empty()) {
            for (std::size_t k = 0; k < 3; ++k) {
                out.indices.push_back(mapVertex(source.indices[k]));
            }
        }
        return out;
    }

    out.positions.reserve(expected * 9);
    for (std::size_t t = 0; t < triangles; ++t) {
        if (t % kAbortCheckInterval == 0 && shouldAbort && shouldAbort()) {
            throw DecodeAborted();
        }
        if (!keepTriangle(t, f)) {
            continue;
        }
        for (std::size_t k = 0; k < 3; ++k) {
            copyVertex(source, t * 3 + k, out);
        }
    }

    if (out.positions.empty()) {
        for (std::size_t k = 0; k < 3; ++k) {
            copyVertex(source, k, out);
        }
    }
    return out;
}
