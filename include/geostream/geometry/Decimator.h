#pragma once

#include <cstddef>
#include <functional>

#include "geostream/geometry/GeometryBuffer.h"

// Deterministic stride decimation: triangle t survives when
// floor((t + 1) * factor) > floor(t * factor), so the kept set grows
// monotonically with the factor and is identical across runs.
class Decimator {
public:
    static GeometryBuffer decimate(const GeometryBuffer& source,
                                   float factor,
                                   const std::function<bool()>& shouldAbort = {});

    static std::size_t keptTriangleCount(std::size_t triangleCount, float factor);

private:
    static bool keepTriangle(std::size_t t, double factor);
};
