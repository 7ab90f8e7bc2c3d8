#pragma once

#include <any>
#include <cstddef>

#include "geostream/geometry/GeometryBuffer.h"
#include "geostream/geometry/ObjDecoder.h"
#include "geostream/taskpool/task_pool.hpp"

// TaskPayload::options of Parse and Decimate tasks. Parse reads the payload
// bytes; Decimate works on an already decoded source.
struct AssetTaskOptions {
    float decimationFactor = 1.0f;
    // Decoded triangle budget; 0 disables the cap.
    std::size_t maxTriangles = 0;
    SharedGeometry source;
};

// Result of a Parse or Decimate task.
struct DecodedAsset {
    GeometryBuffer geometry;
    // Triangles before decimation.
    std::size_t sourceTriangles = 0;
    // Factor actually applied once the triangle cap is taken into account.
    float appliedFactor = 1.0f;
};

// Lowers factor so that at most maxTriangles of sourceTriangles survive.
float cappedDecimationFactor(std::size_t sourceTriangles, float factor, std::size_t maxTriangles);

// Decode, then decimate by factor and by the triangle cap. Shared by pool
// workers and the loader's fallback path.
DecodedAsset decodeAsset(const std::vector<uint8_t>& bytes,
                         const AssetTaskOptions& options,
                         const DecodeCallbacks& callbacks);

DecodedAsset decimateAsset(const GeometryBuffer& source,
                           const AssetTaskOptions& options,
                           const DecodeCallbacks& callbacks);

class AssetTaskHandler : public taskpool::TaskHandler {
public:
    // Returns a DecodedAsset.
    std::any handle(const taskpool::Task& task, taskpool::WorkerContext& ctx) override;
};

taskpool::HandlerFactory makeAssetHandlerFactory();
