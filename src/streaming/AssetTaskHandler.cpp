#include "geostream/streaming/AssetTaskHandler.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "geostream/geometry/Decimator.h"

namespace {
DecodedAsset decimateWithCap(GeometryBuffer&& source, const AssetTaskOptions& options, const DecodeCallbacks& callbacks) {
    DecodedAsset decoded;
    decoded.sourceTriangles = source.triangleCount();
    decoded.appliedFactor = cappedDecimationFactor(decoded.sourceTriangles, options.decimationFactor, options.maxTriangles);
    if (decoded.appliedFactor >= 1.0f) {
        decoded.geometry = std::move(source);
    } else {
        decoded.geometry = Decimator::decimate(source, decoded.appliedFactor, callbacks.shouldAbort);
    }
    return decoded;
}
}  // namespace

float cappedDecimationFactor(std::size_t sourceTriangles, float factor, std::size_t maxTriangles) {
    factor = std::min(factor, 1.0f);
    if (maxTriangles > 0 && sourceTriangles > 0) {
        const std::size_t target = Decimator::keptTriangleCount(sourceTriangles, factor);
        if (target > maxTriangles) {
            factor = static_cast<float>(static_cast<double>(maxTriangles) / static_cast<double>(sourceTriangles));
        }
    }
    return factor;
}

DecodedAsset decimateAsset(const GeometryBuffer& source,
                           const AssetTaskOptions& options,
                           const DecodeCallbacks& callbacks) {
    DecodedAsset decoded;
    decoded.sourceTriangles = source.triangleCount();
    decoded.appliedFactor = cappedDecimationFactor(decoded.sourceTriangles, options.decimationFactor, options.maxTriangles);
    decoded.geometry = decoded.appliedFactor >= 1.0f
                           ? source
                           : Decimator::decimate(source, decoded.appliedFactor, callbacks.shouldAbort);
    return decoded;
}

DecodedAsset decodeAsset(const std::vector<uint8_t>& bytes,
                         const AssetTaskOptions& options,
                         const DecodeCallbacks& callbacks) {
    if (!(options.decimationFactor > 0.0f)) {
        throw std::invalid_argument("decimation factor must be positive");
    }
    return decimateWithCap(ObjDecoder::decode(bytes, callbacks), options, callbacks);
}

std::any AssetTaskHandler::handle(const taskpool::Task& task, taskpool::WorkerContext& ctx) {
    AssetTaskOptions options;
    if (task.payload.options.has_value()) {
        const auto* provided = std::any_cast<AssetTaskOptions>(&task.payload.options);
        if (provided == nullptr) {
            throw std::invalid_argument(std::string(taskpool::to_string(task.kind)) +
                                        " task carries options of the wrong type");
        }
        options = *provided;
    }

    DecodeCallbacks callbacks;
    callbacks.onProgress = [&ctx](float progress) { ctx.report_progress(progress); };
    callbacks.shouldAbort = [&ctx]() { return ctx.cancel_requested(); };

    try {
        switch (task.kind) {
            case taskpool::TaskKind::Parse:
                if (!task.payload.bytes) {
                    throw DecodeError("parse task has no payload bytes");
                }
                return decodeAsset(*task.payload.bytes, options, callbacks);
            case taskpool::TaskKind::Decimate:
                if (!options.source) {
                    throw std::invalid_argument("decimate task has no source geometry");
                }
                return decimateAsset(*options.source, options, callbacks);
            default:
                throw std::invalid_argument(std::string("asset worker cannot run ") + taskpool::to_string(task.kind) +
                                            " tasks");
        }
    } catch (const DecodeAborted&) {
        throw taskpool::TaskCancelled();
    }
}

taskpool::HandlerFactory makeAssetHandlerFactory() {
    return [](std::size_t) -> std::unique_ptr<taskpool::TaskHandler> {
        return std::make_unique<AssetTaskHandler>();
    };
}
