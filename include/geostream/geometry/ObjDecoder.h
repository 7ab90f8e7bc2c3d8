#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "geostream/geometry/DecodeError.h"
#include "geostream/geometry/GeometryBuffer.h"

struct DecodeCallbacks {
    std::function<void(float)> onProgress;
    std::function<bool()> shouldAbort;
};

// Minimal Wavefront OBJ reader: v, vn, vt and f records. Polygons are fan
// triangulated; every other record type is skipped.
class ObjDecoder {
public:
    struct Options {
        std::size_t progressLineInterval = 10'000;
        bool keepNormals = true;
        bool keepTexcoords = true;
    };

    static GeometryBuffer decode(std::string_view text, const DecodeCallbacks& callbacks, const Options& options);
    static GeometryBuffer decode(std::string_view text, const DecodeCallbacks& callbacks = {});
    static GeometryBuffer decode(const std::vector<uint8_t>& bytes, const DecodeCallbacks& callbacks = {});
};
