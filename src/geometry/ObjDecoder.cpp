#include "geostream/geometry/ObjDecoder.h"

#include <algorithm>
#include <cstdlib>
#include <unordered_map>

namespace {
struct CornerKey {
    int32_t position = -1;
    int32_t texcoord = -1;
    int32_t normal = -1;

    bool operator==(const CornerKey& other) const {
        return position == other.position && texcoord == other.texcoord && normal == other.normal;
    }
};

struct CornerKeyHash {
    std::size_t operator()(const CornerKey& key) const {
        std::size_t h = static_cast<std::size_t>(static_cast<uint32_t>(key.position));
        h = h * 1000003u ^ static_cast<std::size_t>(static_cast<uint32_t>(key.texcoord));
        h = h * 1000003u ^ static_cast<std::size_t>(static_cast<uint32_t>(key.normal));
        return h;
    }
};

const char* skipBlanks(const char* p) {
    while (*p == ' ' || *p == '\t' || *p == '\r') {
        ++p;
    }
    return p;
}

[[noreturn]] void fail(std::size_t lineNumber, const std::string& what) {
    throw DecodeError("OBJ line " + std::to_string(lineNumber) + ": " + what);
}

template <std::size_t N>
void readFloats(const char*& p, std::vector<float>& out, std::size_t lineNumber, std::size_t required) {
    for (std::size_t i = 0; i < N; ++i) {
        p = skipBlanks(p);
        if (*p == '\0') {
            if (i < required) {
                fail(lineNumber, "expected " + std::to_string(required) + " numbers");
            }
            out.push_back(0.0f);
            continue;
        }
        char* end = nullptr;
        const float value = std::strtof(p, &end);
        if (end == p) {
            fail(lineNumber, "malformed number");
        }
        out.push_back(value);
        p = end;
    }
}

// OBJ indices are 1-based; negative values count back from the newest element.
int32_t resolveIndex(long raw, std::size_t count, std::size_t lineNumber) {
    long resolved = 0;
    if (raw > 0) {
        resolved = raw - 1;
    } else if (raw < 0) {
        resolved = static_cast<long>(count) + raw;
    } else {
        fail(lineNumber, "index 0 is not valid");
    }
    if (resolved < 0 || static_cast<std::size_t>(resolved) >= count) {
        fail(lineNumber, "index " + std::to_string(raw) + " out of range");
    }
    return static_cast<int32_t>(resolved);
}

CornerKey parseCorner(const char*& p,
                      std::size_t positionCount,
                      std::size_t texcoordCount,
                      std::size_t normalCount,
                      std::size_t lineNumber) {
    CornerKey key;
    char* end = nullptr;

    const long v = std::strtol(p, &end, 10);
    if (end == p) {
        fail(lineNumber, "malformed face vertex");
    }
    key.position = resolveIndex(v, positionCount, lineNumber);
    p = end;

    if (*p == '/') {
        ++p;
        if (*p != '/') {
            const long vt = std::strtol(p, &end, 10);
            if (end == p) {
                fail(lineNumber, "malformed texture coordinate index");
            }
            key.texcoord = resolveIndex(vt, texcoordCount, lineNumber);
            p = end;
        }
        if (*p == '/') {
            ++p;
            const long vn = std::strtol(p, &end, 10);
            if (end == p) {
                fail(lineNumber, "malformed normal index");
            }
            key.normal = resolveIndex(vn, normalCount, lineNumber);
            p = end;
        }
    }
    return key;
}
}  // namespace

GeometryBuffer ObjDecoder::decode(std::string_view text, const DecodeCallbacks& callbacks) {
    return decode(text, callbacks, Options{});
}

GeometryBuffer ObjDecoder::decode(const std::vector<uint8_t>& bytes, const DecodeCallbacks& callbacks) {
    return decode(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()), callbacks, Options{});
}

GeometryBuffer ObjDecoder::decode(std::string_view text, const DecodeCallbacks& callbacks, const Options& options) {
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<float> texcoords;
    std::vector<CornerKey> corners;
    std::vector<uint32_t> indices;
    std::unordered_map<CornerKey, uint32_t, CornerKeyHash> cornerIndex;
    std::vector<CornerKey> faceCorners;
    std::string line;

    const std::size_t interval = options.progressLineInterval == 0 ? 1 : options.progressLineInterval;
    std::size_t lineNumber = 0;
    std::size_t offset = 0;

    while (offset < text.size()) {
        std::size_t lineEnd = text.find('\n', offset);
        if (lineEnd == std::string_view::npos) {
            lineEnd = text.size();
        }
        line.assign(text.data() + offset, lineEnd - offset);
        offset = lineEnd + 1;
        ++lineNumber;

        if (lineNumber % interval == 0) {
            if (callbacks.shouldAbort && callbacks.shouldAbort()) {
                throw DecodeAborted();
            }
            if (callbacks.onProgress) {
                callbacks.onProgress(static_cast<float>(std::min(offset, text.size())) / static_cast<float>(text.size()));
            }
        }

        const char* p = skipBlanks(line.c_str());
        if (p[0] == 'v' && (p[1] == ' ' || p[1] == '\t')) {
            p += 2;
            readFloats<3>(p, positions, lineNumber, 3);
        } else if (p[0] == 'v' && p[1] == 'n' && (p[2] == ' ' || p[2] == '\t')) {
            p += 3;
            readFloats<3>(p, normals, lineNumber, 3);
        } else if (p[0] == 'v' && p[1] == 't' && (p[2] == ' ' || p[2] == '\t')) {
            p += 3;
            readFloats<2>(p, texcoords, lineNumber, 1);
        } else if (p[0] == 'f' && (p[1] == ' ' || p[1] == '\t')) {
            p += 2;
            faceCorners.clear();
            while (true) {
                p = skipBlanks(p);
                if (*p == '\0') {
                    break;
                }
                faceCorners.push_back(parseCorner(p, positions.size() / 3, texcoords.size() / 2, normals.size() / 3,
                                                  lineNumber));
            }
            if (faceCorners.size() < 3) {
                fail(lineNumber, "face needs at least 3 vertices");
            }

            auto cornerId = [&](const CornerKey& key) {
                auto [it, inserted] = cornerIndex.try_emplace(key, static_cast<uint32_t>(corners.size()));
                if (inserted) {
                    corners.push_back(key);
                }
                return it->second;
            };

            const uint32_t first = cornerId(faceCorners[0]);
            for (std::size_t k = 1; k + 1 < faceCorners.size(); ++k) {
                indices.push_back(first);
                indices.push_back(cornerId(faceCorners[k]));
                indices.push_back(cornerId(faceCorners[k + 1]));
            }
        }
    }

    if (positions.empty()) {
        throw DecodeError("OBJ data contains no vertices");
    }

    GeometryBuffer buffer;
    if (indices.empty()) {
        buffer.positions = std::move(positions);
        if (callbacks.onProgress) {
            callbacks.onProgress(1.0f);
        }
        return buffer;
    }

    bool allTexcoords = options.keepTexcoords && !texcoords.empty();
    bool allNormals = options.keepNormals && !normals.empty();
    for (const CornerKey& key : corners) {
        allTexcoords = allTexcoords && key.texcoord >= 0;
        allNormals = allNormals && key.normal >= 0;
    }

    buffer.positions.reserve(corners.size() * 3);
    if (allNormals) {
        buffer.normals.reserve(corners.size() * 3);
    }
    if (allTexcoords) {
        buffer.texcoords.reserve(corners.size() * 2);
    }

    for (const CornerKey& key : corners) {
        const std::size_t v = static_cast<std::size_t>(key.position) * 3;
        buffer.positions.insert(buffer.positions.end(), positions.begin() + v, positions.begin() + v + 3);
        if (allNormals) {
            const std::size_t n = static_cast<std::size_t>(key.normal) * 3;
            buffer.normals.insert(buffer.normals.end(), normals.begin() + n, normals.begin() + n + 3);
        }
        if (allTexcoords) {
            const std::size_t t = static_cast<std::size_t>(key.texcoord) * 2;
            buffer.texcoords.insert(buffer.texcoords.end(), texcoords.begin() + t, texcoords.begin() + t + 2);
        }
    }
    buffer.indices = std::move(indices);

    if (callbacks.onProgress) {
        callbacks.onProgress(1.0f);
    }
    return buffer;
}
