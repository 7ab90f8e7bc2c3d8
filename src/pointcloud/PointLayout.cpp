#include "geostream/pointcloud/PointLayout.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>

#include "geostream/geometry/DecodeError.h"

namespace {
template <typename T>
T readScalar(const uint8_t* p) {
    T value;
    std::memcpy(&value, p, sizeof(T));
    return value;
}

template <typename T>
void writeScalar(uint8_t* p, T value) {
    std::memcpy(p, &value, sizeof(T));
}

float readAsFloat(const uint8_t* p, ScalarType type) {
    switch (type) {
        case ScalarType::Float32:
            return readScalar<float>(p);
        case ScalarType::Int16:
            return static_cast<float>(readScalar<int16_t>(p));
        case ScalarType::Int8:
            return static_cast<float>(readScalar<int8_t>(p));
        case ScalarType::Uint8:
            return static_cast<float>(readScalar<uint8_t>(p));
        case ScalarType::Uint16:
            return static_cast<float>(readScalar<uint16_t>(p));
    }
    return 0.0f;
}

template <typename T>
T clampRound(float value) {
    if (!std::isfinite(value)) {
        return T{0};
    }
    const float lo = static_cast<float>(std::numeric_limits<T>::min());
    const float hi = static_cast<float>(std::numeric_limits<T>::max());
    return static_cast<T>(std::clamp(std::round(value), lo, hi));
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}
}  // namespace

std::optional<ScalarType> parseScalarType(std::string_view name) {
    const std::string key = lowercase(name);
    if (key == "float32" || key == "float") {
        return ScalarType::Float32;
    }
    if (key == "int16") {
        return ScalarType::Int16;
    }
    if (key == "int8") {
        return ScalarType::Int8;
    }
    if (key == "uint8") {
        return ScalarType::Uint8;
    }
    if (key == "uint16") {
        return ScalarType::Uint16;
    }
    return std::nullopt;
}

const char* scalarTypeName(ScalarType type) {
    switch (type) {
        case ScalarType::Float32:
            return "FLOAT32";
        case ScalarType::Int16:
            return "INT16";
        case ScalarType::Int8:
            return "INT8";
        case ScalarType::Uint8:
            return "UINT8";
        case ScalarType::Uint16:
            return "UINT16";
    }
    return "UNKNOWN";
}

std::size_t scalarSize(ScalarType type) {
    switch (type) {
        case ScalarType::Float32:
            return 4;
        case ScalarType::Int16:
        case ScalarType::Uint16:
            return 2;
        case ScalarType::Int8:
        case ScalarType::Uint8:
            return 1;
    }
    return 0;
}

AttributeKind AttributeLayout::classify(std::string_view name) {
    const std::string key = lowercase(name);
    if (key == "position" || key == "positions" || key == "xyz") {
        return AttributeKind::Position;
    }
    if (key == "color" || key == "colors" || key == "rgb" || key == "rgba") {
        return AttributeKind::Color;
    }
    if (key == "normal" || key == "normals") {
        return AttributeKind::Normal;
    }
    if (key == "intensity") {
        return AttributeKind::Intensity;
    }
    return AttributeKind::Custom;
}

void AttributeLayout::validate(const AttributeDesc& desc, AttributeKind kind, uint32_t recordStride) {
    bool supported = false;
    switch (kind) {
        case AttributeKind::Position:
            supported = desc.size == 3 && (desc.type == ScalarType::Float32 || desc.type == ScalarType::Int16);
            break;
        case AttributeKind::Color:
            supported = (desc.size == 3 || desc.size == 4) && desc.type == ScalarType::Uint8;
            break;
        case AttributeKind::Normal:
            supported = desc.size == 3 && (desc.type == ScalarType::Float32 || desc.type == ScalarType::Int8);
            break;
        case AttributeKind::Intensity:
            supported = desc.size == 1 && (desc.type == ScalarType::Uint16 || desc.type == ScalarType::Float32);
            break;
        case AttributeKind::Custom:
            supported = desc.size == 1 && (desc.type == ScalarType::Float32 || desc.type == ScalarType::Uint16 ||
                                           desc.type == ScalarType::Uint8);
            break;
    }

    if (!supported) {
        throw DecodeError("attribute '" + desc.name + "' has unsupported layout " + scalarTypeName(desc.type) + "x" +
                          std::to_string(desc.size));
    }

    const std::size_t end = static_cast<std::size_t>(desc.byteOffset) + desc.size * scalarSize(desc.type);
    if (end > recordStride) {
        throw DecodeError("attribute '" + desc.name + "' ends at byte " + std::to_string(end) +
                          " beyond record stride " + std::to_string(recordStride));
    }
}

AttributeLayout AttributeLayout::resolve(const std::vector<AttributeDesc>& attributes, uint32_t recordStride) {
    if (recordStride == 0) {
        throw DecodeError("record stride must be positive");
    }

    AttributeLayout layout;
    layout.recordStride_ = recordStride;
    layout.fields_.reserve(attributes.size());

    for (const AttributeDesc& desc : attributes) {
        const AttributeKind kind = classify(desc.name);
        validate(desc, kind, recordStride);

        Field field;
        field.kind = kind;
        field.type = desc.type;
        field.byteOffset = desc.byteOffset;
        field.components = desc.size;
        field.scale = desc.scale.value_or(1.0f);

        if (kind == AttributeKind::Custom) {
            field.customSlot = layout.customNames_.size();
            layout.customNames_.push_back(desc.name);
        } else if (kind == AttributeKind::Position) {
            layout.position_ = field;
        } else if (kind == AttributeKind::Normal) {
            layout.normal_ = field;
        }

        layout.fields_.push_back(field);
    }

    return layout;
}

void AttributeLayout::decode(const uint8_t* record, DecodedPoint& out) const {
    out.hasPosition = false;
    out.hasColor = false;
    out.hasNormal = false;
    out.hasIntensity = false;
    out.custom.resize(customNames_.size());

    for (const Field& field : fields_) {
        const uint8_t* p = record + field.byteOffset;
        const std::size_t step = scalarSize(field.type);

        switch (field.kind) {
            case AttributeKind::Position:
                for (int c = 0; c < 3; ++c) {
                    float value = readAsFloat(p + c * step, field.type);
                    if (field.type == ScalarType::Int16) {
                        value *= field.scale;
                    }
                    out.position[c] = value;
                }
                out.hasPosition = true;
                break;
            case AttributeKind::Color:
                out.color = glm::u8vec4(p[0], p[1], p[2], field.components == 4 ? p[3] : 255);
                out.hasColor = true;
                break;
            case AttributeKind::Normal:
                for (int c = 0; c < 3; ++c) {
                    float value = readAsFloat(p + c * step, field.type);
                    if (field.type == ScalarType::Int8) {
                        value /= 127.0f;
                    }
                    out.normal[c] = value;
                }
                out.hasNormal = true;
                break;
            case AttributeKind::Intensity:
                out.intensity = readAsFloat(p, field.type);
                out.hasIntensity = true;
                break;
            case AttributeKind::Custom:
                out.custom[field.customSlot] = readAsFloat(p, field.type);
                break;
        }
    }
}

void AttributeLayout::encodePosition(uint8_t* record, const glm::vec3& position) const {
    if (!position_) {
        return;
    }
    uint8_t* p = record + position_->byteOffset;
    for (int c = 0; c < 3; ++c) {
        if (position_->type == ScalarType::Float32) {
            writeScalar<float>(p + c * 4, position[c]);
        } else {
            const float scale = position_->scale == 0.0f ? 1.0f : position_->scale;
            writeScalar<int16_t>(p + c * 2, clampRound<int16_t>(position[c] / scale));
        }
    }
}

void AttributeLayout::encodeNormal(uint8_t* record, const glm::vec3& normal) const {
    if (!normal_) {
        return;
    }
    uint8_t* p = record + normal_->byteOffset;
    for (int c = 0; c < 3; ++c) {
        if (normal_->type == ScalarType::Float32) {
            writeScalar<float>(p + c * 4, normal[c]);
        } else {
            writeScalar<int8_t>(p + c, static_cast<int8_t>(std::clamp(std::round(normal[c] * 127.0f), -127.0f, 127.0f)));
        }
    }
}
