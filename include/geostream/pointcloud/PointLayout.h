#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ScalarType : uint8_t {
    Float32 = 0,
    Int16,
    Int8,
    Uint8,
    Uint16,
};

std::optional<ScalarType> parseScalarType(std::string_view name);
const char* scalarTypeName(ScalarType type);
std::size_t scalarSize(ScalarType type);

enum class AttributeKind : uint8_t {
    Position = 0,
    Color,
    Normal,
    Intensity,
    Custom,
};

// One field of a binary point record as described by the producer.
struct AttributeDesc {
    std::string name;
    ScalarType type = ScalarType::Float32;
    uint32_t byteOffset = 0;
    uint32_t size = 1;
    std::optional<float> scale;
};

struct DecodedPoint {
    glm::vec3 position{0.0f};
    glm::u8vec4 color{255, 255, 255, 255};
    glm::vec3 normal{0.0f};
    float intensity = 0.0f;
    std::vector<float> custom;

    bool hasPosition = false;
    bool hasColor = false;
    bool hasNormal = false;
    bool hasIntensity = false;
};

// An attribute list resolved against a record stride. Kinds are fixed here so
// the per-record decode never looks at attribute names.
class AttributeLayout {
public:
    struct Field {
        AttributeKind kind = AttributeKind::Custom;
        ScalarType type = ScalarType::Float32;
        uint32_t byteOffset = 0;
        uint32_t components = 1;
        float scale = 1.0f;
        std::size_t customSlot = 0;
    };

    // Throws DecodeError for unsupported types or fields outside the stride.
    static AttributeLayout resolve(const std::vector<AttributeDesc>& attributes, uint32_t recordStride);

    void decode(const uint8_t* record, DecodedPoint& out) const;
    void encodePosition(uint8_t* record, const glm::vec3& position) const;
    void encodeNormal(uint8_t* record, const glm::vec3& normal) const;

    const std::vector<Field>& fields() const {
        return fields_;
    }

    const std::vector<std::string>& customNames() const {
        return customNames_;
    }

    uint32_t recordStride() const {
        return recordStride_;
    }

    bool hasPosition() const {
        return position_.has_value();
    }

    bool hasNormal() const {
        return normal_.has_value();
    }

private:
    static AttributeKind classify(std::string_view name);
    static void validate(const AttributeDesc& desc, AttributeKind kind, uint32_t recordStride);

    std::vector<Field> fields_;
    std::vector<std::string> customNames_;
    std::optional<Field> position_;
    std::optional<Field> normal_;
    uint32_t recordStride_ = 0;
};
