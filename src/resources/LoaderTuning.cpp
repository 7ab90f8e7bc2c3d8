#include "geostream/resources/LoaderTuning.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
template <typename T>
bool readUnsigned(const json& obj, const char* key, T& out) {
    if (!obj.contains(key)) {
        return true;
    }
    const json& value = obj[key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<int64_t>() >= 0)) {
        std::cerr << "LoaderTuning: '" << key << "' must be a non-negative integer." << std::endl;
        return false;
    }
    const uint64_t raw = value.get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        std::cerr << "LoaderTuning: '" << key << "' must not exceed " << std::numeric_limits<T>::max() << "."
                  << std::endl;
        return false;
    }
    out = static_cast<T>(raw);
    return true;
}

bool readFactor(const json& obj, const char* key, float& out) {
    if (!obj.contains(key)) {
        return true;
    }
    const json& value = obj[key];
    if (!value.is_number()) {
        std::cerr << "LoaderTuning: '" << key << "' must be a number." << std::endl;
        return false;
    }
    const float factor = value.get<float>();
    if (!(factor > 0.0f && factor <= 1.0f)) {
        std::cerr << "LoaderTuning: '" << key << "' must be in (0, 1], got " << factor << "." << std::endl;
        return false;
    }
    out = factor;
    return true;
}

bool applyTuning(const json& root, LoaderTuning& outTuning) {
    const json* obj = nullptr;
    if (root.is_object() && root.contains("loader") && root["loader"].is_object()) {
        obj = &root["loader"];
    } else if (root.is_object()) {
        obj = &root;
    } else {
        std::cerr << "LoaderTuning: document must be an object or contain a 'loader' object." << std::endl;
        return false;
    }

    LoaderTuning tuning = outTuning;
    const bool ok = readUnsigned(*obj, "standardMaxBytes", tuning.standardMaxBytes) &&
                    readUnsigned(*obj, "chunkedMaxBytes", tuning.chunkedMaxBytes) &&
                    readUnsigned(*obj, "conservativeLodBytes", tuning.conservativeLodBytes) &&
                    readFactor(*obj, "chunkedPreviewFactor", tuning.chunkedPreviewFactor) &&
                    readFactor(*obj, "chunkedMediumFactor", tuning.chunkedMediumFactor) &&
                    readFactor(*obj, "lodPreviewFactor", tuning.lodPreviewFactor) &&
                    readUnsigned(*obj, "decodeTimeoutMs", tuning.decodeTimeoutMs) &&
                    readUnsigned(*obj, "previewTimeoutMs", tuning.previewTimeoutMs) &&
                    readUnsigned(*obj, "levelYieldMs", tuning.levelYieldMs) &&
                    readUnsigned(*obj, "taskPollMs", tuning.taskPollMs) &&
                    readUnsigned(*obj, "progressChannelCapacity", tuning.progressChannelCapacity);
    if (!ok) {
        return false;
    }

    if (tuning.standardMaxBytes > tuning.chunkedMaxBytes) {
        std::cerr << "LoaderTuning: standardMaxBytes must not exceed chunkedMaxBytes." << std::endl;
        return false;
    }
    if (tuning.decodeTimeoutMs == 0 || tuning.previewTimeoutMs == 0) {
        std::cerr << "LoaderTuning: decodeTimeoutMs and previewTimeoutMs must be positive." << std::endl;
        return false;
    }
    if (tuning.taskPollMs == 0) {
        tuning.taskPollMs = 1;
    }

    outTuning = tuning;
    return true;
}
}  // namespace

bool loadLoaderTuning(const std::filesystem::path& path, LoaderTuning& outTuning) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "LoaderTuning: unable to open config '" << path.string() << "'." << std::endl;
        return false;
    }

    json root;
    try {
        file >> root;
    } catch (const std::exception& e) {
        std::cerr << "LoaderTuning: failed to parse '" << path.string() << "': " << e.what() << std::endl;
        return false;
    }

    return applyTuning(root, outTuning);
}

bool parseLoaderTuning(const std::string& text, LoaderTuning& outTuning) {
    json root;
    try {
        root = json::parse(text);
    } catch (const std::exception& e) {
        std::cerr << "LoaderTuning: failed to parse config text: " << e.what() << std::endl;
        return false;
    }

    return applyTuning(root, outTuning);
}
