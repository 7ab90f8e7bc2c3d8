#include "geostream/streaming/LodAssembler.h"

#include <cmath>
#include <iostream>

bool LodAssembler::addLevel(SharedGeometry buffer, float switchDistance, float decimationFactor) {
    if (!buffer) {
        std::cerr << "LodAssembler: refusing level without geometry." << std::endl;
        return false;
    }
    if (!(decimationFactor > 0.0f && decimationFactor <= 1.0f)) {
        std::cerr << "LodAssembler: decimation factor " << decimationFactor << " outside (0, 1]." << std::endl;
        return false;
    }
    if (!std::isfinite(switchDistance)) {
        std::cerr << "LodAssembler: switch distance must be finite." << std::endl;
        return false;
    }
    if (!levels_.empty() && !(switchDistance < levels_.back().switchDistance)) {
        std::cerr << "LodAssembler: switch distance " << switchDistance << " is not below previous level's "
                  << levels_.back().switchDistance << "." << std::endl;
        return false;
    }

    LodLevel level;
    level.level = static_cast<int>(levels_.size());
    level.triangleCount = buffer->triangleCount();
    level.buffer = std::move(buffer);
    level.switchDistance = switchDistance;
    level.decimationFactor = decimationFactor;
    levels_.push_back(std::move(level));
    return true;
}

const LodLevel* LodAssembler::currentBest() const {
    return levels_.empty() ? nullptr : &levels_.back();
}

const LodLevel* LodAssembler::selectLevel(float viewDistance) const {
    for (const LodLevel& level : levels_) {
        if (level.switchDistance <= viewDistance) {
            return &level;
        }
    }
    return currentBest();
}

std::vector<LodLevelStats> LodAssembler::levelStats() const {
    std::vector<LodLevelStats> stats;
    stats.reserve(levels_.size());
    for (const LodLevel& level : levels_) {
        stats.push_back(LodLevelStats{level.level, level.decimationFactor, level.switchDistance, level.triangleCount});
    }
    return stats;
}

void LodAssembler::clear() {
    levels_.clear();
}
