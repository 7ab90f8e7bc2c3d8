#pragma once

#include <cstddef>
#include <vector>

#include "geostream/geometry/GeometryBuffer.h"

struct LodLevel {
    int level = 0;
    SharedGeometry buffer;
    float switchDistance = 0.0f;
    float decimationFactor = 1.0f;
    std::size_t triangleCount = 0;
};

struct LodLevelStats {
    int level = 0;
    float decimationFactor = 1.0f;
    float switchDistance = 0.0f;
    std::size_t triangleCount = 0;
};

// Progressive-detail object handed to the renderer. Level 0 is the coarsest
// and is shown farthest away; switch distances strictly decrease with level.
class LodAssembler {
public:
    // Rejects a null buffer, a factor outside (0, 1] or a switch distance that
    // is not below the previous level's.
    bool addLevel(SharedGeometry buffer, float switchDistance, float decimationFactor = 1.0f);

    // Finest level added so far, nullptr while empty.
    const LodLevel* currentBest() const;
    // Level a renderer shows at the given view distance.
    const LodLevel* selectLevel(float viewDistance) const;

    std::vector<LodLevelStats> levelStats() const;

    const std::vector<LodLevel>& levels() const {
        return levels_;
    }

    std::size_t levelCount() const {
        return levels_.size();
    }

    bool empty() const {
        return levels_.empty();
    }

    void clear();

private:
    std::vector<LodLevel> levels_;
};
