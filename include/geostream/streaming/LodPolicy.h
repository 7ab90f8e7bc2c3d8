#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "geostream/resources/LoaderTuning.h"

struct LodStep {
    float decimationFactor = 1.0f;
    float switchDistance = 0.0f;
};

// Chooses the preview and refinement passes of an LOD load.
class LodPolicy {
public:
    virtual ~LodPolicy() = default;

    virtual LodStep preview(uint64_t fileSize) const = 0;
    // Passes after the preview, coarsest first.
    virtual std::vector<LodStep> refinements(uint64_t fileSize, int profileLodLevels) const = 0;
};

// Two size bands. Assets above tuning.conservativeLodBytes keep fewer
// triangles per level and switch farther out.
class DefaultLodPolicy : public LodPolicy {
public:
    static constexpr int kMaxLevels = 3;
    static constexpr std::array<LodStep, kMaxLevels> kStandardTable{{{0.05f, 45.0f}, {0.2f, 20.0f}, {0.5f, 0.0f}}};
    static constexpr std::array<LodStep, kMaxLevels> kConservativeTable{{{0.02f, 60.0f}, {0.1f, 30.0f}, {0.3f, 0.0f}}};

    explicit DefaultLodPolicy(const LoaderTuning& tuning = kDefaultLoaderTuning);

    LodStep preview(uint64_t fileSize) const override;
    std::vector<LodStep> refinements(uint64_t fileSize, int profileLodLevels) const override;

private:
    bool conservative(uint64_t fileSize) const;

    uint64_t conservativeLodBytes_;
    float previewFactor_;
};
