#include "geostream/streaming/LodPolicy.h"

#include <algorithm>

DefaultLodPolicy::DefaultLodPolicy(const LoaderTuning& tuning)
    : conservativeLodBytes_(tuning.conservativeLodBytes), previewFactor_(tuning.lodPreviewFactor) {}

bool DefaultLodPolicy::conservative(uint64_t fileSize) const {
    return fileSize > conservativeLodBytes_;
}

LodStep DefaultLodPolicy::preview(uint64_t fileSize) const {
    return LodStep{previewFactor_, conservative(fileSize) ? 60.0f : 45.0f};
}

std::vector<LodStep> DefaultLodPolicy::refinements(uint64_t fileSize, int profileLodLevels) const {
    const auto& table = conservative(fileSize) ? kConservativeTable : kStandardTable;
    const int levels = std::min(profileLodLevels, kMaxLevels);

    // Entry 0 is the preview slot and is produced by preview().
    std::vector<LodStep> steps;
    for (int i = 1; i < levels; ++i) {
        steps.push_back(table[static_cast<std::size_t>(i)]);
    }
    return steps;
}
