#include "geostream/streaming/PerformanceProfile.h"

std::optional<PerformanceProfile> performanceProfileByName(std::string_view name) {
    if (name == "high") {
        return PerformanceProfile::high();
    }
    if (name == "medium") {
        return PerformanceProfile::medium();
    }
    if (name == "low") {
        return PerformanceProfile::low();
    }
    return std::nullopt;
}
