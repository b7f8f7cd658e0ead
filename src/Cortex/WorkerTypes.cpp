// =================================================================
// src/Cortex/WorkerTypes.cpp
// =================================================================

#include "Cortex/WorkerTypes.hpp"
#include <cmath>
#include <algorithm>

namespace Cortex {

bool operator==(const MergedResponse& lhs, const MergedResponse& rhs) {
    return lhs.content == rhs.content &&
           std::abs(lhs.quality - rhs.quality) < 1e-9 &&
           lhs.sources == rhs.sources;
}

bool operator!=(const MergedResponse& lhs, const MergedResponse& rhs) {
    return !(lhs == rhs);
}

double normalizeQuality(double raw_quality, QualityScale scale) {
    if (std::isnan(raw_quality)) {
        return 0.0;
    }

    bool percent = scale == QualityScale::PERCENT ||
                   (scale == QualityScale::AUTO && raw_quality > 1.0);
    double quality = percent ? raw_quality / 100.0 : raw_quality;
    return std::clamp(quality, 0.0, 1.0);
}

} // namespace Cortex
