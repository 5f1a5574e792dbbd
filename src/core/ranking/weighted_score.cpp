#include "core/ranking/weighted_score.h"

#include <algorithm>
#include <limits>

namespace vanta {

uint32_t weightedScore(uint32_t base, uint32_t weight)
{
    const uint64_t clamped = std::clamp(weight, kMinProviderWeight, kMaxProviderWeight);
    const uint64_t scaled = static_cast<uint64_t>(base) * clamped / 100;
    return static_cast<uint32_t>(std::min<uint64_t>(scaled, std::numeric_limits<uint32_t>::max()));
}

} // namespace vanta
