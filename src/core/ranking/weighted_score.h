#pragma once

#include <cstdint>

namespace vanta {

constexpr uint32_t kMinProviderWeight = 10;
constexpr uint32_t kMaxProviderWeight = 300;

// Scales a provider's raw score by a percentage weight. The weight is
// clamped to [10, 300]; the product saturates at UINT32_MAX.
uint32_t weightedScore(uint32_t base, uint32_t weight);

} // namespace vanta
