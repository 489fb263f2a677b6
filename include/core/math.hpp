#pragma once

#include <algorithm>
#include <cmath>

namespace cluster_dial::core {

inline constexpr int kPointerRangeDeg = 180;
inline constexpr int kCriticalPercent = 95;

inline constexpr int clamp_percent(const int value) noexcept {
  return std::clamp(value, 0, 100);
}

inline constexpr int clamp_angle(const int value) noexcept {
  return std::clamp(value, 0, kPointerRangeDeg);
}

// Ratio in [0, 1] -> integer percent, rounded up. Ratios above 1 saturate at 100.
// Callers reject non-finite and negative ratios before getting here.
inline int percent_from_ratio(const double ratio) noexcept {
  const double scaled = std::ceil(ratio * 100.0);
  return clamp_percent(static_cast<int>(std::clamp(scaled, 0.0, 100.0)));
}

// 0% -> 180 degrees, 100% -> 0 degrees. ceil(p * 180 / 100) in integer arithmetic.
inline constexpr int pointer_angle_for_percent(const int percent) noexcept {
  const int p = clamp_percent(percent);
  return kPointerRangeDeg - ((p * kPointerRangeDeg) + 99) / 100;
}

inline constexpr bool is_critical_percent(const int percent) noexcept {
  return percent >= kCriticalPercent;
}

}  // namespace cluster_dial::core
