#pragma once

#include <cstdint>
#include <string>

namespace bitlens {

// Inclusive bit range [low, high]. Valid ranges have low <= high; the type
// itself does not enforce it so that callers can report bad input.
struct BitRange {
  uint32_t low = 0;
  uint32_t high = 0;

  [[nodiscard]] auto IsValid() const -> bool {
    return low <= high;
  }
  [[nodiscard]] auto Width() const -> uint32_t {
    return high - low + 1;
  }
  // True if every bit of the range lies below `bit_width`.
  [[nodiscard]] auto FitsIn(uint32_t bit_width) const -> bool {
    return IsValid() && high < bit_width;
  }

  auto operator==(const BitRange&) const -> bool = default;
};

// "high-low", most significant bound first ("7" for single-bit ranges).
inline auto FormatBitRange(const BitRange& range) -> std::string {
  if (range.low == range.high) {
    return std::to_string(range.low);
  }
  return std::to_string(range.high) + "-" + std::to_string(range.low);
}

}  // namespace bitlens
