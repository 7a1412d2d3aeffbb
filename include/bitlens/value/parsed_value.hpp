#pragma once

#include <cstdint>
#include <string>

#include "bitlens/common/wide_bit.hpp"

namespace bitlens::value {

// Width-tagged unsigned value produced by parsing one literal.
//
// Invariant: 0 <= magnitude < 2^bit_width, bit_width >= 1. The constructor
// masks the magnitude to the width (low-order bits kept), mirroring how a
// hardware register truncates an over-wide assignment.
class ParsedValue {
 public:
  ParsedValue(common::WideBit magnitude, uint32_t bit_width);

  static auto FromUInt64(uint64_t magnitude, uint32_t bit_width)
      -> ParsedValue;

  // Width inferred for literals without an explicit width: enough bits for
  // the magnitude, rounded up to a whole byte, at least 8.
  static auto MinimalWidth(const common::WideBit& magnitude) -> uint32_t;

  [[nodiscard]] auto Magnitude() const -> const common::WideBit& {
    return magnitude_;
  }
  [[nodiscard]] auto BitWidth() const -> uint32_t {
    return bit_width_;
  }

  // Up to 64 bits starting at `low`; bits at or above the width read as 0.
  [[nodiscard]] auto ReadBits(uint32_t low, uint32_t width) const -> uint64_t;

  [[nodiscard]] auto Bit(uint32_t index) const -> bool {
    return magnitude_.GetBit(index) != 0;
  }

  // Same magnitude, width ignored
  [[nodiscard]] auto SameMagnitude(const ParsedValue& other) const -> bool {
    return magnitude_ == other.magnitude_;
  }

  auto operator==(const ParsedValue& other) const -> bool {
    return bit_width_ == other.bit_width_ && magnitude_ == other.magnitude_;
  }

 private:
  common::WideBit magnitude_;
  uint32_t bit_width_;
};

// "<width>'h<hex>" without grouping; used by logs and test failure output.
auto DebugString(const ParsedValue& value) -> std::string;

}  // namespace bitlens::value
