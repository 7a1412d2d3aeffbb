#include "bitlens/value/parsed_value.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "bitlens/common/internal_error.hpp"
#include "bitlens/common/wide_bit.hpp"
#include "bitlens/common/wide_bit_ops.hpp"

namespace bitlens::value {

namespace {

constexpr uint32_t kByteBits = 8;

}  // namespace

ParsedValue::ParsedValue(common::WideBit magnitude, uint32_t bit_width)
    : magnitude_(std::move(magnitude)), bit_width_(bit_width) {
  if (bit_width_ == 0) {
    common::ThrowInternalError("ParsedValue", "bit width must be positive");
  }
  magnitude_.Resize(common::wide_ops::WordsForBits(bit_width_));
  magnitude_.MaskToWidth(bit_width_);
}

auto ParsedValue::FromUInt64(uint64_t magnitude, uint32_t bit_width)
    -> ParsedValue {
  return {common::WideBit::FromUInt64(magnitude, 1), bit_width};
}

auto ParsedValue::MinimalWidth(const common::WideBit& magnitude) -> uint32_t {
  auto active = static_cast<uint32_t>(magnitude.ActiveBits());
  uint32_t rounded = (active + kByteBits - 1) / kByteBits * kByteBits;
  return std::max(rounded, kByteBits);
}

auto ParsedValue::ReadBits(uint32_t low, uint32_t width) const -> uint64_t {
  if (low >= bit_width_) {
    return 0;
  }
  return magnitude_.ReadBits(low, std::min(width, bit_width_ - low));
}

auto DebugString(const ParsedValue& value) -> std::string {
  return fmt::format(
      "{}'h{}", value.BitWidth(), value.Magnitude().ToHexString());
}

}  // namespace bitlens::value
