#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "bitlens/common/internal_error.hpp"
#include "bitlens/common/wide_bit_ops.hpp"

namespace bitlens::common {

// WideBit is an arbitrary-width unsigned bit vector.
// Storage: std::vector<uint64_t> with little-endian word order (LSB in
// words_[0]). The logical width is tracked by the owner (ParsedValue), not
// here; operations that need it take it as a parameter.
class WideBit {
 public:
  static constexpr size_t kBitsPerWord = 64;

  WideBit() = default;

  // Construct with specified number of words (all zero-initialized)
  explicit WideBit(size_t num_words) : words_(num_words, 0) {
  }

  // Construct from raw word data
  explicit WideBit(std::vector<uint64_t> words) : words_(std::move(words)) {
  }

  static auto FromUInt64(uint64_t value, size_t num_words) -> WideBit {
    WideBit result(num_words);
    if (num_words > 0) {
      result.words_[0] = value;
    }
    return result;
  }

  static auto FromBitWidth(size_t bit_width) -> WideBit {
    return WideBit(wide_ops::WordsForBits(bit_width));
  }

  // Grow or shrink the storage; new words are zero, dropped words are lost.
  auto Resize(size_t num_words) -> void {
    words_.resize(num_words, 0);
  }

  auto MaskToWidth(size_t bit_width) -> void {
    wide_ops::MaskToWidth(words_, bit_width);
  }

  // words = words * multiplier + addend; returns the carry out of the top.
  auto MultiplyAddSmall(uint64_t multiplier, uint64_t addend) -> uint64_t {
    if (multiplier > wide_ops::kLowHalfMask || addend > wide_ops::kLowHalfMask) {
      throw InternalError(
          "WideBit::MultiplyAddSmall",
          fmt::format(
              "operands {} and {} exceed 32 bits", multiplier, addend));
    }
    return wide_ops::MultiplyAddSmall(words_, multiplier, addend);
  }

  // Logical right shift (zero-fill)
  [[nodiscard]] auto ShiftRightLogical(size_t amount) const -> WideBit {
    WideBit result(words_.size());
    wide_ops::ShiftRightLogical(words_, result.words_, amount);
    return result;
  }

  // Value equality, independent of word count
  [[nodiscard]] auto operator==(const WideBit& other) const -> bool {
    return wide_ops::Equal(words_, other.words_);
  }

  [[nodiscard]] auto IsZero() const -> bool {
    return wide_ops::IsZero(words_);
  }

  // Bits needed to represent the value (0 for zero)
  [[nodiscard]] auto ActiveBits() const -> size_t {
    return wide_ops::ActiveBits(words_);
  }

  [[nodiscard]] auto GetBit(size_t index) const -> uint64_t {
    return wide_ops::GetBit(words_, index);
  }

  // Up to 64 bits starting at `low`
  [[nodiscard]] auto ReadBits(size_t low, size_t width) const -> uint64_t {
    if (width > kBitsPerWord) {
      throw InternalError(
          "WideBit::ReadBits",
          fmt::format("width {} exceeds {} bits", width, kBitsPerWord));
    }
    return wide_ops::ReadBits(words_, low, width);
  }

  // Extract a slice [start_bit, start_bit + width) as a new WideBit sized
  // to exactly the words the slice needs.
  [[nodiscard]] auto ExtractSlice(size_t start_bit, size_t width) const
      -> WideBit {
    auto shifted = ShiftRightLogical(start_bit);
    size_t result_words = wide_ops::WordsForBits(width);
    WideBit result(result_words);
    for (size_t i = 0; i < result_words && i < shifted.words_.size(); ++i) {
      result.words_[i] = shifted.words_[i];
    }
    result.MaskToWidth(width);
    return result;
  }

  // Lowercase hex digits, MSB first, no prefix, no leading zeros
  [[nodiscard]] auto ToHexString() const -> std::string {
    if (IsZero()) {
      return "0";
    }
    std::string result;
    bool leading = true;
    for (size_t i = words_.size(); i > 0; --i) {
      uint64_t word = words_[i - 1];
      if (leading && word == 0) {
        continue;
      }
      result += leading ? fmt::format("{:x}", word)
                        : fmt::format("{:016x}", word);
      leading = false;
    }
    return result;
  }

  // Unsigned decimal, MSB first
  [[nodiscard]] auto ToDecimalString() const -> std::string {
    return wide_ops::ToDecimalStringImpl(words_);
  }

 private:
  std::vector<uint64_t> words_;  // Little-endian: words_[0] is LSB
};

inline auto operator<<(std::ostream& os, const WideBit& wb) -> std::ostream& {
  return os << "0x" << wb.ToHexString();
}

}  // namespace bitlens::common

template <>
struct fmt::formatter<bitlens::common::WideBit> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const bitlens::common::WideBit& wb, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "0x{}", wb.ToHexString());
  }
};
