#pragma once

// Shared algorithms for multi-word bit vector operations.
//
// Operations are templated on container type so they work with
// std::vector<uint64_t> and std::array<uint64_t, N> alike.
//
// Storage convention: little-endian word order (LSB in words[0]).

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bitlens::common::wide_ops {

// ============================================================================
// Helper functions
// ============================================================================

// Calculate number of words needed for a given bit width
constexpr auto WordsForBits(size_t bit_width) -> size_t {
  return (bit_width + 63) / 64;
}

// Calculate which word contains a given bit index
constexpr auto WordIndex(size_t bit_index) -> size_t {
  return bit_index / 64;
}

// Calculate bit position within a word
constexpr auto BitInWord(size_t bit_index) -> size_t {
  return bit_index % 64;
}

// Mask for the final word given bit width
constexpr auto FinalWordMask(size_t bit_width) -> uint64_t {
  size_t bits_in_final = bit_width % 64;
  return (bits_in_final == 0) ? ~0ULL : (1ULL << bits_in_final) - 1;
}

constexpr uint64_t kLowHalfMask = 0xFFFFFFFFULL;

// ============================================================================
// Masking
// ============================================================================

// Mask final word to specified bit width (modifies in place)
template <typename Container>
constexpr auto MaskToWidth(Container& words, size_t bit_width) -> void {
  if (words.size() == 0) {
    return;
  }
  size_t needed_words = WordsForBits(bit_width);
  // Clear extra words beyond what's needed
  for (size_t i = needed_words; i < words.size(); ++i) {
    words[i] = 0;
  }
  if (needed_words > 0 && needed_words <= words.size()) {
    words[needed_words - 1] &= FinalWordMask(bit_width);
  }
}

// ============================================================================
// Shift operations
// ============================================================================

// Logical right shift: result = src >> amount (zero fill)
template <typename SrcContainer, typename DstContainer>
constexpr auto ShiftRightLogical(
    const SrcContainer& src, DstContainer& result, size_t amount) -> void {
  for (size_t i = 0; i < result.size(); ++i) {
    result[i] = 0;
  }

  size_t word_shift = amount / 64;
  size_t bit_shift = amount % 64;

  if (word_shift >= src.size()) {
    return;  // All zeros
  }

  for (size_t i = 0; i + word_shift < src.size() && i < result.size(); ++i) {
    if (bit_shift == 0) {
      result[i] = src[i + word_shift];
      continue;
    }
    result[i] = src[i + word_shift] >> bit_shift;
    if (i + word_shift + 1 < src.size()) {
      result[i] |= src[i + word_shift + 1] << (64 - bit_shift);
    }
  }
}

// ============================================================================
// Small-radix arithmetic (used by literal parsing and decimal formatting)
// ============================================================================

// words = words * multiplier + addend. Returns the carry out of the top word.
// Precondition: multiplier and addend fit in 32 bits.
template <typename Container>
constexpr auto MultiplyAddSmall(
    Container& words, uint64_t multiplier, uint64_t addend) -> uint64_t {
  uint64_t carry = addend;
  for (size_t i = 0; i < words.size(); ++i) {
    uint64_t lo = (words[i] & kLowHalfMask) * multiplier + carry;
    uint64_t hi = (words[i] >> 32) * multiplier + (lo >> 32);
    words[i] = ((hi & kLowHalfMask) << 32) | (lo & kLowHalfMask);
    carry = hi >> 32;
  }
  return carry;
}

// words = words / divisor. Returns the remainder.
// Precondition: 0 < divisor < 2^32.
template <typename Container>
constexpr auto DivModSmall(Container& words, uint64_t divisor) -> uint64_t {
  uint64_t rem = 0;
  for (size_t i = words.size(); i > 0; --i) {
    uint64_t hi_part = (rem << 32) | (words[i - 1] >> 32);
    uint64_t q_hi = hi_part / divisor;
    rem = hi_part % divisor;
    uint64_t lo_part = (rem << 32) | (words[i - 1] & kLowHalfMask);
    uint64_t q_lo = lo_part / divisor;
    rem = lo_part % divisor;
    words[i - 1] = (q_hi << 32) | q_lo;
  }
  return rem;
}

// ============================================================================
// Comparison and utility
// ============================================================================

// Value equality; a shorter container is treated as zero-extended.
template <typename Container1, typename Container2>
constexpr auto Equal(const Container1& lhs, const Container2& rhs) -> bool {
  size_t n = std::max(lhs.size(), rhs.size());
  for (size_t i = 0; i < n; ++i) {
    uint64_t a = i < lhs.size() ? lhs[i] : 0;
    uint64_t b = i < rhs.size() ? rhs[i] : 0;
    if (a != b) {
      return false;
    }
  }
  return true;
}

// Check if all words are zero
template <typename Container>
constexpr auto IsZero(const Container& words) -> bool {
  for (size_t i = 0; i < words.size(); ++i) {
    if (words[i] != 0) {
      return false;
    }
  }
  return true;
}

// Number of bits up to and including the highest set bit (0 for zero)
template <typename Container>
constexpr auto ActiveBits(const Container& words) -> size_t {
  for (size_t i = words.size(); i > 0; --i) {
    uint64_t word = words[i - 1];
    if (word == 0) {
      continue;
    }
    size_t bits = 0;
    while (word != 0) {
      ++bits;
      word >>= 1;
    }
    return (i - 1) * 64 + bits;
  }
  return 0;
}

// Get a single bit (returns 0 or 1)
template <typename Container>
constexpr auto GetBit(const Container& words, size_t index) -> uint64_t {
  size_t word_idx = WordIndex(index);
  size_t bit_idx = BitInWord(index);
  if (word_idx >= words.size()) {
    return 0;
  }
  return (words[word_idx] >> bit_idx) & 1;
}

// Read up to 64 bits starting at `low` (bits past the end read as zero)
template <typename Container>
constexpr auto ReadBits(const Container& words, size_t low, size_t width)
    -> uint64_t {
  if (width == 0) {
    return 0;
  }
  size_t word_idx = WordIndex(low);
  size_t bit_idx = BitInWord(low);
  uint64_t result = 0;
  if (word_idx < words.size()) {
    result = words[word_idx] >> bit_idx;
  }
  if (bit_idx != 0 && word_idx + 1 < words.size()) {
    result |= words[word_idx + 1] << (64 - bit_idx);
  }
  if (width < 64) {
    result &= (1ULL << width) - 1;
  }
  return result;
}

// ============================================================================
// String formatting
// ============================================================================

// Unsigned decimal string, MSB first, no prefix
template <typename Container>
auto ToDecimalStringImpl(const Container& words) -> std::string {
  // Peel off nine decimal digits per division so every chunk fits in 32 bits.
  constexpr uint64_t kChunk = 1000000000ULL;
  constexpr size_t kChunkDigits = 9;

  Container work = words;
  if (IsZero(work)) {
    return "0";
  }

  std::string reversed;
  while (!IsZero(work)) {
    uint64_t chunk = DivModSmall(work, kChunk);
    bool last = IsZero(work);
    for (size_t d = 0; d < kChunkDigits; ++d) {
      if (last && chunk == 0) {
        break;
      }
      reversed += static_cast<char>('0' + (chunk % 10));
      chunk /= 10;
    }
  }
  return {reversed.rbegin(), reversed.rend()};
}

}  // namespace bitlens::common::wide_ops
