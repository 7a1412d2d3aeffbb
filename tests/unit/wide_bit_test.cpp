#include <cstdint>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "bitlens/common/internal_error.hpp"
#include "bitlens/common/wide_bit.hpp"

namespace bitlens::common {
namespace {

class WideBitTest : public ::testing::Test {};

// =============================================================================
// Construction Tests
// =============================================================================

TEST_F(WideBitTest, DefaultConstructorCreatesEmpty) {
  WideBit wb;
  EXPECT_TRUE(wb.IsZero());
  EXPECT_EQ(wb.ActiveBits(), 0);
}

TEST_F(WideBitTest, ConstructFromVector) {
  WideBit wb(std::vector<uint64_t>{0x1234, 0x5678, 0x9ABC});
  EXPECT_EQ(wb.ReadBits(0, 64), 0x1234);
  EXPECT_EQ(wb.ReadBits(64, 64), 0x5678);
  EXPECT_EQ(wb.ReadBits(128, 64), 0x9ABC);
  EXPECT_EQ(wb.ActiveBits(), 144);
}

TEST_F(WideBitTest, FromBitWidthHoldsEveryBit) {
  // 65 bits requires 2 words; the top bit must survive multiply-add carries.
  WideBit wb = WideBit::FromBitWidth(65);
  EXPECT_TRUE(wb.IsZero());
  wb.MultiplyAddSmall(1, 1);
  for (int i = 0; i < 64; ++i) {
    EXPECT_EQ(wb.MultiplyAddSmall(2, 0), 0);
  }
  EXPECT_EQ(wb.GetBit(64), 1);
  EXPECT_EQ(wb.ActiveBits(), 65);
}

// =============================================================================
// Bit Access Tests
// =============================================================================

TEST_F(WideBitTest, GetBitAcrossWordBoundary) {
  WideBit wb(std::vector<uint64_t>{1ULL << 63, 1});
  EXPECT_EQ(wb.GetBit(62), 0);
  EXPECT_EQ(wb.GetBit(63), 1);
  EXPECT_EQ(wb.GetBit(64), 1);
  EXPECT_EQ(wb.GetBit(65), 0);
  EXPECT_EQ(wb.ActiveBits(), 65);
}

TEST_F(WideBitTest, GetBitBeyondStorageReadsZero) {
  WideBit wb = WideBit::FromUInt64(~0ULL, 1);
  EXPECT_EQ(wb.GetBit(63), 1);
  EXPECT_EQ(wb.GetBit(64), 0);
  EXPECT_EQ(wb.GetBit(1000), 0);
}

TEST_F(WideBitTest, ReadBitsSpanningTwoWords) {
  WideBit wb(std::vector<uint64_t>{0xF000000000000000ULL, 0x5});
  // Bits 60..67: 0b0101_1111
  EXPECT_EQ(wb.ReadBits(60, 8), 0x5F);
  EXPECT_EQ(wb.ReadBits(0, 64), 0xF000000000000000ULL);
  EXPECT_EQ(wb.ReadBits(64, 64), 0x5);
}

TEST_F(WideBitTest, ReadBitsWiderThanWordThrows) {
  WideBit wb(2);
  EXPECT_THROW((void)wb.ReadBits(0, 65), InternalError);
}

// =============================================================================
// Masking Tests
// =============================================================================

TEST_F(WideBitTest, MaskToWidth65Bits) {
  WideBit wb(std::vector<uint64_t>{~0ULL, ~0ULL});
  wb.MaskToWidth(65);
  EXPECT_EQ(wb.ReadBits(0, 64), ~0ULL);
  EXPECT_EQ(wb.ReadBits(64, 64), 1);
}

TEST_F(WideBitTest, MaskToWidth4Bits) {
  WideBit wb = WideBit::FromUInt64(0xFF, 1);
  wb.MaskToWidth(4);
  EXPECT_EQ(wb.ReadBits(0, 64), 0xF);
}

TEST_F(WideBitTest, ResizeDropsHighWordsAndZeroFillsNewOnes) {
  WideBit wb(std::vector<uint64_t>{0x1, 0x2});
  wb.Resize(1);
  EXPECT_EQ(wb, WideBit::FromUInt64(0x1, 1));
  wb.Resize(3);
  EXPECT_EQ(wb.ReadBits(64, 64), 0);
  EXPECT_EQ(wb.ActiveBits(), 1);
}

// =============================================================================
// Shift and Slice Tests
// =============================================================================

TEST_F(WideBitTest, ShiftRightLogicalCrossWord) {
  WideBit wb(std::vector<uint64_t>{0, 0x10});  // bit 68
  WideBit result = wb.ShiftRightLogical(4);
  EXPECT_EQ(result.ReadBits(0, 64), 0);
  EXPECT_EQ(result.ReadBits(64, 64), 1);
}

TEST_F(WideBitTest, ShiftRightLogicalByWidthClears) {
  WideBit wb(std::vector<uint64_t>{~0ULL, ~0ULL});
  EXPECT_TRUE(wb.ShiftRightLogical(128).IsZero());
  EXPECT_TRUE(wb.ShiftRightLogical(500).IsZero());
}

TEST_F(WideBitTest, ExtractSliceMasksToSliceWidth) {
  WideBit wb(std::vector<uint64_t>{0xA300000000000000ULL, 0x1, 0x0});
  WideBit slice = wb.ExtractSlice(56, 9);
  EXPECT_EQ(slice, WideBit::FromUInt64(0x1A3, 1));
  EXPECT_EQ(slice.ActiveBits(), 9);
}

// =============================================================================
// Arithmetic Tests
// =============================================================================

TEST_F(WideBitTest, MultiplyAddSmallCarriesIntoNextWord) {
  WideBit wb = WideBit::FromUInt64(~0ULL, 2);
  uint64_t carry = wb.MultiplyAddSmall(16, 0xF);
  EXPECT_EQ(carry, 0);
  EXPECT_EQ(wb.ReadBits(0, 64), ~0ULL);
  EXPECT_EQ(wb.ReadBits(64, 64), 0xF);
}

TEST_F(WideBitTest, MultiplyAddSmallReportsCarryOut) {
  WideBit wb = WideBit::FromUInt64(1ULL << 63, 1);
  EXPECT_EQ(wb.MultiplyAddSmall(2, 0), 1);
  EXPECT_TRUE(wb.IsZero());
}

TEST_F(WideBitTest, MultiplyAddSmallRejectsWideOperands) {
  WideBit wb(1);
  EXPECT_THROW(wb.MultiplyAddSmall(1ULL << 32, 0), InternalError);
}

// =============================================================================
// Comparison Tests
// =============================================================================

TEST_F(WideBitTest, EqualityIgnoresWordCount) {
  WideBit narrow = WideBit::FromUInt64(42, 1);
  WideBit wide = WideBit::FromUInt64(42, 3);
  EXPECT_EQ(narrow, wide);

  WideBit high_bit(std::vector<uint64_t>{42, 0, 0x4});  // bit 130
  EXPECT_FALSE(narrow == high_bit);
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST_F(WideBitTest, ToHexString) {
  WideBit wb(std::vector<uint64_t>{0x1, 0xAB});
  EXPECT_EQ(wb.ToHexString(), "ab0000000000000001");
  EXPECT_EQ(WideBit(2).ToHexString(), "0");
}

TEST_F(WideBitTest, ToDecimalStringSmall) {
  EXPECT_EQ(WideBit::FromUInt64(0, 1).ToDecimalString(), "0");
  EXPECT_EQ(WideBit::FromUInt64(26, 1).ToDecimalString(), "26");
  EXPECT_EQ(
      WideBit::FromUInt64(~0ULL, 1).ToDecimalString(),
      "18446744073709551615");
}

TEST_F(WideBitTest, ToDecimalStringMultiWord) {
  // 2^64
  EXPECT_EQ(
      WideBit(std::vector<uint64_t>{0, 1}).ToDecimalString(),
      "18446744073709551616");
  // 2^128 - 1
  EXPECT_EQ(
      WideBit(std::vector<uint64_t>{~0ULL, ~0ULL}).ToDecimalString(),
      "340282366920938463463374607431768211455");
}

TEST_F(WideBitTest, FmtFormatter) {
  EXPECT_EQ(fmt::format("{}", WideBit::FromUInt64(0xA3, 1)), "0xa3");
}

}  // namespace
}  // namespace bitlens::common
