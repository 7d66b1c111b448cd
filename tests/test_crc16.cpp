/**
 * @file test_crc16.cpp
 * @brief Tests for the CRC-16/ARC engine.
 */
#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "flem/proto/crc16.hpp"

using flem::proto::Crc16;

static std::vector<std::uint8_t> to_bytes(std::string_view s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

TEST(Crc16, EmptyRangeIsZero) {
  EXPECT_EQ(Crc16::compute({}), 0u);
}

TEST(Crc16, StandardCheckValue) {
  // CRC-16/ARC catalogue check value
  EXPECT_EQ(Crc16::compute(to_bytes("123456789")), 0xBB3Du);
}

TEST(Crc16, TableMatchesReflectedPolynomial) {
  const auto& t = Crc16::table();
  EXPECT_EQ(t[0x00], 0x0000u);
  EXPECT_EQ(t[0x01], 0xC0C1u);
  EXPECT_EQ(t[0x80], Crc16::kPolynomial);
  EXPECT_EQ(t[0xFF], 0x4040u);

  for (unsigned i = 0; i < 256; ++i) {
    std::uint16_t c = static_cast<std::uint16_t>(i);
    for (int k = 0; k < 8; ++k) c = (c & 1) ? static_cast<std::uint16_t>((c >> 1) ^ 0xA001) : static_cast<std::uint16_t>(c >> 1);
    ASSERT_EQ(t[i], c) << "table entry " << i;
  }
}

TEST(Crc16, UpdateIsIncremental) {
  const auto text = to_bytes("flexible light-weight embedded messaging");
  const std::span<const std::uint8_t> all(text);
  const auto whole = Crc16::compute(all);
  const auto part = Crc16::update(Crc16::compute(all.first(11)), all.subspan(11));
  EXPECT_EQ(whole, part);
}

TEST(Crc16, DetectsEverySingleBitFlip) {
  std::array<std::uint8_t, 16> buf{};
  for (std::size_t i = 0; i < buf.size(); ++i) buf[i] = static_cast<std::uint8_t>(i * 37 + 5);
  const auto ref = Crc16::compute(buf);

  for (std::size_t i = 0; i < buf.size(); ++i) {
    for (int bit = 0; bit < 8; ++bit) {
      buf[i] ^= static_cast<std::uint8_t>(1u << bit);
      EXPECT_NE(Crc16::compute(buf), ref) << "byte " << i << " bit " << bit;
      buf[i] ^= static_cast<std::uint8_t>(1u << bit);
    }
  }
}
