#pragma once
/**
 * @file crc16.hpp
 * @brief Table-driven CRC-16/ARC (IBM, reflected polynomial 0xA001, init 0).
 *
 * Stateless and allocation-free; safe to call from interrupt context.
 */

#include <array>
#include <cstdint>
#include <span>

namespace flem::proto {

class Crc16 final {
public:
    /// Reflected form of the IBM polynomial 0x8005.
    static constexpr std::uint16_t kPolynomial = 0xA001;

    /**
     * @brief Checksum of a contiguous byte range, starting from 0.
     * @param bytes Input range (may be empty; result is then 0).
     */
    static std::uint16_t compute(std::span<const std::uint8_t> bytes) noexcept {
        return update(0, bytes);
    }

    /**
     * @brief Fold more bytes into a running checksum.
     * @param crc Value returned by a previous compute()/update().
     */
    static std::uint16_t update(std::uint16_t crc, std::span<const std::uint8_t> bytes) noexcept;

    /// @brief The 256-entry lookup table.
    static const std::array<std::uint16_t, 256>& table() noexcept { return kTable; }

private:
    static const std::array<std::uint16_t, 256> kTable;
};

} // namespace flem::proto
