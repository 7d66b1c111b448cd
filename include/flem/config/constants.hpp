#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named protocol constants and defaults.
 * @details Wire-level values are fixed by the frame format; the defaults at the
 *          bottom can be overridden through the config Loader.
 */

#include <cstddef>
#include <cstdint>

namespace flem::config::constants {

// =====================
// Frame layout (canonical 10-byte header, all fields little-endian)
// =====================
inline constexpr uint16_t FRAME_HEADER          = 0x5555; ///< Magic value at offset 0
inline constexpr uint8_t  FRAME_HEADER_BYTE     = 0x55;   ///< Each byte of the magic value
inline constexpr std::size_t FRAME_HEADER_SIZE  = 10;     ///< Fixed framing-field width

inline constexpr std::size_t OFFSET_HEADER      = 0;
inline constexpr std::size_t OFFSET_CHECKSUM    = 2;
inline constexpr std::size_t OFFSET_REQUEST     = 4;
inline constexpr std::size_t OFFSET_RESPONSE    = 6;
inline constexpr std::size_t OFFSET_LENGTH      = 8;
inline constexpr std::size_t OFFSET_DATA        = 10;

/// CRC covers everything after the header and checksum fields.
inline constexpr std::size_t CHECKSUM_START     = OFFSET_REQUEST;

/// Length field is u16; 0xFFFF is kept out of the capacity range.
inline constexpr std::size_t MAX_PACKET_CAPACITY = 0xFFFF - 1;

// =====================
// Reserved request codes
// =====================
inline constexpr uint16_t REQUEST_EVENT = 0x0000; ///< Unsolicited event
inline constexpr uint16_t REQUEST_ID    = 0x0001; ///< Identity / capability exchange
inline constexpr uint16_t REQUEST_IDLE  = 0xFFFF; ///< Nothing to do

// =====================
// Reserved response codes
// =====================
inline constexpr uint16_t RESPONSE_ASYNC           = 0x0000; ///< Pending / asynchronous
inline constexpr uint16_t RESPONSE_SUCCESS         = 0x0001;
inline constexpr uint16_t RESPONSE_ERROR           = 0xFFFD; ///< Reply could not be built
inline constexpr uint16_t RESPONSE_UNKNOWN_REQUEST = 0xFFFE;
inline constexpr uint16_t RESPONSE_CHECKSUM_ERROR  = 0xFFFF;

// =====================
// Capability descriptor (DataId)
// =====================
inline constexpr std::size_t ID_NAME_SIZE  = 25; ///< Null-padded name field
inline constexpr std::size_t ID_TEXT_SIZE  = 3 + 2 + ID_NAME_SIZE; ///< major, minor, patch, size LE, name

// =====================
// Endpoint defaults (overridable via Loader)
// =====================
inline constexpr std::size_t DEFAULT_PACKET_CAPACITY = 100;   ///< Payload bytes per packet
inline constexpr std::size_t DEFAULT_LINK_RING_SIZE  = 512;   ///< Loopback FIFO slots (power of two)
inline constexpr bool        DEFAULT_ID_ASCII        = true;  ///< Explicit-byte descriptor encoding
inline constexpr const char* DEFAULT_ID_NAME         = "flem endpoint";

} // namespace flem::config::constants
