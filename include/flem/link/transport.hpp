#pragma once
/**
 * @file transport.hpp
 * @brief Pluggable byte source/sink under an Endpoint (UART, I2C, socket, loopback).
 * @details No framing, buffering or retry is expected from implementations.
 */

#include <cstdint>

namespace flem::link {

    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Take the next received byte, if any.
         * @return false when nothing is available right now.
         */
        virtual bool read(std::uint8_t& out) noexcept = 0;

        /**
         * @brief Queue one byte for transmission.
         * @return false when the sink cannot accept it yet (retry later).
         */
        virtual bool write(std::uint8_t byte) noexcept = 0;
    };

} // namespace flem::link
