#pragma once
/**
 * @file packet.hpp
 * @brief Fixed-capacity framed packet: outbound packing and inbound byte-wise construction.
 *
 * Layout: the whole frame lives in one contiguous array at its wire offsets
 * (header, checksum, request, response, length, payload; all little-endian),
 * so bytes() is zero-copy and does not depend on struct padding.
 *
 * Usage (transmit):
 *   tx.reset_lazy(); tx.set_request(r); tx.add_data(p); tx.pack();
 *   then either bytes() in bulk, or get_byte() until GetByteFinished.
 *
 * Usage (receive):
 *   feed construct(b) per byte until the outcome is completed or a terminal
 *   error, read the fields, then reset_lazy() before the next frame.
 *
 * Every operation is O(1) per byte, allocation-free and exception-free.
 * A Packet is driven by one context at a time.
 *
 * @tparam Capacity Payload bytes the packet can hold (< 0xFFFF).
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "flem/compat/expected.hpp"
#include "flem/config/constants.hpp"
#include "flem/proto/crc16.hpp"
#include "flem/proto/data_id.hpp"
#include "flem/proto/status.hpp"

namespace flem::proto {

template <std::size_t Capacity>
class Packet final {
    static_assert(Capacity <= config::constants::MAX_PACKET_CAPACITY,
                  "Packet capacity must fit the u16 length field (< 0xFFFF)");

public:
    static constexpr std::size_t kCapacity   = Capacity;
    static constexpr std::size_t kHeaderSize = config::constants::FRAME_HEADER_SIZE;
    static constexpr std::size_t kFrameSize  = kHeaderSize + Capacity;

    Packet() noexcept = default;

    // ------------------------------------------------------------------
    // Outbound
    // ------------------------------------------------------------------

    /**
     * @brief Append payload bytes after the current length.
     * @return Status::PacketOverflow (nothing written) if the result would
     *         exceed Capacity.
     */
    flem_detail::expected<void, Status> add_data(std::span<const std::uint8_t> bytes) noexcept {
        if (bytes.size() + length() > Capacity) {
            status_ = Status::PacketOverflow;
            return flem_detail::unexpected(Status::PacketOverflow);
        }
        std::size_t at = kHeaderSize + length();
        for (const std::uint8_t b : bytes) frame_[at++] = b;
        store16(config::constants::OFFSET_LENGTH,
                static_cast<std::uint16_t>(length() + bytes.size()));
        status_ = Status::Ok;
        return {};
    }

    /// @brief Commit: write checksum then header and rewind the emit cursor.
    void pack() noexcept {
        store16(config::constants::OFFSET_CHECKSUM, compute_checksum());
        store16(config::constants::OFFSET_HEADER, config::constants::FRAME_HEADER);
        internal_counter_ = 0;
    }

    /// @brief Outbound request: RESPONSE_ASYNC until the peer answers.
    flem_detail::expected<void, Status>
    pack_request(std::uint16_t request, std::span<const std::uint8_t> bytes = {}) noexcept {
        return pack_with(request, config::constants::RESPONSE_ASYNC, bytes);
    }

    /// @brief Reply with @p bytes and a success response.
    flem_detail::expected<void, Status>
    pack_data(std::uint16_t request, std::span<const std::uint8_t> bytes) noexcept {
        return pack_with(request, config::constants::RESPONSE_SUCCESS, bytes);
    }

    /// @brief Reply with an explicit response code and optional payload.
    flem_detail::expected<void, Status>
    pack_error(std::uint16_t request, std::uint16_t response,
               std::span<const std::uint8_t> bytes = {}) noexcept {
        return pack_with(request, response, bytes);
    }

    /**
     * @brief Reply to the ID request with a serialized descriptor.
     * @param ascii true for the portable text form, false for the memory image.
     */
    flem_detail::expected<void, Status> pack_id(const DataId& id, bool ascii) noexcept {
        if (ascii) {
            const auto text = id.encode_text();
            return pack_with(config::constants::REQUEST_ID, config::constants::RESPONSE_SUCCESS, text);
        }
        const auto image = id.memory_image();
        return pack_with(config::constants::REQUEST_ID, config::constants::RESPONSE_SUCCESS, image);
    }

    /// @brief The serialized frame: exactly total_length() bytes.
    std::span<const std::uint8_t> bytes() const noexcept {
        return std::span<const std::uint8_t>(frame_.data(), total_length());
    }

    /**
     * @brief Emit the next frame byte for one-byte-at-a-time transports.
     * @return Status::GetByteFinished once all bytes were emitted; the cursor
     *         is rewound to 0 so the frame can be sent again.
     */
    flem_detail::expected<std::uint8_t, Status> get_byte() noexcept {
        if (internal_counter_ < total_length()) {
            status_ = Status::Ok;
            return frame_[internal_counter_++];
        }
        internal_counter_ = 0;
        status_ = Status::GetByteFinished;
        return flem_detail::unexpected(Status::GetByteFinished);
    }

    // ------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------

    /**
     * @brief Feed one received byte into the frame state machine.
     *
     * internal_counter is the position in the frame. Positions 0-1 must be
     * 0x55 or the machine restarts (HeaderBytesNotFound). Positions 2-9 fill
     * checksum, request, response and length. A length above Capacity is
     * rejected before any payload byte is stored. The frame completes when
     * length payload bytes arrived (or at position 9 when length is 0).
     * After a terminal outcome every further byte reports PacketOverflow
     * until reset.
     */
    Outcome construct(std::uint8_t byte) noexcept {
        using namespace config::constants;
        const std::size_t pos = internal_counter_;

        if (pos < OFFSET_CHECKSUM) {
            if (byte != FRAME_HEADER_BYTE) {
                internal_counter_ = 0;
                status_ = Status::HeaderBytesNotFound;
                return Outcome::error(status_);
            }
            frame_[pos] = byte;
        } else if (pos < kHeaderSize) {
            frame_[pos] = byte;
            if (pos == kHeaderSize - 1) {
                data_length_counter_ = 0;
                internal_counter_ = kHeaderSize;
                if (length() > Capacity) {
                    // Keep length <= Capacity; the declared value is untrusted.
                    store16(OFFSET_LENGTH, 0);
                    status_ = Status::InvalidDataLengthDetected;
                    return Outcome::error(status_);
                }
                if (length() == 0) return finish();
                status_ = Status::PacketBuilding;
                return Outcome::in_progress();
            }
        } else {
            if (data_length_counter_ >= length()) {
                status_ = Status::PacketOverflow;
                return Outcome::error(status_);
            }
            frame_[kHeaderSize + data_length_counter_] = byte;
            ++data_length_counter_;
            ++internal_counter_;
            if (data_length_counter_ == length()) return finish();
            status_ = Status::PacketBuilding;
            return Outcome::in_progress();
        }

        ++internal_counter_;
        status_ = Status::PacketBuilding;
        return Outcome::in_progress();
    }

    /// @brief Recompute the CRC over bytes [4, total_length()).
    std::uint16_t compute_checksum() const noexcept {
        const auto start = config::constants::CHECKSUM_START;
        return Crc16::compute(std::span<const std::uint8_t>(frame_.data() + start,
                                                            total_length() - start));
    }

    /// @brief True if the stored checksum matches the frame contents.
    bool validate() const noexcept { return compute_checksum() == checksum(); }

    // ------------------------------------------------------------------
    // Fields
    // ------------------------------------------------------------------

    std::uint16_t header()   const noexcept { return load16(config::constants::OFFSET_HEADER); }
    std::uint16_t checksum() const noexcept { return load16(config::constants::OFFSET_CHECKSUM); }
    std::uint16_t request()  const noexcept { return load16(config::constants::OFFSET_REQUEST); }
    std::uint16_t response() const noexcept { return load16(config::constants::OFFSET_RESPONSE); }
    std::uint16_t length()   const noexcept { return load16(config::constants::OFFSET_LENGTH); }

    void set_request(std::uint16_t r) noexcept  { store16(config::constants::OFFSET_REQUEST, r); }
    void set_response(std::uint16_t r) noexcept { store16(config::constants::OFFSET_RESPONSE, r); }

    /// Header plus payload, i.e. the serialized size.
    std::size_t total_length() const noexcept { return kHeaderSize + length(); }

    /// Valid payload bytes only.
    std::span<const std::uint8_t> data() const noexcept {
        return std::span<const std::uint8_t>(frame_.data() + kHeaderSize, length());
    }

    /// Entire payload buffer (Capacity bytes), stale bytes included.
    std::span<const std::uint8_t, Capacity> buffer() const noexcept {
        return std::span<const std::uint8_t, Capacity>(frame_.data() + kHeaderSize, Capacity);
    }

    Status      status()              const noexcept { return status_; }
    std::size_t internal_counter()    const noexcept { return internal_counter_; }
    std::size_t data_length_counter() const noexcept { return data_length_counter_; }

    // ------------------------------------------------------------------
    // Reset
    // ------------------------------------------------------------------

    /// @brief Clear everything, payload included.
    void reset() noexcept {
        frame_.fill(0);
        reset_counters();
    }

    /// @brief Clear framing fields and counters; stale payload bytes stay.
    void reset_lazy() noexcept {
        for (std::size_t i = 0; i < kHeaderSize; ++i) frame_[i] = 0;
        reset_counters();
    }

private:
    flem_detail::expected<void, Status>
    pack_with(std::uint16_t request, std::uint16_t response,
              std::span<const std::uint8_t> bytes) noexcept {
        reset_lazy();
        set_request(request);
        set_response(response);
        if (auto r = add_data(bytes); !r) {
            return r;
        }
        pack();
        return {};
    }

    Outcome finish() noexcept {
        if (validate()) {
            status_ = Status::PacketReceived;
            return Outcome::completed();
        }
        status_ = Status::ChecksumError;
        return Outcome::error(status_);
    }

    void reset_counters() noexcept {
        internal_counter_ = 0;
        data_length_counter_ = 0;
        status_ = Status::Ok;
    }

    std::uint16_t load16(std::size_t off) const noexcept {
        return static_cast<std::uint16_t>(frame_[off] | (frame_[off + 1] << 8));
    }

    void store16(std::size_t off, std::uint16_t v) noexcept {
        frame_[off]     = static_cast<std::uint8_t>(v & 0xFF);
        frame_[off + 1] = static_cast<std::uint8_t>(v >> 8);
    }

    std::array<std::uint8_t, kFrameSize> frame_{};  ///< Wire image: framing fields then payload
    std::size_t internal_counter_{0};               ///< Construct position / emit cursor
    std::size_t data_length_counter_{0};            ///< Payload bytes stored by construct()
    Status      status_{Status::Ok};
};

/// Packet sized by the configured default capacity.
using DefaultPacket = Packet<config::constants::DEFAULT_PACKET_CAPACITY>;

} // namespace flem::proto
