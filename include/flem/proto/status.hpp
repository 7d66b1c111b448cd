#pragma once
/**
 * @file status.hpp
 * @brief Outcome vocabulary shared by Packet, DataId and the link layer.
 */

#include <cstdint>
#include <string_view>

namespace flem::proto {

/** @enum Status
 *  @brief Most recent outcome of an operation on a packet.
 *
 * Only ChecksumError, PacketOverflow and InvalidDataLengthDetected are
 * failures. HeaderBytesNotFound is recoverable: keep feeding bytes.
 */
enum class Status : std::uint8_t {
    Ok = 0,
    PacketReceived,            ///< Inbound frame complete and checksum matched
    PacketBuilding,            ///< Inbound frame still assembling
    GetByteFinished,           ///< Outbound emission exhausted
    PacketOverflow,            ///< Payload would exceed capacity or frame end
    HeaderBytesNotFound,       ///< Lost framing; state machine restarted
    ChecksumError,             ///< Frame complete but CRC mismatch
    InvalidDataLengthDetected  ///< Declared length exceeds capacity
};

/// @brief Human-readable label for logs.
std::string_view to_string(Status s) noexcept;

/// @brief True for outcomes that end the current inbound frame.
constexpr bool is_terminal(Status s) noexcept {
    return s == Status::PacketReceived || s == Status::ChecksumError ||
           s == Status::PacketOverflow || s == Status::InvalidDataLengthDetected;
}

/** @class Outcome
 *  @brief Tagged result of feeding one byte: in progress, completed, or error.
 *
 * HeaderBytesNotFound is reported as an Error whose status says the caller
 * may simply continue.
 */
class Outcome {
public:
    enum class Kind : std::uint8_t { InProgress, Completed, Error };

    static constexpr Outcome in_progress() noexcept { return Outcome{Kind::InProgress, Status::PacketBuilding}; }
    static constexpr Outcome completed() noexcept { return Outcome{Kind::Completed, Status::PacketReceived}; }
    static constexpr Outcome error(Status s) noexcept { return Outcome{Kind::Error, s}; }

    constexpr Kind   kind()   const noexcept { return kind_; }
    constexpr Status status() const noexcept { return status_; }

    constexpr bool is_in_progress() const noexcept { return kind_ == Kind::InProgress; }
    constexpr bool is_completed() const noexcept { return kind_ == Kind::Completed; }
    constexpr bool is_error() const noexcept { return kind_ == Kind::Error; }

    /// Error the state machine already recovered from (resync).
    constexpr bool recoverable() const noexcept {
        return kind_ == Kind::Error && status_ == Status::HeaderBytesNotFound;
    }

    constexpr bool operator==(const Outcome&) const noexcept = default;

private:
    constexpr Outcome(Kind k, Status s) noexcept : kind_(k), status_(s) {}

    Kind   kind_;
    Status status_;
};

} // namespace flem::proto
