#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: link events + counters.
 * @details Events carry no owning strings so endpoints can report them from
 *          the poll loop without allocating.
 */

#include <cstdint>
#include <string_view>

namespace flem::obs {

    /** @enum EventKind
     *  @brief Terminal outcomes and notable transitions on a link.
     */
    enum class EventKind : std::uint8_t {
        FrameReceived,    ///< Inbound frame passed its checksum
        FrameSent,        ///< Outbound frame fully handed to the transport
        ChecksumError,    ///< Inbound frame failed its checksum
        Resync,           ///< Framing lost; hunting for header bytes
        Overflow,         ///< Byte arrived past the end of a frame
        InvalidLength,    ///< Declared length larger than capacity
        UnknownRequest,   ///< No handler for an inbound request
        ReplyTooLarge     ///< Reply did not fit the packet; error response sent
    };

    std::string_view to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for link activity.
     */
    struct Counters {
        uint64_t frames_received{0};   ///< Frames with a valid checksum
        uint64_t frames_sent{0};       ///< Frames fully written
        uint64_t checksum_errors{0};   ///< Frames rejected by CRC
        uint64_t resyncs{0};           ///< Times framing was lost
        uint64_t overflows{0};         ///< Bytes past frame end
        uint64_t invalid_lengths{0};   ///< Frames with length > capacity
        uint64_t unknown_requests{0};  ///< Requests answered with UNKNOWN_REQUEST
        uint64_t reply_errors{0};      ///< Replies downgraded to RESPONSE_ERROR
    };

    /** @struct LinkEvent
     *  @brief Payload describing a single link event.
     */
    struct LinkEvent {
        std::string_view endpoint;  ///< Static label of the reporting endpoint
        EventKind        kind{EventKind::FrameReceived};
        std::uint16_t    request{0};
        std::uint16_t    response{0};
        std::uint16_t    length{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single link event.
        virtual void record(const LinkEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Fold an event into a counter set.
    void count(Counters& c, EventKind k) noexcept;

    // Process-wide printf-backed observer (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace flem::obs
