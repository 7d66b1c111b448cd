#pragma once
/**
 * @file endpoint.hpp
 * @brief One side of a FLEM link: a dedicated rx/tx Packet pair over a Transport.
 *
 * Roles:
 *  - Host: sends requests (send(), request_id()) and receives responses.
 *    ID responses are decoded into peer_id() before on_response() runs.
 *  - Client: answers requests. REQUEST_ID is answered with the local
 *    descriptor; anything else goes to RequestHandler::on_request(), and a
 *    false return is answered with RESPONSE_UNKNOWN_REQUEST. Frames failing
 *    their checksum are answered with RESPONSE_CHECKSUM_ERROR. A descriptor
 *    that does not fit Capacity is answered with a header-only RESPONSE_ERROR.
 *
 * poll() is non-blocking and allocation-free: it drains whatever bytes the
 * transport has, one construct() per byte, and pushes pending tx bytes.
 * A client stops reading while its reply is still pending (back-pressure
 * stays in the transport).
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "flem/compat/expected.hpp"
#include "flem/config/config_loader.hpp"
#include "flem/config/constants.hpp"
#include "flem/link/transport.hpp"
#include "flem/obs/observability.hpp"
#include "flem/proto/data_id.hpp"
#include "flem/proto/packet.hpp"

namespace flem::link {

enum class Role : std::uint8_t { Host, Client };

/// @brief Errors surfaced by Endpoint setup and send paths.
enum class LinkError : std::uint8_t {
    TxBusy = 1,       ///< Previous frame still being written
    PayloadOverflow,  ///< Payload larger than the packet capacity
    InvalidConfig     ///< Descriptor or size settings rejected
};

std::string_view to_string(Role r) noexcept;
std::string_view to_string(LinkError e) noexcept;

/** @class RequestHandler
 *  @brief Application dispatch for an Endpoint.
 */
template <std::size_t Capacity>
class RequestHandler {
public:
    using PacketT = proto::Packet<Capacity>;

    virtual ~RequestHandler() = default;

    /**
     * @brief Client role: build the reply for @p request into @p reply.
     * @return false if the request code is unknown.
     */
    virtual bool on_request(const PacketT& request, PacketT& reply) = 0;

    /// @brief Host role: a valid response frame arrived.
    virtual void on_response(const PacketT& response) { (void)response; }
};

template <std::size_t Capacity = config::constants::DEFAULT_PACKET_CAPACITY>
class Endpoint final {
public:
    using PacketT = proto::Packet<Capacity>;
    using Handler = RequestHandler<Capacity>;

    /**
     * @param label Static name used in observer events (must outlive the endpoint).
     * @param observer Optional sink; nullptr disables reporting.
     */
    Endpoint(Role role, std::string_view label, Transport& transport, Handler& handler,
             proto::DataId id, bool id_ascii, obs::Observer* observer = nullptr) noexcept
        : role_(role), label_(label), transport_(transport), handler_(handler),
          id_(id), id_ascii_(id_ascii), observer_(observer) {}

    /**
     * @brief Factory: validates @p cfg against Capacity and builds the descriptor.
     * @return LinkError::InvalidConfig if the name is too long, the
     *         advertised packet size exceeds Capacity, or the ID reply in the
     *         configured encoding would not fit.
     */
    static flem_detail::expected<Endpoint, LinkError>
    create(const config::EndpointConfig& cfg, Role role, std::string_view label,
           Transport& transport, Handler& handler, obs::Observer* observer = nullptr) {
        const std::size_t max_size = cfg.max_packet_size == 0 ? Capacity : cfg.max_packet_size;
        const std::size_t id_size = cfg.id_ascii ? proto::DataId::kTextSize
                                                 : proto::DataId::kImageSize;
        if (max_size > Capacity || id_size > Capacity) {
            return flem_detail::unexpected(LinkError::InvalidConfig);
        }
        auto id = proto::DataId::make(cfg.name, cfg.version_major, cfg.version_minor,
                                      cfg.version_patch, static_cast<std::uint16_t>(max_size));
        if (!id) {
            return flem_detail::unexpected(LinkError::InvalidConfig);
        }
        if (cfg.verbose && observer == nullptr) {
            observer = obs::make_simple_observer();
        }
        return Endpoint(role, label, transport, handler, *id, cfg.id_ascii, observer);
    }

    /**
     * @brief Drain available input and push pending output.
     * @return Number of valid frames completed during this call.
     */
    std::size_t poll() {
        std::size_t completed = 0;
        flush();

        std::uint8_t byte{};
        while (can_receive() && transport_.read(byte)) {
            const proto::Outcome out = rx_.construct(byte);
            if (out.is_in_progress()) {
                hunting_ = false;
                continue;
            }
            if (out.recoverable()) {
                if (!hunting_) {
                    hunting_ = true;
                    report(obs::EventKind::Resync, rx_);
                }
                continue;
            }

            hunting_ = false;
            if (out.is_completed()) {
                ++completed;
                report(obs::EventKind::FrameReceived, rx_);
                on_frame();
            } else {
                on_error(out.status());
            }
            rx_.reset_lazy();
        }

        flush();
        return completed;
    }

    /**
     * @brief Host role: send a request with optional payload.
     * Requests carry RESPONSE_ASYNC until the peer answers.
     */
    flem_detail::expected<void, LinkError>
    send(std::uint16_t request, std::span<const std::uint8_t> payload = {}) {
        if (tx_pending_) {
            return flem_detail::unexpected(LinkError::TxBusy);
        }
        if (!tx_.pack_request(request, payload)) {
            return flem_detail::unexpected(LinkError::PayloadOverflow);
        }
        begin_send();
        return {};
    }

    /// @brief Host role: ask the peer for its descriptor.
    flem_detail::expected<void, LinkError> request_id() {
        return send(config::constants::REQUEST_ID);
    }

    /**
     * @brief Write as many pending tx bytes as the transport accepts.
     * @return true once nothing is left to send.
     */
    bool flush() {
        if (!tx_pending_) return true;
        if (held_) {
            if (!transport_.write(*held_)) return false;
            held_.reset();
        }
        for (;;) {
            const auto b = tx_.get_byte();
            if (!b) {
                tx_pending_ = false;
                report(obs::EventKind::FrameSent, tx_);
                return true;
            }
            if (!transport_.write(*b)) {
                held_ = *b;
                return false;
            }
        }
    }

    Role                 role()       const noexcept { return role_; }
    const proto::DataId& id()         const noexcept { return id_; }
    bool                 tx_pending() const noexcept { return tx_pending_; }
    const PacketT&       rx()         const noexcept { return rx_; }
    const PacketT&       tx()         const noexcept { return tx_; }

    /// Descriptor from the last ID response (host role).
    const std::optional<proto::DataId>& peer_id() const noexcept { return peer_id_; }

private:
    bool can_receive() const noexcept {
        return role_ == Role::Host || !tx_pending_;
    }

    void begin_send() {
        tx_pending_ = true;
        held_.reset();
        flush();
    }

    void on_frame() {
        using namespace config::constants;
        if (role_ == Role::Host) {
            if (rx_.request() == REQUEST_ID && rx_.response() == RESPONSE_SUCCESS) {
                decode_peer_id();
            }
            handler_.on_response(rx_);
            return;
        }

        if (rx_.request() == REQUEST_ID) {
            send_reply(tx_.pack_id(id_, id_ascii_));
            return;
        }
        if (handler_.on_request(rx_, tx_)) {
            begin_send();
            return;
        }
        report(obs::EventKind::UnknownRequest, rx_);
        send_reply(tx_.pack_error(rx_.request(), RESPONSE_UNKNOWN_REQUEST));
    }

    /// Send the packed reply, or a header-only RESPONSE_ERROR if it did not fit.
    void send_reply(flem_detail::expected<void, proto::Status> packed) {
        if (!packed) {
            report(obs::EventKind::ReplyTooLarge, rx_);
            if (!tx_.pack_error(rx_.request(), config::constants::RESPONSE_ERROR)) return;
        }
        begin_send();
    }

    void on_error(proto::Status s) {
        switch (s) {
            case proto::Status::ChecksumError:
                report(obs::EventKind::ChecksumError, rx_);
                if (role_ == Role::Client) {
                    send_reply(tx_.pack_error(rx_.request(), config::constants::RESPONSE_CHECKSUM_ERROR));
                }
                break;
            case proto::Status::InvalidDataLengthDetected:
                report(obs::EventKind::InvalidLength, rx_);
                break;
            default:
                report(obs::EventKind::Overflow, rx_);
                break;
        }
    }

    void decode_peer_id() noexcept {
        const auto payload = rx_.data();
        if (payload.size() == proto::DataId::kTextSize) {
            if (auto id = proto::DataId::from_bytes(payload)) peer_id_ = *id;
        } else if (payload.size() == proto::DataId::kImageSize) {
            if (auto id = proto::DataId::from_image(payload)) peer_id_ = *id;
        }
    }

    void report(obs::EventKind kind, const PacketT& p) {
        if (!observer_) return;
        observer_->record(obs::LinkEvent{label_, kind, p.request(), p.response(), p.length()});
    }

    Role           role_;
    std::string_view label_;
    Transport&     transport_;
    Handler&       handler_;
    proto::DataId  id_;
    bool           id_ascii_;
    obs::Observer* observer_;

    PacketT rx_{};
    PacketT tx_{};
    bool tx_pending_{false};
    bool hunting_{false};                   ///< Inside a run of HeaderBytesNotFound
    std::optional<std::uint8_t>  held_{};   ///< Byte the transport refused last time
    std::optional<proto::DataId> peer_id_{};
};

} // namespace flem::link
