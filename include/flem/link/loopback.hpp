#pragma once
/**
 * @file loopback.hpp
 * @brief Two cross-wired in-memory transports (host <-> client) for tests and demos.
 *
 * Each direction is an SpscRing, so the host side may run on one thread and
 * the client side on another.
 */

#include <cstddef>
#include <cstdint>

#include "flem/config/constants.hpp"
#include "flem/link/transport.hpp"
#include "flem/mem/spsc_ring.hpp"

namespace flem::link {

template <std::size_t N = config::constants::DEFAULT_LINK_RING_SIZE>
class LoopbackLink final {
public:
    using Ring = mem::SpscRing<std::uint8_t, N>;

    /// One end of the link: reads from one ring, writes to the other.
    class Port final : public Transport {
    public:
        Port(Ring& rx, Ring& tx) noexcept : rx_(rx), tx_(tx) {}

        bool read(std::uint8_t& out) noexcept override { return rx_.pop(out); }
        bool write(std::uint8_t byte) noexcept override { return tx_.push(byte); }

        /// Bytes waiting to be read on this end.
        std::size_t pending() const noexcept { return rx_.approx_size(); }

    private:
        Ring& rx_;
        Ring& tx_;
    };

    LoopbackLink() noexcept = default;
    LoopbackLink(const LoopbackLink&)            = delete;
    LoopbackLink& operator=(const LoopbackLink&) = delete;

    Port& host() noexcept   { return host_; }
    Port& client() noexcept { return client_; }

private:
    Ring to_client_{};
    Ring to_host_{};
    Port host_{to_host_, to_client_};
    Port client_{to_client_, to_host_};
};

} // namespace flem::link
