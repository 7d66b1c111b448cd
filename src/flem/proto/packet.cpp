/**
 * @file packet.cpp
 * @brief Explicit template instantiations for Packet to reduce code bloat.
*/

#include "flem/proto/packet.hpp"

namespace flem::proto {

    /// One compiled instance for the configured default capacity, plus the
    /// smallest size used by tests and the descriptor exchange.
    template class Packet<config::constants::DEFAULT_PACKET_CAPACITY>;
    template class Packet<DataId::kTextSize>;
} // namespace flem::proto
