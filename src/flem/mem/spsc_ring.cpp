/**
 * @file spsc_ring.cpp
 * @brief Explicit template instantiations for SpscRing to reduce code bloat.
*/

#include "flem/mem/spsc_ring.hpp"
#include "flem/config/constants.hpp"

namespace flem::mem {

    /// Byte FIFO used by LoopbackLink and driver glue.
    template class SpscRing<std::uint8_t, config::constants::DEFAULT_LINK_RING_SIZE>;
} // namespace flem::mem
