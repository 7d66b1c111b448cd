/**
 * @file endpoint.cpp
 * @brief Labels for link enums and the default-capacity Endpoint instance.
 */
#include "flem/link/endpoint.hpp"

namespace flem::link {

std::string_view to_string(Role r) noexcept {
    switch (r) {
        case Role::Host:   return "host";
        case Role::Client: return "client";
    }
    return "unknown";
}

std::string_view to_string(LinkError e) noexcept {
    switch (e) {
        case LinkError::TxBusy:          return "tx_busy";
        case LinkError::PayloadOverflow: return "payload_overflow";
        case LinkError::InvalidConfig:   return "invalid_config";
    }
    return "unknown";
}

template class Endpoint<config::constants::DEFAULT_PACKET_CAPACITY>;

} // namespace flem::link
