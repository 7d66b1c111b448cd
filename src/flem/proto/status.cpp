/**
 * @file status.cpp
 * @brief Labels for Status values (logs, test diagnostics).
 */
#include "flem/proto/status.hpp"

namespace flem::proto {

std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Ok:                        return "ok";
        case Status::PacketReceived:            return "packet_received";
        case Status::PacketBuilding:            return "packet_building";
        case Status::GetByteFinished:           return "get_byte_finished";
        case Status::PacketOverflow:            return "packet_overflow";
        case Status::HeaderBytesNotFound:       return "header_bytes_not_found";
        case Status::ChecksumError:             return "checksum_error";
        case Status::InvalidDataLengthDetected: return "invalid_data_length";
    }
    return "unknown";
}

} // namespace flem::proto
