// apps/frame_dump/src/main.cpp
// FLEM: frame_dump
// Purpose: decode a captured byte stream (hex) into frames. Handy next to a
// logic analyzer or a serial sniffer.
//
// Usage:
//   ./frame_dump 55 55 01 56 0a 00 01 00 00 00
//   xxd -p capture.bin | ./frame_dump
//
// Notes:
// - Whitespace, commas and an optional 0x prefix are accepted between bytes.
// - Garbage between frames is reported once per run as "resync".

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "flem/config/constants.hpp"
#include "flem/proto/packet.hpp"

namespace {

using Rx = flem::proto::Packet<flem::config::constants::MAX_PACKET_CAPACITY>;

struct Dumper {
    Rx          rx;
    std::size_t offset{0};
    std::size_t frames{0};
    std::size_t errors{0};
    bool        hunting{false};

    void feed(std::uint8_t b) {
        const auto out = rx.construct(b);
        ++offset;
        if (out.is_in_progress()) { hunting = false; return; }
        if (out.recoverable()) {
            if (!hunting) std::cout << "@" << offset - 1 << " resync\n";
            hunting = true;
            return;
        }
        hunting = false;
        if (out.is_completed()) {
            ++frames;
            print_frame();
        } else {
            ++errors;
            std::cout << "@" << offset - 1 << " error " << flem::proto::to_string(out.status())
                      << " request=" << rx.request() << "\n";
        }
        rx.reset_lazy();
    }

    void print_frame() const {
        std::cout << "@" << offset - rx.total_length() << " frame request=" << rx.request()
                  << " response=0x" << std::hex << rx.response()
                  << " crc=0x" << rx.checksum() << std::dec
                  << " length=" << rx.length();
        if (rx.length() > 0) {
            std::cout << " data=";
            for (const auto b : rx.data()) {
                std::cout << std::hex << std::setw(2) << std::setfill('0') << int(b);
            }
            std::cout << std::dec << std::setfill(' ');
        }
        std::cout << "\n";
    }
};

std::optional<std::uint8_t> parse_hex_byte(std::string tok) {
    if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) tok = tok.substr(2);
    if (tok.empty() || tok.size() > 2) return std::nullopt;
    for (const char c : tok) if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    return static_cast<std::uint8_t>(std::stoul(tok, nullptr, 16));
}

// Split a token such as "5555" (xxd -p output) into byte pairs.
bool feed_token(Dumper& d, const std::string& tok) {
    if (tok.size() > 2 && !(tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X'))) {
        if (tok.size() % 2 != 0) return false;
        for (std::size_t i = 0; i < tok.size(); i += 2) {
            const auto b = parse_hex_byte(tok.substr(i, 2));
            if (!b) return false;
            d.feed(*b);
        }
        return true;
    }
    const auto b = parse_hex_byte(tok);
    if (!b) return false;
    d.feed(*b);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Dumper d;
    auto handle = [&](std::string tok) {
        for (auto& c : tok) if (c == ',') c = ' ';
        std::size_t start = 0;
        while (start < tok.size()) {
            const auto end = tok.find(' ', start);
            const auto piece = tok.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (!piece.empty() && !feed_token(d, piece)) {
                std::cerr << "frame_dump: not a hex byte: " << piece << "\n";
                return false;
            }
            if (end == std::string::npos) break;
            start = end + 1;
        }
        return true;
    };

    if (argc > 1) {
        for (int i = 1; i < argc; ++i) if (!handle(argv[i])) return 2;
    } else {
        std::string tok;
        while (std::cin >> tok) if (!handle(tok)) return 2;
    }

    if (d.rx.internal_counter() != 0) {
        std::cout << "@" << d.offset << " truncated frame (" << d.rx.internal_counter() << " bytes)\n";
    }
    std::cout << d.frames << " frame(s), " << d.errors << " error(s)\n";
    return d.errors == 0 ? 0 : 1;
}
