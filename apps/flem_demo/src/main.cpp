/**
 * @file main.cpp
 * @brief flem_demo: host and client endpoints talking over an in-memory loopback.
 *
 * Walks through the exchanges a real deployment sees on a UART:
 *  1) ID handshake (client answers with its descriptor)
 *  2) an application request (GET_DATA) answered with a payload
 *  3) an unknown request (answered with RESPONSE_UNKNOWN_REQUEST)
 *  4) a frame corrupted in flight (answered with RESPONSE_CHECKSUM_ERROR)
 *
 * Usage:
 *   ./flem_demo [client.conf]
 * The optional file follows config::Loader's key = value format and sets the
 * client's identity.
 */

#include <array>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "flem/config/config_loader.hpp"
#include "flem/link/endpoint.hpp"
#include "flem/link/loopback.hpp"
#include "flem/version.hpp"

namespace {

constexpr std::size_t kPacketSize = flem::config::constants::DEFAULT_PACKET_CAPACITY;

namespace host_requests {
    constexpr std::uint16_t GET_DATA = 10;
}

using Pkt = flem::proto::Packet<kPacketSize>;

class ClientApp : public flem::link::RequestHandler<kPacketSize> {
public:
    bool on_request(const Pkt& request, Pkt& reply) override {
        if (request.request() != host_requests::GET_DATA) return false;
        std::array<std::uint8_t, 40> project_data{};
        for (std::size_t i = 0; i < project_data.size(); ++i) {
            project_data[i] = static_cast<std::uint8_t>(i * 3);
        }
        if (!reply.pack_data(request.request(), project_data)) {
            std::cerr << "client: GET_DATA reply does not fit the packet\n";
            return false;
        }
        return true;
    }
};

class HostApp : public flem::link::RequestHandler<kPacketSize> {
public:
    bool on_request(const Pkt&, Pkt&) override { return false; }

    void on_response(const Pkt& response) override {
        std::cout << "host: response request=" << response.request()
                  << " response=0x" << std::hex << response.response() << std::dec
                  << " length=" << response.length() << "\n";
    }
};

void pump(flem::link::Endpoint<kPacketSize>& host, flem::link::Endpoint<kPacketSize>& client) {
    for (int i = 0; i < 8; ++i) {
        host.poll();
        client.poll();
    }
}

void print_counters(const char* who, const flem::obs::Counters& c) {
    std::printf("%s: received=%llu sent=%llu checksum_errors=%llu resyncs=%llu unknown=%llu\n",
                who,
                static_cast<unsigned long long>(c.frames_received),
                static_cast<unsigned long long>(c.frames_sent),
                static_cast<unsigned long long>(c.checksum_errors),
                static_cast<unsigned long long>(c.resyncs),
                static_cast<unsigned long long>(c.unknown_requests));
}

} // namespace

int main(int argc, char** argv) {
    using flem::link::Role;

    std::cout << "flem_demo " << flem::version_string << "\n";

    const std::string path = (argc > 1) ? argv[1] : "";
    auto client_cfg = flem::config::Loader::load_from_file(path);
    if (!client_cfg) {
        const auto& e = client_cfg.error();
        std::cerr << "config error: " << flem::config::to_string(e.code)
                  << " line=" << e.line << " key=" << e.key << "\n";
        return 1;
    }
    if (path.empty()) {
        client_cfg->name = "Example Project 25 chars.";
        client_cfg->version_minor = 1;
    }

    flem::config::EndpointConfig host_cfg = flem::config::Loader::defaults();
    host_cfg.name = "demo host";

    flem::link::LoopbackLink<> link;
    HostApp host_app;
    ClientApp client_app;
    auto* observer = flem::obs::make_simple_observer();

    auto host = flem::link::Endpoint<kPacketSize>::create(host_cfg, Role::Host, "host",
                                                          link.host(), host_app, observer);
    auto client = flem::link::Endpoint<kPacketSize>::create(*client_cfg, Role::Client, "client",
                                                            link.client(), client_app, observer);
    if (!host || !client) {
        std::cerr << "endpoint setup failed: "
                  << flem::link::to_string(!host ? host.error() : client.error()) << "\n";
        return 1;
    }

    // 1) ID handshake
    if (!host->request_id()) return 1;
    pump(*host, *client);
    if (const auto& peer = host->peer_id()) {
        std::cout << "host: peer \"" << peer->name_view() << "\" v"
                  << int(peer->version_major()) << "." << int(peer->version_minor()) << "."
                  << int(peer->version_patch()) << " max packet " << peer->max_packet_size() << "\n";
    }

    // 2) application request
    if (!host->send(host_requests::GET_DATA)) return 1;
    pump(*host, *client);

    // 3) unknown request
    if (!host->send(0x0BAD)) return 1;
    pump(*host, *client);

    // 4) corrupted frame: flip one payload bit on the wire
    Pkt raw;
    const std::array<std::uint8_t, 4> payload{0xDE, 0xAD, 0xBE, 0xEF};
    if (!raw.pack_data(host_requests::GET_DATA, payload)) return 1;
    std::vector<std::uint8_t> wire(raw.bytes().begin(), raw.bytes().end());
    wire.back() ^= 0x01;
    for (const auto b : wire) {
        if (!link.host().write(b)) return 1;
    }
    pump(*host, *client);

    print_counters("link", observer->snapshot());
    return 0;
}
