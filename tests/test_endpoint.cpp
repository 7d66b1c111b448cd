/**
 * @file test_endpoint.cpp
 * @brief Host/client Endpoint tests over an in-memory LoopbackLink.
 *
 * Validates:
 *  - ID handshake in text and memory-image form
 *  - application dispatch, unknown requests, checksum-error replies
 *  - resync after line noise, transport back-pressure, factory validation
 */

#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <vector>

#include "flem/link/endpoint.hpp"
#include "flem/link/loopback.hpp"

using flem::link::Endpoint;
using flem::link::LinkError;
using flem::link::LoopbackLink;
using flem::link::RequestHandler;
using flem::link::Role;
using flem::obs::Counters;
using flem::obs::EventKind;
using flem::obs::LinkEvent;
using flem::proto::DataId;
namespace k = flem::config::constants;

namespace {

constexpr std::size_t CAP = 64;
constexpr std::uint16_t GET_DATA = 10;

using Pkt = flem::proto::Packet<CAP>;

struct Reply {
  std::uint16_t request;
  std::uint16_t response;
  std::vector<std::uint8_t> data;
};

// Answers GET_DATA by echoing the request payload; records host-side responses.
template <std::size_t N>
class RecordingHandler : public RequestHandler<N> {
public:
  using P = flem::proto::Packet<N>;
  bool on_request(const P& request, P& reply) override {
    ++requests;
    if (request.request() != GET_DATA) return false;
    return static_cast<bool>(reply.pack_data(GET_DATA, request.data()));
  }
  void on_response(const P& response) override {
    replies.push_back({response.request(), response.response(),
                       {response.data().begin(), response.data().end()}});
  }
  int requests{0};
  std::vector<Reply> replies;
};

using EchoHandler = RecordingHandler<CAP>;

class CountingObserver : public flem::obs::Observer {
public:
  void record(const LinkEvent& e) override {
    flem::obs::count(ctr_, e.kind);
    events.push_back(e.kind);
  }
  Counters snapshot() const override { return ctr_; }
  std::vector<EventKind> events;
private:
  Counters ctr_;
};

DataId make_id(const char* name) {
  auto id = DataId::make(name, 1, 2, 3, CAP);
  EXPECT_TRUE(id);
  return *id;
}

struct Rig {
  explicit Rig(bool ascii = true)
    : host(Role::Host, "host", link.host(), host_handler, make_id("host"), true, &host_obs),
      client(Role::Client, "client", link.client(), client_handler, make_id("client"), ascii, &client_obs) {}

  void pump(int rounds = 4) {
    for (int i = 0; i < rounds; ++i) { host.poll(); client.poll(); }
  }

  LoopbackLink<> link;
  EchoHandler host_handler, client_handler;
  CountingObserver host_obs, client_obs;
  Endpoint<CAP> host;
  Endpoint<CAP> client;
};

} // namespace

TEST(Endpoint, IdHandshake_Text) {
  Rig rig;
  ASSERT_TRUE(rig.host.request_id());
  EXPECT_FALSE(rig.host.tx_pending());
  rig.pump();

  ASSERT_TRUE(rig.host.peer_id().has_value());
  EXPECT_EQ(*rig.host.peer_id(), rig.client.id());
  EXPECT_EQ(rig.host.peer_id()->name_view(), "client");
  EXPECT_EQ(rig.host.peer_id()->max_packet_size(), CAP);

  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  EXPECT_EQ(rig.host_handler.replies[0].request, k::REQUEST_ID);
  EXPECT_EQ(rig.host_handler.replies[0].response, k::RESPONSE_SUCCESS);
  EXPECT_EQ(rig.client_handler.requests, 0); // ID handled by the endpoint itself

  EXPECT_EQ(rig.client_obs.snapshot().frames_received, 1u);
  EXPECT_EQ(rig.client_obs.snapshot().frames_sent, 1u);
  EXPECT_EQ(rig.host_obs.snapshot().frames_received, 1u);
}

TEST(Endpoint, IdHandshake_MemoryImage) {
  Rig rig(/*ascii=*/false);
  ASSERT_TRUE(rig.host.request_id());
  rig.pump();

  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  EXPECT_EQ(rig.host_handler.replies[0].data.size(), DataId::kImageSize);
  ASSERT_TRUE(rig.host.peer_id().has_value());
  EXPECT_EQ(*rig.host.peer_id(), rig.client.id());
}

TEST(Endpoint, CustomRequest_Dispatched) {
  Rig rig;
  const std::array<std::uint8_t, 5> payload{1, 2, 3, 4, 5};
  ASSERT_TRUE(rig.host.send(GET_DATA, payload));
  EXPECT_EQ(rig.host.tx().response(), k::RESPONSE_ASYNC);
  rig.pump();

  EXPECT_EQ(rig.client_handler.requests, 1);
  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  const auto& r = rig.host_handler.replies[0];
  EXPECT_EQ(r.request, GET_DATA);
  EXPECT_EQ(r.response, k::RESPONSE_SUCCESS);
  EXPECT_EQ(r.data, std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

TEST(Endpoint, UnknownRequest_Answered) {
  Rig rig;
  ASSERT_TRUE(rig.host.send(0x0BAD));
  rig.pump();

  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  EXPECT_EQ(rig.host_handler.replies[0].request, 0x0BADu);
  EXPECT_EQ(rig.host_handler.replies[0].response, k::RESPONSE_UNKNOWN_REQUEST);
  EXPECT_EQ(rig.client_obs.snapshot().unknown_requests, 1u);
}

TEST(Endpoint, ChecksumError_Answered) {
  Rig rig;
  Pkt bad;
  const std::array<std::uint8_t, 3> payload{9, 9, 9};
  ASSERT_TRUE(bad.pack_data(GET_DATA, payload));
  std::vector<std::uint8_t> wire(bad.bytes().begin(), bad.bytes().end());
  wire.back() ^= 0x80;
  for (auto b : wire) ASSERT_TRUE(rig.link.host().write(b));

  rig.pump();
  EXPECT_EQ(rig.client_handler.requests, 0);
  EXPECT_EQ(rig.client_obs.snapshot().checksum_errors, 1u);
  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  EXPECT_EQ(rig.host_handler.replies[0].response, k::RESPONSE_CHECKSUM_ERROR);
}

TEST(Endpoint, LineNoise_SingleResyncThenFrame) {
  Rig rig;
  const std::array<std::uint8_t, 5> noise{0x00, 0x13, 0xFE, 0x42, 0x07};
  for (auto b : noise) ASSERT_TRUE(rig.link.host().write(b));
  ASSERT_TRUE(rig.host.send(GET_DATA));
  rig.pump();

  EXPECT_EQ(rig.client_obs.snapshot().resyncs, 1u);
  EXPECT_EQ(rig.client_handler.requests, 1);
  ASSERT_EQ(rig.host_handler.replies.size(), 1u);
  EXPECT_EQ(rig.host_handler.replies[0].response, k::RESPONSE_SUCCESS);
}

TEST(Endpoint, InvalidLength_ThenRecovers) {
  LoopbackLink<> link;
  RecordingHandler<8> hh, ch;
  CountingObserver client_obs;
  auto id = DataId::make("small", 1, 0, 0, 8);
  ASSERT_TRUE(id);
  Endpoint<8> host(Role::Host, "host", link.host(), hh, *id, true);
  Endpoint<8> client(Role::Client, "client", link.client(), ch, *id, true, &client_obs);

  // 20-byte payload declared to an 8-byte client; the payload bytes are line noise to it
  flem::proto::Packet<32> big;
  const std::vector<std::uint8_t> oversized(20, 0x00);
  ASSERT_TRUE(big.pack_data(GET_DATA, oversized));
  for (auto b : big.bytes()) ASSERT_TRUE(link.host().write(b));

  const std::array<std::uint8_t, 3> payload{7, 8, 9};
  ASSERT_TRUE(host.send(GET_DATA, payload));
  for (int i = 0; i < 8; ++i) { host.poll(); client.poll(); }

  const auto c = client_obs.snapshot();
  EXPECT_EQ(c.invalid_lengths, 1u);
  EXPECT_EQ(c.resyncs, 1u);
  EXPECT_EQ(c.checksum_errors, 0u);
  EXPECT_EQ(c.frames_received, 1u);
  EXPECT_EQ(ch.requests, 1);
  ASSERT_EQ(hh.replies.size(), 1u);
  EXPECT_EQ(hh.replies[0].response, k::RESPONSE_SUCCESS);
  EXPECT_EQ(hh.replies[0].data, std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

TEST(Endpoint, IdReplyTooLarge_AnsweredWithError) {
  for (const bool ascii : {true, false}) {
    LoopbackLink<> link;
    RecordingHandler<16> hh, ch;
    CountingObserver client_obs;
    auto id = DataId::make("tiny", 1, 0, 0, 16);
    ASSERT_TRUE(id);
    Endpoint<16> host(Role::Host, "host", link.host(), hh, *id, true);
    Endpoint<16> client(Role::Client, "client", link.client(), ch, *id, ascii, &client_obs);

    ASSERT_TRUE(host.request_id());
    for (int i = 0; i < 8; ++i) { host.poll(); client.poll(); }

    ASSERT_EQ(hh.replies.size(), 1u) << "ascii=" << ascii;
    EXPECT_EQ(hh.replies[0].request, k::REQUEST_ID);
    EXPECT_EQ(hh.replies[0].response, k::RESPONSE_ERROR);
    EXPECT_TRUE(hh.replies[0].data.empty());
    EXPECT_FALSE(host.peer_id().has_value());
    EXPECT_EQ(client_obs.snapshot().reply_errors, 1u);
    EXPECT_EQ(client_obs.snapshot().frames_sent, 1u);
  }
}

TEST(Endpoint, BackPressure_SmallRing) {
  LoopbackLink<16> link;   // 15 bytes in flight per direction
  EchoHandler hh, ch;
  Endpoint<CAP> host(Role::Host, "host", link.host(), hh, make_id("h"), true);
  Endpoint<CAP> client(Role::Client, "client", link.client(), ch, make_id("c"), true);

  std::vector<std::uint8_t> payload(40);
  for (std::size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<std::uint8_t>(i);

  ASSERT_TRUE(host.send(GET_DATA, payload));
  EXPECT_TRUE(host.tx_pending());

  auto again = host.send(GET_DATA);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), LinkError::TxBusy);

  for (int i = 0; i < 64 && hh.replies.empty(); ++i) {
    host.poll();
    client.poll();
  }
  EXPECT_FALSE(host.tx_pending());
  EXPECT_FALSE(client.tx_pending());
  ASSERT_EQ(hh.replies.size(), 1u);
  EXPECT_EQ(hh.replies[0].data, payload);
}

TEST(Endpoint, Send_PayloadOverflow) {
  Rig rig;
  std::vector<std::uint8_t> payload(CAP + 1, 0x11);
  auto r = rig.host.send(GET_DATA, payload);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), LinkError::PayloadOverflow);
  EXPECT_FALSE(rig.host.tx_pending());
}

TEST(Endpoint, Create_ValidatesConfig) {
  LoopbackLink<> link;
  EchoHandler h;

  flem::config::EndpointConfig cfg;
  cfg.name = "sensor";
  cfg.version_major = 2;
  auto ok = Endpoint<CAP>::create(cfg, Role::Client, "client", link.client(), h);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->id().max_packet_size(), CAP); // 0 -> capacity
  EXPECT_EQ(ok->id().version_major(), 2u);
  EXPECT_EQ(ok->role(), Role::Client);

  cfg.max_packet_size = CAP + 1;
  auto too_big = Endpoint<CAP>::create(cfg, Role::Client, "client", link.client(), h);
  ASSERT_FALSE(too_big);
  EXPECT_EQ(too_big.error(), LinkError::InvalidConfig);

  cfg.max_packet_size = 0;
  cfg.name = std::string(k::ID_NAME_SIZE + 1, 'z');
  auto long_name = Endpoint<CAP>::create(cfg, Role::Client, "client", link.client(), h);
  ASSERT_FALSE(long_name);
  EXPECT_EQ(flem::link::to_string(long_name.error()), "invalid_config");

  // the ID reply must fit the packet in the configured encoding
  RecordingHandler<16> small_h;
  flem::config::EndpointConfig small_cfg;
  small_cfg.name = "tiny";
  small_cfg.id_ascii = true;
  auto text_too_big = Endpoint<16>::create(small_cfg, Role::Client, "client", link.client(), small_h);
  ASSERT_FALSE(text_too_big);
  EXPECT_EQ(text_too_big.error(), LinkError::InvalidConfig);
  small_cfg.id_ascii = false;
  auto image_too_big = Endpoint<16>::create(small_cfg, Role::Client, "client", link.client(), small_h);
  ASSERT_FALSE(image_too_big);
  EXPECT_EQ(image_too_big.error(), LinkError::InvalidConfig);
}
