/**
 * @file test_ring.cpp
 * @brief Tests for SpscRing<T, N> (inline storage, interrupt-to-loop FIFO).
 */
#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "flem/mem/spsc_ring.hpp"
#include "flem/proto/packet.hpp"

using flem::mem::SpscRing;

TEST(SpscRing, SingleThread_Basics) {
  constexpr std::size_t CAP = 8;
  SpscRing<int, CAP> q;
  EXPECT_TRUE(q.empty());
  EXPECT_EQ(q.capacity(), CAP);

  // fill N-1
  for (int i = 0; i < int(CAP - 1); ++i) EXPECT_TRUE(q.push(i));
  EXPECT_TRUE(q.full());
  EXPECT_EQ(q.approx_size(), CAP - 1);
  EXPECT_FALSE(q.push(999));

  // pop 3
  for (int i = 0; i < 3; ++i) {
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }

  // push 3 (wrap)
  for (int i = 100; i < 103; ++i) EXPECT_TRUE(q.push(i));

  // drain & check order
  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  std::vector<int> expected = {3,4,5,6,100,101,102};
  EXPECT_EQ(out, expected);
  EXPECT_TRUE(q.empty());
}

TEST(SpscRing, MoveOnlyElements) {
  SpscRing<std::unique_ptr<int>, 4> q;
  EXPECT_TRUE(q.push(nullptr));
  std::unique_ptr<int> p;
  ASSERT_TRUE(q.pop(p));
  EXPECT_FALSE(p);
}

/**
 * @test ProducerConsumer_Frames
 * @brief A producer thread streams serialized frames byte by byte (as a UART
 *        interrupt would); the consumer rebuilds them with construct().
 */
TEST(SpscRing, ProducerConsumer_Frames) {
  using Pkt = flem::proto::Packet<32>;
  constexpr std::size_t FRAMES = 2000;
  auto q = std::make_shared<SpscRing<std::uint8_t, 64>>();

  std::thread prod([&]{
    Pkt tx;
    for (std::size_t f = 0; f < FRAMES; ++f) {
      std::uint8_t payload[4] = {static_cast<std::uint8_t>(f), static_cast<std::uint8_t>(f >> 8), 0xAB, 0xCD};
      ASSERT_TRUE(tx.pack_data(static_cast<std::uint16_t>(f), std::span<const std::uint8_t>(payload, 1 + f % 4)));
      for (;;) {
        auto b = tx.get_byte();
        if (!b) break;
        while (!q->push(*b)) std::this_thread::yield();
      }
    }
  });

  std::size_t received = 0, errors = 0;
  Pkt rx;
  std::thread cons([&]{
    std::uint8_t b{};
    while (received + errors < FRAMES) {
      if (!q->pop(b)) { std::this_thread::yield(); continue; }
      auto out = rx.construct(b);
      if (out.is_in_progress()) continue;
      if (out.is_completed()) {
        EXPECT_EQ(rx.request(), received);
        EXPECT_EQ(rx.length(), 1 + received % 4);
        ++received;
      } else {
        ++errors;
      }
      rx.reset_lazy();
    }
  });
  prod.join(); cons.join();

  EXPECT_EQ(received, FRAMES);
  EXPECT_EQ(errors, 0u);
  EXPECT_TRUE(q->empty());
}
