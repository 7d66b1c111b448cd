/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer for bring-up.
 */
#include "flem/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace flem::obs {

    std::string_view to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::FrameReceived:  return "frame_received";
            case EventKind::FrameSent:      return "frame_sent";
            case EventKind::ChecksumError:  return "checksum_error";
            case EventKind::Resync:         return "resync";
            case EventKind::Overflow:       return "overflow";
            case EventKind::InvalidLength:  return "invalid_length";
            case EventKind::UnknownRequest: return "unknown_request";
            case EventKind::ReplyTooLarge:  return "reply_too_large";
        }
        return "unknown";
    }

    void count(Counters& c, EventKind k) noexcept {
        switch (k) {
            case EventKind::FrameReceived:  c.frames_received++;  break;
            case EventKind::FrameSent:      c.frames_sent++;      break;
            case EventKind::ChecksumError:  c.checksum_errors++;  break;
            case EventKind::Resync:         c.resyncs++;          break;
            case EventKind::Overflow:       c.overflows++;        break;
            case EventKind::InvalidLength:  c.invalid_lengths++;  break;
            case EventKind::UnknownRequest: c.unknown_requests++; break;
            case EventKind::ReplyTooLarge:  c.reply_errors++;     break;
        }
    }

    class SimpleObserver : public Observer {
    public:
        void record(const LinkEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e.kind);
            const auto kind = to_string(e.kind);
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"endpoint":"%.*s","event":"%.*s","request":%u,"response":%u,"length":%u})" "\n",
              static_cast<int>(e.endpoint.size()), e.endpoint.data(),
              static_cast<int>(kind.size()), kind.data(),
              static_cast<unsigned>(e.request), static_cast<unsigned>(e.response),
              static_cast<unsigned>(e.length));
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace flem::obs
