#include "meshwx/confirmation_scheduler.hpp"
#include "meshwx/clock.hpp"

#include <cstdio>

namespace meshwx {

ConfirmationScheduler::ConfirmationScheduler(Logger& log)
: log_(log) {}

bool ConfirmationScheduler::schedule(const std::string& node,
                                     uint32_t message_id,
                                     uint64_t acked_at_ms,
                                     std::optional<float> snr,
                                     uint32_t delay_s) {
  const char* refused = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : queue_) {
      if (e.message_id == message_id) { refused = "already_armed"; break; }
    }
    if (!refused && queue_.full()) refused = "queue_full";

    if (!refused) {
      Entry e;
      e.node        = node;
      e.message_id  = message_id;
      e.acked_at_ms = acked_at_ms;
      e.due_ms      = acked_at_ms + seconds_to_ms(delay_s);
      e.snr         = snr;

      // Keep the queue ordered by due time; delays are uniform so this is
      // nearly always an append.
      auto pos = queue_.end();
      while (pos != queue_.begin()) {
        auto prev = pos; --prev;
        if (prev->due_ms <= e.due_ms) break;
        pos = prev;
      }
      queue_.insert(pos, e);
    }
  }

  if (refused) {
    log_.warn("confirmation_dropped", {{"msg_id", message_id}, {"node", node}, {"reason", refused}});
    return false;
  }
  log_.debug("confirmation_armed", {{"msg_id", message_id}, {"node", node}, {"delay_s", delay_s}});
  return true;
}

std::vector<DueConfirmation> ConfirmationScheduler::poll_due(uint64_t now_ms) {
  std::vector<DueConfirmation> due;
  std::lock_guard<std::mutex> lock(mu_);
  while (!queue_.empty() && queue_.front().due_ms <= now_ms) {
    const Entry& e = queue_.front();
    due.push_back(DueConfirmation{e.node, e.message_id, format_payload(e.acked_at_ms, e.snr)});
    queue_.pop_front();
  }
  return due;
}

size_t ConfirmationScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

std::string ConfirmationScheduler::format_payload(uint64_t acked_at_ms, std::optional<float> snr) {
  std::string out = "Received " + format_local_time(acked_at_ms, "%H:%M:%S");
  if (snr) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), " SNR %.1f dB", static_cast<double>(*snr));
    out += buf;
  } else {
    out += " SNR n/a";
  }
  return out;
}

} // namespace meshwx
