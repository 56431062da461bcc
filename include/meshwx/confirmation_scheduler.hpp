/**
 * @file confirmation_scheduler.hpp
 * @brief Deferred "Received ... SNR ..." replies after a real acknowledgment.
 *
 * The ack handler arms a confirmation on the callback thread; the host loop
 * drains due ones on its tick and sends them. Replies are best-effort: the
 * scheduler forgets an entry once it has been handed out.
 */
#ifndef MESHWX_CONFIRMATION_SCHEDULER_HPP
#define MESHWX_CONFIRMATION_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "meshwx/log.hpp"

namespace meshwx {

struct DueConfirmation {
  std::string node;
  uint32_t message_id{0};
  std::string payload;
};

class ConfirmationScheduler {
public:
  static constexpr size_t CAPACITY = 16;

  explicit ConfirmationScheduler(Logger& log);

  /**
   * @brief Arm one confirmation for a RealAck.
   * @return false if @p message_id is already armed or the queue is full
   *         (both logged; the confirmation is dropped).
   */
  bool schedule(const std::string& node,
                uint32_t message_id,
                uint64_t acked_at_ms,
                std::optional<float> snr,
                uint32_t delay_s);

  /// Remove and return every entry with `acked_at + delay ≤ now`, in due order.
  std::vector<DueConfirmation> poll_due(uint64_t now_ms);

  size_t pending() const;

  /// "Received 14:03:22 SNR 7.0 dB" (local time; "SNR n/a" without a reading).
  static std::string format_payload(uint64_t acked_at_ms, std::optional<float> snr);

private:
  struct Entry {
    std::string node;
    uint32_t message_id{0};
    uint64_t acked_at_ms{0};
    uint64_t due_ms{0};
    std::optional<float> snr;
  };

  Logger& log_;
  mutable std::mutex mu_;
  etl::deque<Entry, CAPACITY> queue_;
};

} // namespace meshwx

#endif // MESHWX_CONFIRMATION_SCHEDULER_HPP
