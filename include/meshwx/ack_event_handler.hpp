/**
 * @file ack_event_handler.hpp
 * @brief AckEventHandler — turns routing reports from the radio into registry outcomes.
 *
 * @details
 * ## Field Brief
 * A mesh radio tells the host about a packet twice. First its own radio
 * reports the packet left the queue: that report carries the *local* node
 * number as sender and proves nothing about delivery. Later, if the far end
 * acknowledges, a second report arrives from the *remote* node number with
 * the SNR it was heard at. Failures arrive as reports with an error name.
 *
 * The handler sorts these out:
 *
 * | Report                          | Outcome      | Side effects                      |
 * |---------------------------------|--------------|-----------------------------------|
 * | id not in the registry          | none         | `not_tracked` log, counter        |
 * | error code not empty / "NONE"   | Nak          | reason stored                     |
 * | from == local node              | ImplicitAck  | none                              |
 * | from == anyone else             | RealAck      | SNR sample, confirmation armed    |
 * | entry already has an outcome    | unchanged    | `duplicate` log, counter          |
 *
 * ---
 *
 * @par Threading
 * Called on the transport's reader thread, possibly many times per id and
 * concurrently with the host loop. It never throws: every error is logged
 * and counted here, because nothing upstream of a callback can handle it.
 */
#ifndef MESHWX_ACK_EVENT_HANDLER_HPP
#define MESHWX_ACK_EVENT_HANDLER_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "meshwx/clock.hpp"
#include "meshwx/confirmation_scheduler.hpp"
#include "meshwx/log.hpp"
#include "meshwx/pending_registry.hpp"
#include "meshwx/snr_stats.hpp"

namespace meshwx {

/// Diagnostic counters, read without locking.
struct AckCounters {
  uint64_t handled{0};
  uint64_t duplicates{0};
  uint64_t not_tracked{0};
  uint64_t malformed{0};
};

class AckEventHandler {
public:
  struct Options {
    uint32_t confirmation_delay_s{10};
    bool confirmations{true};
  };

  AckEventHandler(PendingMessageRegistry& registry,
                  SnrStatsStore& stats,
                  ConfirmationScheduler& confirmations,
                  Options options,
                  Logger& log,
                  ClockFn clock);

  /// Node number of the attached radio. Until set, no event counts as local.
  void set_local_node_id(uint32_t id) { local_node_id_.store(id); }
  uint32_t local_node_id() const { return local_node_id_.load(); }

  /// Apply one delivery report. Safe from any thread.
  void on_delivery_event(uint32_t request_id,
                         uint32_t from_node_id,
                         const std::string& error_code,
                         std::optional<float> snr);

  /// Decode an EVT_DELIVERY frame and apply it. Malformed frames are logged with a hex dump.
  void on_delivery_frame(const std::vector<uint8_t>& frame);

  AckCounters counters() const;

  /// True for "" and "NONE" (any case): the routing layer reported no error.
  static bool is_success_code(const std::string& error_code);

private:
  PendingMessageRegistry& registry_;
  SnrStatsStore& stats_;
  ConfirmationScheduler& confirmations_;
  const Options options_;
  Logger& log_;
  ClockFn clock_;

  std::atomic<uint32_t> local_node_id_{0};
  std::atomic<uint64_t> handled_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> not_tracked_{0};
  std::atomic<uint64_t> malformed_{0};
};

} // namespace meshwx

#endif // MESHWX_ACK_EVENT_HANDLER_HPP
