/**
 * @file delivery_engine.hpp
 * @brief DeliveryEngine — send, track, retry and confirm telemetry messages.
 *
 * @details
 * ## Field Brief
 * The engine is the one object the station loop talks to. It owns every
 * delivery component as a plain member, wires the transport's delivery
 * listener to the ack handler, and turns sweeper and scheduler output into
 * radio traffic on each tick.
 *
 * ```
 *  host loop ──send()──► transport ──────────────┐
 *      │                    │                     │ (reader thread)
 *      │                    ▼                     ▼
 *      │               registry ◄──resolve── AckEventHandler ──► SnrStatsStore
 *      │                    ▲                     │
 *      └──on_tick()──► RetrySweeper          ConfirmationScheduler
 *             └──────────────────────────────────┘ poll_due()
 * ```
 *
 * ---
 *
 * @par Lifecycle of one telemetry message
 * 1. `send()` transmits, registers the id in `Sent` and remembers the text.
 * 2. Reports arrive on the reader thread: `ImplicitAck`, then `RealAck` or `Nak`.
 * 3. `on_tick()`:
 *    - timed-out attempts are taken and resent (new id, `retry_count + 1`)
 *      until `max_retries` is spent, then reported as failed;
 *    - a `Nak` is taken and reported;
 *    - a due confirmation is sent, its entry marked `ConfirmationSent`
 *      and taken.
 * 4. Each taken entry becomes the node's `last_status()`. A timeout that is
 *    about to be resent is published as still `Sent`; only the last one
 *    reads as `TimedOut`.
 *
 * @par Transport failures
 * A `TransportError` from `send()` is rethrown to the caller after the
 * attempt is queued for the same retry path a timeout takes: it is
 * retried one ack-timeout later, within the same retry budget.
 *
 * @par Threading
 * `send()`, `on_tick()` and `shutdown()` belong to the host loop. The status
 * accessors may be called from anywhere.
 */
#ifndef MESHWX_DELIVERY_ENGINE_HPP
#define MESHWX_DELIVERY_ENGINE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "meshwx/ack_event_handler.hpp"
#include "meshwx/clock.hpp"
#include "meshwx/confirmation_scheduler.hpp"
#include "meshwx/delivery_types.hpp"
#include "meshwx/log.hpp"
#include "meshwx/node_directory.hpp"
#include "meshwx/pending_registry.hpp"
#include "meshwx/retry_sweeper.hpp"
#include "meshwx/snr_stats.hpp"
#include "meshwx/transport/transport.hpp"

namespace meshwx {

/// Resolved outcome of the latest attempt to a node.
struct DeliveryStatus {
  std::string node_name;
  uint32_t message_id{0};
  uint64_t sent_at_ms{0};
  std::optional<uint64_t> acked_at_ms;
  std::optional<float> snr;
  DeliveryState outcome{DeliveryState::Sent};
  uint8_t retry_count{0};
  std::optional<std::string> nak_reason;
};

struct EngineOptions {
  uint8_t channel{0};
  RetryPolicy retry;
  AckEventHandler::Options ack;
  std::string stats_file;
  uint32_t stats_autosave_every{10};
};

class DeliveryEngine {
public:
  DeliveryEngine(IMeshTransport& transport,
                 const NodeDirectory& nodes,
                 EngineOptions options,
                 Logger& log,
                 ClockFn clock = now_ms_system);

  /// Detaches from the transport so no callback outlives the engine.
  ~DeliveryEngine();

  DeliveryEngine(const DeliveryEngine&) = delete;
  DeliveryEngine& operator=(const DeliveryEngine&) = delete;

  /// Load stats and attach to the transport.
  void start();

  /// Re-learn the local node number and (re)install the delivery listener.
  /// Call again after the transport reconnects.
  void attach_transport();

  /**
   * @brief Transmit @p payload to the named node and start tracking it.
   * @return Transport-assigned message id.
   * @throws NotFoundError     unknown node name.
   * @throws TransportError    the radio refused; a retry is already queued.
   * @throws DuplicateIdError, RegistryFullError  the radio accepted the packet
   *         but it could not be tracked.
   */
  uint32_t send(const std::string& node, const std::string& payload, uint64_t now_ms);

  /// One host-loop iteration: timeouts, retries, confirmations, status refresh.
  void on_tick(uint64_t now_ms);

  /// Flush stats. Call once on the way out.
  void shutdown();

  std::optional<DeliveryStatus> last_status(const std::string& node) const;
  std::optional<DeliveryStatus> latest_status() const;

  /// Short marker for the last outcome to @p node: ACK, NAK, LOST, "..." or "--".
  std::string ack_indicator(const std::string& node) const;

  /// Attempts not yet resolved into a status, including queued retries.
  size_t in_flight() const { return outgoing_.size() + deferred_.size(); }

  PendingMessageRegistry& registry() { return registry_; }
  SnrStatsStore& stats() { return stats_; }
  ConfirmationScheduler& confirmations() { return confirmations_; }
  AckEventHandler& ack_handler() { return ack_handler_; }
  const NodeDirectory& nodes() const { return nodes_; }
  IMeshTransport& transport() { return transport_; }

private:
  struct Outgoing {
    std::string node;
    std::string payload;
    uint8_t retry_count{0};
  };

  struct DeferredRetry {
    Outgoing attempt;   ///< the attempt that failed to leave the radio
    uint64_t due_ms{0};
  };

  uint32_t transmit(const Outgoing& attempt, uint64_t now_ms);
  void retry_or_fail(const Outgoing& attempt, uint64_t now_ms);
  void handle_decision(const RetryDecision& d, uint64_t now_ms);
  void run_deferred(uint64_t now_ms);
  void run_confirmations(uint64_t now_ms);
  void refresh_outcomes();
  void publish(const PendingMessage& m);
  void publish_failure(const Outgoing& attempt, uint64_t now_ms, const std::string& reason);

  IMeshTransport& transport_;
  const NodeDirectory& nodes_;
  const EngineOptions options_;
  Logger& log_;
  ClockFn clock_;

  PendingMessageRegistry registry_;
  SnrStatsStore stats_;
  ConfirmationScheduler confirmations_;
  AckEventHandler ack_handler_;
  RetrySweeper sweeper_;

  // Host-loop only.
  std::map<uint32_t, Outgoing> outgoing_;
  std::vector<DeferredRetry> deferred_;

  mutable std::mutex status_mu_;
  std::map<std::string, DeliveryStatus> last_by_node_;
  std::optional<DeliveryStatus> latest_;
};

} // namespace meshwx

#endif // MESHWX_DELIVERY_ENGINE_HPP
