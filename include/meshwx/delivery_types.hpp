/**
 * @file delivery_types.hpp
 * @brief Value types shared by the registry, the ack handler and the engine.
 *
 * @details
 * A `PendingMessage` is the registry's record of one transmission attempt.
 * The transport assigns its id; a retry is a new attempt with a new id and
 * `retry_count + 1`, so one logical telemetry message may span several
 * entries over its life.
 *
 * State machine (initial state `Sent`):
 * ```
 *   Sent ──► ImplicitAck ──► RealAck ──► ConfirmationSent
 *     │           │     └──► Nak
 *     │           └────────► TimedOut
 *     ├──► RealAck / Nak / TimedOut
 * ```
 * `RealAck`, `Nak` and `TimedOut` are the delivery outcomes. Once one of them
 * is reached the entry is never resolved again; only the bookkeeping step
 * `RealAck → ConfirmationSent` may follow.
 */
#ifndef MESHWX_DELIVERY_TYPES_HPP
#define MESHWX_DELIVERY_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace meshwx {

enum class DeliveryState : uint8_t {
  Sent = 0,          ///< handed to the radio, nothing heard yet
  ImplicitAck,       ///< our own radio accepted it (local enqueue only)
  RealAck,           ///< a remote node confirmed receipt
  Nak,               ///< the mesh reported a delivery failure
  TimedOut,          ///< no outcome within the ack timeout
  ConfirmationSent   ///< RealAck whose confirmation reply went out
};

/// Uppercase state name used in logs, traces and the status surface.
const char* to_string(DeliveryState s);

/// True for states that no later event may change.
inline bool is_terminal(DeliveryState s) {
  return s == DeliveryState::RealAck || s == DeliveryState::Nak ||
         s == DeliveryState::TimedOut || s == DeliveryState::ConfirmationSent;
}

/// One in-flight transmission attempt.
struct PendingMessage {
  uint32_t message_id{0};
  std::string node_name;
  uint64_t sent_at_ms{0};
  std::optional<float> snr_at_send;
  DeliveryState state{DeliveryState::Sent};
  std::optional<uint64_t> acked_at_ms;
  std::optional<float> ack_snr;
  std::optional<std::string> nak_reason;
  uint8_t retry_count{0};
};

/**
 * @brief Outcome of PendingMessageRegistry::resolve().
 *
 * `applied == false` is the "already resolved" signal: the entry was in a
 * state that does not accept @p outcome, and it is returned unchanged.
 */
struct ResolveResult {
  PendingMessage entry;
  bool applied{false};
};

} // namespace meshwx

#endif // MESHWX_DELIVERY_TYPES_HPP
