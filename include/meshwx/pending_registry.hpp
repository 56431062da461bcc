/**
 * @file pending_registry.hpp
 * @brief PendingMessageRegistry — the thread-safe table of in-flight messages.
 *
 * @details
 * ## Field Brief
 * A mesh radio answers "did it arrive?" late, sometimes twice, sometimes
 * never. The registry is where each transmission waits for that answer. It
 * is touched from two places at once: the host loop (register, sweep, take)
 * and the transport's callback thread (resolve). Every public call is one
 * critical section on one mutex, so a check-and-transition can never be
 * split by the other thread.
 *
 * ---
 *
 * @par Guarantees
 * - **One entry per live id.** `register_message()` refuses a live id.
 * - **One outcome per entry.** `resolve()` and `sweep_expired()` only move
 *   entries out of `Sent`/`ImplicitAck`. If an ack event and the sweeper race
 *   for the same id, exactly one wins; the loser gets `applied == false`.
 * - **Read-once consumption.** `take()` removes the entry; a second take of
 *   the same id returns nothing.
 * - **Bounded memory.** Fixed capacity (`CAPACITY`). Terminal entries older
 *   than the retention period are purged by `purge_retained()`.
 *
 * ---
 *
 * @par Logging
 * Each transition produces one trace record (REGISTER, RESOLVE, DUPLICATE,
 * TIMEOUT, CONFIRMED, TAKE, PURGE). Records are collected inside the critical
 * section and written after the lock is released; the lock never covers I/O.
 *
 * @par Minimal Usage Example
 * @code
 * meshwx::Logger log;
 * meshwx::PendingMessageRegistry reg(log);
 * reg.register_message(1, "yang", now_ms, 9.5f);
 * auto r = reg.resolve(1, meshwx::DeliveryState::RealAck, now_ms + 2000, 7.0f, "");
 * if (r.applied) { ... first outcome ... }
 * auto done = reg.take(1);
 * @endcode
 */
#ifndef MESHWX_PENDING_REGISTRY_HPP
#define MESHWX_PENDING_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "meshwx/delivery_types.hpp"
#include "meshwx/log.hpp"

namespace meshwx {

class PendingMessageRegistry {
public:
  /// Maximum live entries. A station sends one message per node per interval,
  /// so this covers a dozen nodes with a retry each and room to spare.
  static constexpr size_t CAPACITY = 32;

  explicit PendingMessageRegistry(Logger& log);

  /**
   * @brief Track a freshly sent message in state `Sent`.
   *
   * @param message_id  Transport-assigned id.
   * @param node_name   Logical destination name (NodeDirectory key).
   * @param sent_at_ms  Epoch ms of the send.
   * @param snr_at_send Last known SNR of the destination, if any.
   * @param retry_count 0 for the first attempt, +1 per resend.
   *
   * @throws DuplicateIdError  if @p message_id is already live.
   * @throws RegistryFullError if no slot is free and none can be reclaimed.
   */
  void register_message(uint32_t message_id,
                        const std::string& node_name,
                        uint64_t sent_at_ms,
                        std::optional<float> snr_at_send = std::nullopt,
                        uint8_t retry_count = 0);

  /**
   * @brief Apply a delivery outcome if the entry still accepts it.
   *
   * Accepted transitions: `Sent → {ImplicitAck, RealAck, Nak, TimedOut}` and
   * `ImplicitAck → {RealAck, Nak, TimedOut}`. Anything else leaves the entry
   * unchanged and returns `applied == false`.
   *
   * @param outcome  One of ImplicitAck, RealAck, Nak, TimedOut.
   * @param at_ms    Event time; stored as `acked_at_ms` for acks.
   * @param snr      Stored as `ack_snr` for RealAck.
   * @param reason   Stored as `nak_reason` for Nak.
   *
   * @throws NotFoundError          if the id is not live.
   * @throws std::invalid_argument  if @p outcome is Sent or ConfirmationSent.
   */
  ResolveResult resolve(uint32_t message_id,
                        DeliveryState outcome,
                        uint64_t at_ms,
                        std::optional<float> snr = std::nullopt,
                        const std::string& reason = std::string());

  /**
   * @brief Time out every pending entry whose deadline has passed.
   * @return The entries moved to `TimedOut` by this call, oldest first.
   */
  std::vector<PendingMessage> sweep_expired(uint64_t now_ms, uint64_t timeout_ms);

  /// Remove and return an entry. Empty if the id is not live.
  std::optional<PendingMessage> take(uint32_t message_id);

  /// Copy of an entry without removing it.
  std::optional<PendingMessage> find(uint32_t message_id) const;

  /// `RealAck → ConfirmationSent`. False if absent or not in RealAck.
  bool mark_confirmation_sent(uint32_t message_id);

  /// Drop terminal entries sent more than @p retention_ms ago. Returns the count.
  size_t purge_retained(uint64_t now_ms, uint64_t retention_ms);

  size_t size() const;

private:
  using Table = etl::vector<PendingMessage, CAPACITY>;

  // Linear scans; the table is small. Callers hold mu_.
  Table::iterator       find_locked(uint32_t message_id);
  Table::const_iterator find_locked(uint32_t message_id) const;

  static bool accepts(DeliveryState current, DeliveryState outcome);
  static TraceRecord make_trace(const char* event, const PendingMessage& m, const std::string& detail = std::string());

  void emit(const std::vector<TraceRecord>& records);

  Logger& log_;
  mutable std::mutex mu_;
  Table entries_;
};

} // namespace meshwx

#endif // MESHWX_PENDING_REGISTRY_HPP
