// -----------------------------------------------------------------------------
// pending_registry.cpp — Implementation of PendingMessageRegistry
//
// API & guarantees: see include/meshwx/pending_registry.hpp
// Usage tests:      see tests/test_pending_registry.cpp
//
// Every public method follows the same shape:
//   lock → check → transition → collect trace records → unlock → emit traces
// The lock is never held while writing to a log sink.
// -----------------------------------------------------------------------------
#include "meshwx/pending_registry.hpp"
#include "meshwx/errors.hpp"

#include <stdexcept>

namespace meshwx {

const char* to_string(DeliveryState s) {
  switch (s) {
    case DeliveryState::Sent:             return "SENT";
    case DeliveryState::ImplicitAck:      return "IMPLICIT_ACK";
    case DeliveryState::RealAck:          return "REAL_ACK";
    case DeliveryState::Nak:              return "NAK";
    case DeliveryState::TimedOut:         return "TIMED_OUT";
    case DeliveryState::ConfirmationSent: return "CONFIRMATION_SENT";
  }
  return "UNKNOWN";
}

PendingMessageRegistry::PendingMessageRegistry(Logger& log)
: log_(log) {}

// ---------- public ----------

void PendingMessageRegistry::register_message(uint32_t message_id,
                                              const std::string& node_name,
                                              uint64_t sent_at_ms,
                                              std::optional<float> snr_at_send,
                                              uint8_t retry_count) {
  std::vector<TraceRecord> traces;
  {
    std::lock_guard<std::mutex> lock(mu_);

    if (find_locked(message_id) != entries_.end()) {
      throw DuplicateIdError(message_id);
    }

    // POLICY: when full, reclaim the oldest entry that already has an outcome.
    // Live (Sent/ImplicitAck) entries are never evicted to make room.
    if (entries_.full()) {
      auto victim = entries_.end();
      for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (!is_terminal(it->state)) continue;
        if (victim == entries_.end() || it->sent_at_ms < victim->sent_at_ms) victim = it;
      }
      if (victim == entries_.end()) {
        throw RegistryFullError("pending table full (" + std::to_string(CAPACITY) + " live entries)");
      }
      traces.push_back(make_trace("EVICT", *victim));
      entries_.erase(victim);
    }

    PendingMessage m;
    m.message_id  = message_id;
    m.node_name   = node_name;
    m.sent_at_ms  = sent_at_ms;
    m.snr_at_send = snr_at_send;
    m.retry_count = retry_count;
    entries_.push_back(m);

    traces.push_back(make_trace("REGISTER", m, "retry=" + std::to_string(retry_count)));
  }
  emit(traces);
}

ResolveResult PendingMessageRegistry::resolve(uint32_t message_id,
                                              DeliveryState outcome,
                                              uint64_t at_ms,
                                              std::optional<float> snr,
                                              const std::string& reason) {
  if (outcome == DeliveryState::Sent || outcome == DeliveryState::ConfirmationSent) {
    throw std::invalid_argument(std::string("resolve() cannot target ") + to_string(outcome));
  }

  ResolveResult result;
  TraceRecord trace;
  {
    std::lock_guard<std::mutex> lock(mu_);

    auto it = find_locked(message_id);
    if (it == entries_.end()) {
      throw NotFoundError("message id " + std::to_string(message_id) + " not tracked");
    }

    if (!accepts(it->state, outcome)) {
      // Duplicate or late event: report the entry as it stands.
      result.entry   = *it;
      result.applied = false;
      trace = make_trace("DUPLICATE", *it, std::string("ignored=") + to_string(outcome));
    } else {
      it->state = outcome;
      switch (outcome) {
        case DeliveryState::ImplicitAck:
          it->acked_at_ms = at_ms;
          break;
        case DeliveryState::RealAck:
          it->acked_at_ms = at_ms;
          it->ack_snr     = snr;
          break;
        case DeliveryState::Nak:
          it->nak_reason = reason;
          break;
        default:
          break;
      }
      result.entry   = *it;
      result.applied = true;
      trace = make_trace("RESOLVE", *it, reason);
    }
  }
  log_.trace(trace);
  return result;
}

std::vector<PendingMessage> PendingMessageRegistry::sweep_expired(uint64_t now_ms, uint64_t timeout_ms) {
  std::vector<PendingMessage> expired;
  std::vector<TraceRecord> traces;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& m : entries_) {
      if (m.state != DeliveryState::Sent && m.state != DeliveryState::ImplicitAck) continue;
      if (now_ms < m.sent_at_ms || now_ms - m.sent_at_ms < timeout_ms) continue;

      m.state = DeliveryState::TimedOut;
      expired.push_back(m);
      traces.push_back(make_trace("TIMEOUT", m, "age_ms=" + std::to_string(now_ms - m.sent_at_ms)));
    }
  }
  emit(traces);
  return expired;
}

std::optional<PendingMessage> PendingMessageRegistry::take(uint32_t message_id) {
  std::optional<PendingMessage> out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = find_locked(message_id);
    if (it == entries_.end()) return std::nullopt;
    out = *it;
    entries_.erase(it);
  }
  log_.trace(make_trace("TAKE", *out));
  return out;
}

std::optional<PendingMessage> PendingMessageRegistry::find(uint32_t message_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = find_locked(message_id);
  if (it == entries_.end()) return std::nullopt;
  return *it;
}

bool PendingMessageRegistry::mark_confirmation_sent(uint32_t message_id) {
  TraceRecord trace;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = find_locked(message_id);
    if (it == entries_.end() || it->state != DeliveryState::RealAck) return false;
    it->state = DeliveryState::ConfirmationSent;
    trace = make_trace("CONFIRMED", *it);
  }
  log_.trace(trace);
  return true;
}

size_t PendingMessageRegistry::purge_retained(uint64_t now_ms, uint64_t retention_ms) {
  std::vector<TraceRecord> traces;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      const bool old = now_ms >= it->sent_at_ms && now_ms - it->sent_at_ms >= retention_ms;
      if (is_terminal(it->state) && old) {
        traces.push_back(make_trace("PURGE", *it));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  emit(traces);
  return traces.size();
}

size_t PendingMessageRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

// ---------- private ----------

PendingMessageRegistry::Table::iterator PendingMessageRegistry::find_locked(uint32_t message_id) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->message_id == message_id) return it;
  }
  return entries_.end();
}

PendingMessageRegistry::Table::const_iterator PendingMessageRegistry::find_locked(uint32_t message_id) const {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->message_id == message_id) return it;
  }
  return entries_.end();
}

bool PendingMessageRegistry::accepts(DeliveryState current, DeliveryState outcome) {
  if (current == DeliveryState::Sent) return true;  // any outcome (resolve() filtered the rest)
  if (current == DeliveryState::ImplicitAck) return outcome != DeliveryState::ImplicitAck;
  return false;                                     // terminal: never re-resolved
}

TraceRecord PendingMessageRegistry::make_trace(const char* event, const PendingMessage& m, const std::string& detail) {
  TraceRecord t;
  t.event       = event;
  t.message_id  = m.message_id;
  t.node        = m.node_name;
  t.sent_at_ms  = m.sent_at_ms;
  t.acked_at_ms = m.acked_at_ms;
  t.outcome     = to_string(m.state);
  t.detail      = detail;
  return t;
}

void PendingMessageRegistry::emit(const std::vector<TraceRecord>& records) {
  for (const auto& r : records) log_.trace(r);
}

} // namespace meshwx
