// -----------------------------------------------------------------------------
// delivery_engine.cpp — host-loop side of the delivery pipeline
//
// on_tick() order matters:
//   1) sweeper decisions   (timeouts → resend / give up)
//   2) deferred retries    (attempts the radio refused earlier)
//   3) due confirmations   (RealAck → reply → ConfirmationSent → take)
//   4) outcome refresh     (Nak, RealAck without confirmations)
//   5) stats autosave      (file I/O stays off the reader thread)
// -----------------------------------------------------------------------------
#include "meshwx/delivery_engine.hpp"
#include "meshwx/errors.hpp"

#include <utility>

namespace meshwx {

DeliveryEngine::DeliveryEngine(IMeshTransport& transport,
                               const NodeDirectory& nodes,
                               EngineOptions options,
                               Logger& log,
                               ClockFn clock)
: transport_(transport),
  nodes_(nodes),
  options_(std::move(options)),
  log_(log),
  clock_(std::move(clock)),
  registry_(log),
  stats_(options_.stats_file, options_.stats_autosave_every, log),
  confirmations_(log),
  ack_handler_(registry_, stats_, confirmations_, options_.ack, log, clock_),
  sweeper_(registry_, options_.retry, log) {}

DeliveryEngine::~DeliveryEngine() {
  transport_.set_delivery_listener(nullptr);
}

void DeliveryEngine::start() {
  stats_.load();
  attach_transport();
}

void DeliveryEngine::attach_transport() {
  const uint32_t local = transport_.local_node_id();
  ack_handler_.set_local_node_id(local);
  transport_.set_delivery_listener([this](const std::vector<uint8_t>& frame) {
    ack_handler_.on_delivery_frame(frame);
  });

  log_.info("engine_attached", {{"transport", transport_.name()}, {"local", format_node_id(local)},
                               {"nodes", nodes_.size()}, {"ack_timeout_s", options_.retry.ack_timeout_s},
                               {"max_retries", unsigned(options_.retry.max_retries)}});
}

uint32_t DeliveryEngine::send(const std::string& node, const std::string& payload, uint64_t now_ms) {
  Outgoing attempt;
  attempt.node = nodes_.resolve(node).name;
  attempt.payload = payload;
  return transmit(attempt, now_ms);
}

void DeliveryEngine::on_tick(uint64_t now_ms) {
  for (const auto& d : sweeper_.tick(now_ms)) handle_decision(d, now_ms);
  run_deferred(now_ms);
  run_confirmations(now_ms);
  refresh_outcomes();
  stats_.flush_if_due();
}

void DeliveryEngine::shutdown() {
  transport_.set_delivery_listener(nullptr);
  const bool saved = stats_.flush();
  log_.info("engine_stopped", {{"in_flight", outgoing_.size()}, {"stats_saved", saved ? "yes" : "no"}});
}

std::optional<DeliveryStatus> DeliveryEngine::last_status(const std::string& node) const {
  std::lock_guard<std::mutex> lock(status_mu_);
  auto it = last_by_node_.find(node);
  if (it == last_by_node_.end()) return std::nullopt;
  return it->second;
}

std::optional<DeliveryStatus> DeliveryEngine::latest_status() const {
  std::lock_guard<std::mutex> lock(status_mu_);
  return latest_;
}

std::string DeliveryEngine::ack_indicator(const std::string& node) const {
  const auto s = last_status(node);
  if (!s) return "--";
  switch (s->outcome) {
    case DeliveryState::RealAck:
    case DeliveryState::ConfirmationSent: return "ACK";
    case DeliveryState::Nak:              return "NAK";
    case DeliveryState::TimedOut:         return "LOST";
    default:                              return "...";
  }
}

// ---------- private ----------

uint32_t DeliveryEngine::transmit(const Outgoing& attempt, uint64_t now_ms) {
  const Node& node = nodes_.resolve(attempt.node);

  std::optional<float> snr_at_send;
  try {
    snr_at_send = transport_.node_link(node.id).snr;
  } catch (const TransportError& e) {
    log_.debug("node_link_unavailable", {{"node", node.name}, {"reason", e.what()}});
  }

  const EncryptionMode mode = node.public_key ? EncryptionMode::Pki : EncryptionMode::Channel;

  uint32_t id = 0;
  try {
    id = transport_.send_text(node.id, attempt.payload, options_.channel, mode);
  } catch (const TransportError& e) {
    log_.warn("send_failed", {{"node", node.name}, {"retry", unsigned(attempt.retry_count)}, {"reason", e.what()}});
    retry_or_fail(attempt, now_ms);
    throw;
  }

  try {
    registry_.register_message(id, node.name, now_ms, snr_at_send, attempt.retry_count);
  } catch (const Error& e) {
    log_.error("send_untracked", {{"msg_id", id}, {"node", node.name}, {"reason", e.what()}});
    throw;
  }
  outgoing_[id] = attempt;

  log_.info("sent", {{"msg_id", id}, {"node", node.name}, {"retry", unsigned(attempt.retry_count)},
                     {"encryption", mode == EncryptionMode::Pki ? "pki" : "channel"},
                     {"snr", snr_at_send}, {"bytes", attempt.payload.size()}});
  return id;
}

void DeliveryEngine::retry_or_fail(const Outgoing& attempt, uint64_t now_ms) {
  if (attempt.retry_count < options_.retry.max_retries) {
    deferred_.push_back(DeferredRetry{attempt, now_ms + seconds_to_ms(options_.retry.ack_timeout_s)});
    return;
  }
  publish_failure(attempt, now_ms, "transport");
}

void DeliveryEngine::handle_decision(const RetryDecision& d, uint64_t now_ms) {
  auto entry = registry_.take(d.message_id);
  if (entry) {
    // A timed-out attempt with a resend coming reads as still in flight.
    if (d.action == RetryDecision::Action::Resend) entry->state = DeliveryState::Sent;
    publish(*entry);
  }

  auto it = outgoing_.find(d.message_id);
  if (it == outgoing_.end()) {
    log_.warn("retry_without_payload", {{"msg_id", d.message_id}, {"node", d.node_name}});
    return;
  }
  Outgoing next = it->second;
  outgoing_.erase(it);

  if (d.action == RetryDecision::Action::GiveUp) {
    log_.warn("delivery_failed", {{"msg_id", d.message_id}, {"node", d.node_name},
                                  {"reason", "timeout"}, {"attempts", unsigned(d.retry_count) + 1}});
    return;
  }

  next.retry_count = static_cast<uint8_t>(d.retry_count + 1);
  try {
    transmit(next, now_ms);
  } catch (const TransportError&) {
    // transmit() already queued the retry or reported the failure.
  } catch (const Error& e) {
    log_.error("resend_failed", {{"node", next.node}, {"reason", e.what()}});
  }
}

void DeliveryEngine::run_deferred(uint64_t now_ms) {
  if (deferred_.empty()) return;

  std::vector<DeferredRetry> due;
  for (auto it = deferred_.begin(); it != deferred_.end();) {
    if (it->due_ms <= now_ms) {
      due.push_back(std::move(*it));
      it = deferred_.erase(it);
    } else {
      ++it;
    }
  }

  for (auto& d : due) {
    Outgoing next = d.attempt;
    next.retry_count = static_cast<uint8_t>(d.attempt.retry_count + 1);
    try {
      transmit(next, now_ms);
    } catch (const TransportError&) {
      // Queued again or reported by transmit().
    } catch (const Error& e) {
      log_.error("resend_failed", {{"node", next.node}, {"reason", e.what()}});
    }
  }
}

void DeliveryEngine::run_confirmations(uint64_t now_ms) {
  for (const auto& c : confirmations_.poll_due(now_ms)) {
    bool sent = false;
    try {
      const Node& node = nodes_.resolve(c.node);
      const EncryptionMode mode = node.public_key ? EncryptionMode::Pki : EncryptionMode::Channel;
      const uint32_t reply_id = transport_.send_text(node.id, c.payload, options_.channel, mode);
      sent = true;
      log_.info("confirmation_sent", {{"msg_id", c.message_id}, {"node", c.node}, {"reply_id", reply_id},
                                      {"text", c.payload}});
    } catch (const Error& e) {
      log_.warn("confirmation_failed", {{"msg_id", c.message_id}, {"node", c.node}, {"reason", e.what()}});
    }

    if (sent) registry_.mark_confirmation_sent(c.message_id);
    if (auto m = registry_.take(c.message_id)) publish(*m);
    outgoing_.erase(c.message_id);
  }
}

void DeliveryEngine::refresh_outcomes() {
  for (auto it = outgoing_.begin(); it != outgoing_.end();) {
    const auto m = registry_.find(it->first);
    if (!m) {
      it = outgoing_.erase(it);   // purged after retention
      continue;
    }

    bool done = false;
    switch (m->state) {
      case DeliveryState::Nak:
        log_.warn("delivery_failed", {{"msg_id", m->message_id}, {"node", m->node_name},
                                      {"reason", m->nak_reason.value_or("")}});
        done = true;
        break;
      case DeliveryState::RealAck:
        publish(*m);
        done = !options_.ack.confirmations;
        break;
      case DeliveryState::ConfirmationSent:
        done = true;
        break;
      default:
        break;
    }

    if (done) {
      if (auto taken = registry_.take(it->first)) publish(*taken);
      it = outgoing_.erase(it);
    } else {
      ++it;
    }
  }
}

void DeliveryEngine::publish(const PendingMessage& m) {
  DeliveryStatus s;
  s.node_name   = m.node_name;
  s.message_id  = m.message_id;
  s.sent_at_ms  = m.sent_at_ms;
  s.acked_at_ms = m.acked_at_ms;
  s.snr         = m.ack_snr;
  s.outcome     = m.state;
  s.retry_count = m.retry_count;
  s.nak_reason  = m.nak_reason;

  std::lock_guard<std::mutex> lock(status_mu_);
  auto it = last_by_node_.find(s.node_name);
  if (it == last_by_node_.end()) {
    last_by_node_.emplace(s.node_name, s);
  } else if (s.sent_at_ms >= it->second.sent_at_ms) {
    it->second = s;
  }
  if (!latest_ || s.sent_at_ms >= latest_->sent_at_ms) latest_ = s;
}

void DeliveryEngine::publish_failure(const Outgoing& attempt, uint64_t now_ms, const std::string& reason) {
  PendingMessage m;
  m.node_name   = attempt.node;
  m.sent_at_ms  = now_ms;
  m.state       = DeliveryState::Nak;
  m.retry_count = attempt.retry_count;
  m.nak_reason  = reason;
  log_.warn("delivery_failed", {{"node", attempt.node}, {"reason", reason},
                                {"attempts", unsigned(attempt.retry_count) + 1}});
  publish(m);
}

} // namespace meshwx
