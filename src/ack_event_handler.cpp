// -----------------------------------------------------------------------------
// ack_event_handler.cpp — delivery report → registry outcome
//
// The registry decides whether an outcome applies; this file only chooses
// which outcome a report means and performs the side effects of a first
// RealAck. Nothing here throws past the public entry points.
// -----------------------------------------------------------------------------
#include "meshwx/ack_event_handler.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/node_directory.hpp"
#include "radio_frames.hpp"

#include <cctype>
#include <utility>

namespace meshwx {

AckEventHandler::AckEventHandler(PendingMessageRegistry& registry,
                                 SnrStatsStore& stats,
                                 ConfirmationScheduler& confirmations,
                                 Options options,
                                 Logger& log,
                                 ClockFn clock)
: registry_(registry),
  stats_(stats),
  confirmations_(confirmations),
  options_(options),
  log_(log),
  clock_(std::move(clock)) {}

bool AckEventHandler::is_success_code(const std::string& error_code) {
  if (error_code.empty()) return true;
  if (error_code.size() != 4) return false;
  std::string up;
  for (char c : error_code) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  return up == "NONE";
}

void AckEventHandler::on_delivery_event(uint32_t request_id,
                                        uint32_t from_node_id,
                                        const std::string& error_code,
                                        std::optional<float> snr) {
  const uint64_t now = clock_();
  const std::string from = format_node_id(from_node_id);

  auto not_tracked = [&]() {
    not_tracked_.fetch_add(1);
    log_.info("not_tracked", {{"msg_id", request_id}, {"from", from}, {"error", error_code.empty() ? "NONE" : error_code}});
    TraceRecord t;
    t.event      = "NOT_TRACKED";
    t.message_id = request_id;
    t.outcome    = "-";
    t.detail     = "from=" + from;
    log_.trace(t);
  };

  auto entry = registry_.find(request_id);
  if (!entry) {
    not_tracked();
    return;
  }

  DeliveryState outcome;
  std::optional<float> ack_snr;
  std::string reason;

  const uint32_t local = local_node_id_.load();
  if (!is_success_code(error_code)) {
    outcome = DeliveryState::Nak;
    reason  = error_code;
  } else if (local != 0 && from_node_id == local) {
    outcome = DeliveryState::ImplicitAck;
  } else {
    outcome = DeliveryState::RealAck;
    ack_snr = snr ? snr : entry->snr_at_send;
  }

  ResolveResult r;
  try {
    r = registry_.resolve(request_id, outcome, now, ack_snr, reason);
  } catch (const NotFoundError&) {
    // Taken by the host loop between find() and resolve().
    not_tracked();
    return;
  }

  handled_.fetch_add(1);

  if (!r.applied) {
    duplicates_.fetch_add(1);
    log_.debug("duplicate", {{"msg_id", request_id}, {"from", from},
                             {"event", to_string(outcome)}, {"state", to_string(r.entry.state)}});
    return;
  }

  log_.info("delivery_event", {{"msg_id", request_id}, {"node", r.entry.node_name}, {"from", from},
                               {"outcome", to_string(outcome)}, {"snr", ack_snr}});

  if (outcome != DeliveryState::RealAck) return;

  if (ack_snr) stats_.record_sample(r.entry.node_name, *ack_snr, now);

  if (options_.confirmations) {
    confirmations_.schedule(r.entry.node_name, request_id, now, ack_snr, options_.confirmation_delay_s);
  }
}

void AckEventHandler::on_delivery_frame(const std::vector<uint8_t>& frame) {
  radio::DeliveryEvent ev;
  try {
    ev = radio::parse_delivery_event(frame);
  } catch (const CallbackParseError& e) {
    malformed_.fetch_add(1);
    const std::string hex = radio::hex_dump(frame);
    log_.warn("malformed_delivery_frame", {{"reason", e.what()}, {"bytes", frame.size()}, {"hex", hex}});
    TraceRecord t;
    t.event   = "MALFORMED";
    t.outcome = "-";
    t.detail  = std::string(e.what()) + " frame=[" + hex + "]";
    log_.trace(t);
    return;
  }
  on_delivery_event(ev.packet_id, ev.from, ev.error, ev.snr);
}

AckCounters AckEventHandler::counters() const {
  AckCounters c;
  c.handled     = handled_.load();
  c.duplicates  = duplicates_.load();
  c.not_tracked = not_tracked_.load();
  c.malformed   = malformed_.load();
  return c;
}

} // namespace meshwx
