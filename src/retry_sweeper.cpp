#include "meshwx/retry_sweeper.hpp"
#include "meshwx/clock.hpp"

namespace meshwx {

const char* to_string(RetryDecision::Action a) {
  return a == RetryDecision::Action::Resend ? "resend" : "give_up";
}

RetrySweeper::RetrySweeper(PendingMessageRegistry& registry, RetryPolicy policy, Logger& log)
: registry_(registry), policy_(policy), log_(log) {}

std::vector<RetryDecision> RetrySweeper::tick(uint64_t now_ms) {
  std::vector<RetryDecision> out;

  for (const auto& m : registry_.sweep_expired(now_ms, seconds_to_ms(policy_.ack_timeout_s))) {
    RetryDecision d;
    d.node_name   = m.node_name;
    d.message_id  = m.message_id;
    d.retry_count = m.retry_count;
    d.action      = m.retry_count < policy_.max_retries ? RetryDecision::Action::Resend
                                                        : RetryDecision::Action::GiveUp;
    log_.info("ack_timeout", {{"msg_id", d.message_id}, {"node", d.node_name},
                              {"retry", unsigned(d.retry_count)}, {"action", to_string(d.action)}});
    out.push_back(d);
  }

  const size_t purged = registry_.purge_retained(now_ms, seconds_to_ms(policy_.retention_s));
  if (purged) log_.debug("registry_purged", {{"count", purged}});
  return out;
}

} // namespace meshwx
