/**
 * @file retry_sweeper.hpp
 * @brief Once-per-tick timeout scan that decides resend vs give up.
 *
 * There is no timer thread. The host loop calls tick() every iteration; an
 * entry whose deadline passed is timed out on the first tick at or after
 * the deadline, so the worst-case lateness is one tick interval.
 */
#ifndef MESHWX_RETRY_SWEEPER_HPP
#define MESHWX_RETRY_SWEEPER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "meshwx/log.hpp"
#include "meshwx/pending_registry.hpp"

namespace meshwx {

struct RetryPolicy {
  uint32_t ack_timeout_s{60};
  uint8_t max_retries{1};     ///< resends per logical message
  uint32_t retention_s{600};  ///< terminal entries kept this long for status queries
};

struct RetryDecision {
  enum class Action : uint8_t { Resend, GiveUp };

  std::string node_name;
  uint32_t message_id{0};
  uint8_t retry_count{0};     ///< of the timed-out attempt
  Action action{Action::GiveUp};
};

const char* to_string(RetryDecision::Action a);

class RetrySweeper {
public:
  RetrySweeper(PendingMessageRegistry& registry, RetryPolicy policy, Logger& log);

  std::vector<RetryDecision> tick(uint64_t now_ms);

  const RetryPolicy& policy() const { return policy_; }

private:
  PendingMessageRegistry& registry_;
  const RetryPolicy policy_;
  Logger& log_;
};

} // namespace meshwx

#endif // MESHWX_RETRY_SWEEPER_HPP
