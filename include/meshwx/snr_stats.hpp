/**
 * @file snr_stats.hpp
 * @brief SnrStatsStore — per-node signal-quality history with JSON persistence.
 *
 * @details
 * ## Field Brief
 * Every real acknowledgment carries an SNR reading for the node that sent
 * it. Over days those readings show which links are healthy and which are
 * marginal. The store keeps running min/max/sum/count plus the last ten
 * samples per node. The host loop writes them to a JSON file once N new
 * samples are waiting (`flush_if_due()`) and on shutdown.
 *
 * ---
 *
 * @par Invariants
 * - `min_snr ≤ average() ≤ max_snr` whenever `count > 0`.
 * - `recent` holds at most `RECENT_CAPACITY` samples, oldest evicted first.
 * - Records are only ever cleared by `reset_all()` with both confirmations.
 *
 * @par Locks
 * Two mutexes: `mu_` covers the in-memory records and is held only while
 * accumulating or copying; `io_mu_` serializes file access and is taken
 * before `mu_`, so the file always holds the newest copied state.
 * `record_sample()` runs on the transport's callback thread and never does
 * file I/O; saving happens on whichever thread calls `flush()`.
 *
 * @par File Format
 * @code{.json}
 * { "version": 1,
 *   "nodes": { "yang": { "min_snr": 6.5, "max_snr": 9.25, "sum": 31.5,
 *                        "count": 4, "first_seen": 1760000000000,
 *                        "last_seen": 1760000300000,
 *                        "recent": [6.5, 7.0, 8.75, 9.25] } } }
 * @endcode
 * Values round-trip exactly: floats are widened to double on write and
 * narrowed back on read.
 */
#ifndef MESHWX_SNR_STATS_HPP
#define MESHWX_SNR_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "meshwx/log.hpp"

#include <nlohmann/json_fwd.hpp>

namespace meshwx {

struct SnrRecord {
  static constexpr size_t RECENT_CAPACITY = 10;

  float min_snr{0.0f};
  float max_snr{0.0f};
  double sum{0.0};
  uint32_t count{0};
  uint64_t first_seen_ms{0};
  uint64_t last_seen_ms{0};
  etl::deque<float, RECENT_CAPACITY> recent;

  /// Mean of all samples, clamped into [min_snr, max_snr]. Empty if count == 0.
  std::optional<float> average() const;

  /// `recent` as a vector, oldest first.
  std::vector<float> recent_samples() const;
};

/// Literal the operator must type to confirm a stats reset.
constexpr const char* RESET_PHRASE = "RESET";

/// Two independent confirmations for reset_all(): a yes, then the typed phrase.
struct ResetConfirmation {
  bool acknowledged{false};
  std::string typed_phrase;
};

class SnrStatsStore {
public:
  /**
   * @param path           Stats file. Empty disables persistence.
   * @param autosave_every flush_if_due() saves once this many new samples are
   *                       waiting (0 → only on flush()).
   */
  SnrStatsStore(std::string path, uint32_t autosave_every, Logger& log);

  SnrStatsStore(const SnrStatsStore&) = delete;
  SnrStatsStore& operator=(const SnrStatsStore&) = delete;

  /// Add one sample; creates the node's record on first use. Non-finite values
  /// are dropped. Memory only: never writes the file.
  void record_sample(const std::string& node, float snr, uint64_t observed_at_ms);

  std::optional<SnrRecord> snapshot(const std::string& node) const;

  /// Copy of every record, keyed by node name.
  std::map<std::string, SnrRecord> snapshot_all() const;

  /**
   * @brief Reinitialize every record to empty and flush.
   * @return false (nothing changed) unless `acknowledged` is set and
   *         `typed_phrase` equals RESET_PHRASE exactly.
   */
  bool reset_all(const ResetConfirmation& confirmation);

  /// Write the current state. False on failure (logged, memory unchanged).
  bool flush();

  /// True once `autosave_every` samples have arrived since the last save.
  bool save_due() const;

  /// flush() if save_due(); true when nothing needed saving.
  bool flush_if_due();

  /// Replace in-memory state from the file. Missing file → true, store unchanged.
  bool load();

  const std::string& path() const { return path_; }

private:
  nlohmann::json to_json_locked() const;
  bool write_document_locked(const nlohmann::json& doc);

  const std::string path_;
  const uint32_t autosave_every_;
  Logger& log_;

  mutable std::mutex mu_;
  std::map<std::string, SnrRecord> records_;
  uint32_t unsaved_{0};

  std::mutex io_mu_;
};

} // namespace meshwx

#endif // MESHWX_SNR_STATS_HPP
