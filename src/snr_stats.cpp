// -----------------------------------------------------------------------------
// snr_stats.cpp — SnrStatsStore accumulation and persistence
//
// Accumulate under mu_. Saving takes io_mu_ first, copies the document out
// under mu_, then writes with only io_mu_ held. Lock order: io_mu_ → mu_.
// record_sample() never touches the file; the host loop calls flush_if_due().
// -----------------------------------------------------------------------------
#include "meshwx/snr_stats.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/json_file.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace meshwx {

namespace {

constexpr int kFormatVersion = 1;

json record_to_json(const SnrRecord& r) {
  json j;
  j["min_snr"]    = r.min_snr;
  j["max_snr"]    = r.max_snr;
  j["sum"]        = r.sum;
  j["count"]      = r.count;
  j["first_seen"] = r.first_seen_ms;
  j["last_seen"]  = r.last_seen_ms;
  j["recent"]     = r.recent_samples();
  return j;
}

SnrRecord record_from_json(const std::string& node, const json& j) {
  SnrRecord r;
  r.min_snr       = j.at("min_snr").get<float>();
  r.max_snr       = j.at("max_snr").get<float>();
  r.sum           = j.at("sum").get<double>();
  r.count         = j.at("count").get<uint32_t>();
  r.first_seen_ms = j.at("first_seen").get<uint64_t>();
  r.last_seen_ms  = j.at("last_seen").get<uint64_t>();

  const auto samples = j.at("recent").get<std::vector<float>>();
  // Keep the newest RECENT_CAPACITY if a hand-edited file has more.
  const size_t skip = samples.size() > SnrRecord::RECENT_CAPACITY
                    ? samples.size() - SnrRecord::RECENT_CAPACITY : 0;
  for (size_t i = skip; i < samples.size(); ++i) r.recent.push_back(samples[i]);

  if (r.count > 0 && r.min_snr > r.max_snr) {
    throw PersistenceError("node '" + node + "': min_snr > max_snr");
  }
  return r;
}

} // namespace

// ---------- SnrRecord ----------

std::optional<float> SnrRecord::average() const {
  if (count == 0) return std::nullopt;
  const double avg = sum / static_cast<double>(count);
  // float rounding of min/max can leave the double mean a hair outside.
  return std::clamp(static_cast<float>(avg), min_snr, max_snr);
}

std::vector<float> SnrRecord::recent_samples() const {
  return std::vector<float>(recent.begin(), recent.end());
}

// ---------- SnrStatsStore ----------

SnrStatsStore::SnrStatsStore(std::string path, uint32_t autosave_every, Logger& log)
: path_(std::move(path)), autosave_every_(autosave_every), log_(log) {}

void SnrStatsStore::record_sample(const std::string& node, float snr, uint64_t observed_at_ms) {
  if (!std::isfinite(snr)) {
    log_.warn("snr_sample_dropped", {{"node", node}, {"reason", "non_finite"}});
    return;
  }

  uint32_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SnrRecord& r = records_[node];
    if (r.count == 0) {
      r.min_snr = snr;
      r.max_snr = snr;
      r.first_seen_ms = observed_at_ms;
    } else {
      r.min_snr = std::min(r.min_snr, snr);
      r.max_snr = std::max(r.max_snr, snr);
    }
    r.sum += snr;
    r.count += 1;
    r.last_seen_ms = std::max(r.last_seen_ms, observed_at_ms);

    if (r.recent.full()) r.recent.pop_front();
    r.recent.push_back(snr);

    count = r.count;
    ++unsaved_;
  }

  log_.debug("snr_sample", {{"node", node}, {"snr", snr}, {"count", count}});
}

bool SnrStatsStore::save_due() const {
  std::lock_guard<std::mutex> lock(mu_);
  return autosave_every_ > 0 && unsaved_ >= autosave_every_;
}

bool SnrStatsStore::flush_if_due() {
  if (!save_due()) return true;
  return flush();
}

std::optional<SnrRecord> SnrStatsStore::snapshot(const std::string& node) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(node);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, SnrRecord> SnrStatsStore::snapshot_all() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_;
}

bool SnrStatsStore::reset_all(const ResetConfirmation& confirmation) {
  if (!confirmation.acknowledged || confirmation.typed_phrase != RESET_PHRASE) {
    log_.warn("snr_reset_refused", {{"acknowledged", confirmation.acknowledged ? "yes" : "no"}});
    return false;
  }

  size_t cleared = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& kv : records_) kv.second = SnrRecord{};
    cleared = records_.size();
    unsaved_ = 1;  // force the empty state to disk
  }
  log_.info("snr_reset", {{"nodes", cleared}});
  flush();
  return true;
}

bool SnrStatsStore::flush() {
  if (path_.empty()) return true;

  std::lock_guard<std::mutex> io(io_mu_);
  json doc;
  {
    std::lock_guard<std::mutex> lock(mu_);
    doc = to_json_locked();
    unsaved_ = 0;
  }
  return write_document_locked(doc);
}

bool SnrStatsStore::load() {
  if (path_.empty()) return true;

  std::map<std::string, SnrRecord> loaded;
  try {
    json doc;
    {
      std::lock_guard<std::mutex> io(io_mu_);
      if (!read_json_file(path_, doc)) {
        log_.info("snr_stats_missing", {{"path", path_}});
        return true;
      }
    }
    if (!doc.is_object() || !doc.contains("nodes") || !doc["nodes"].is_object()) {
      throw PersistenceError("no 'nodes' object in " + path_);
    }
    for (const auto& item : doc["nodes"].items()) {
      loaded.emplace(item.key(), record_from_json(item.key(), item.value()));
    }
  } catch (const PersistenceError& e) {
    log_.error("snr_stats_load_failed", {{"path", path_}, {"reason", e.what()}});
    return false;
  } catch (const json::exception& e) {
    log_.error("snr_stats_load_failed", {{"path", path_}, {"reason", e.what()}});
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    records_ = std::move(loaded);
    unsaved_ = 0;
  }
  log_.info("snr_stats_loaded", {{"path", path_}});
  return true;
}

// ---------- private ----------

json SnrStatsStore::to_json_locked() const {
  json nodes = json::object();
  for (const auto& kv : records_) nodes[kv.first] = record_to_json(kv.second);

  json doc;
  doc["version"] = kFormatVersion;
  doc["nodes"]   = std::move(nodes);
  return doc;
}

bool SnrStatsStore::write_document_locked(const json& doc) {
  try {
    atomic_write_json(path_, doc);
  } catch (const PersistenceError& e) {
    log_.error("snr_stats_save_failed", {{"path", path_}, {"reason", e.what()}});
    return false;
  }
  log_.debug("snr_stats_saved", {{"path", path_}});
  return true;
}

} // namespace meshwx
