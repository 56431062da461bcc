// ============================================================================
// serial_radio.cpp — implementation for meshwx/transport/serial_radio.hpp
//
// Threads:
//   caller thread  → request(): write frame, wait on reply_cv_ for its seq
//   reader thread  → reader_loop(): read frames, hand replies to the waiter,
//                    hand EVT_DELIVERY frames to the listener
// ============================================================================
#include "meshwx/transport/serial_radio.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/node_directory.hpp"
#include "radio_frames.hpp"

#include <chrono>
#include <utility>

namespace meshwx {

// Reader poll slice; bounds how long close() waits for the thread.
static constexpr int kReadSliceMs = 200;

SerialRadio::SerialRadio(SerialRadioOptions options, Logger& log)
: options_(std::move(options)), log_(log) {}

SerialRadio::~SerialRadio() { close(); }

bool SerialRadio::open() {
  close();

  if (!port_.open(options_.device, options_.baud, options_.boot_delay_ms)) {
    log_.error("radio_open_failed", {{"device", options_.device}, {"reason", port_.last_error()}});
    return false;
  }

  running_.store(true);
  connected_.store(true);
  reader_ = std::thread(&SerialRadio::reader_loop, this);

  try {
    const auto reply = request("get_node_num", [](uint8_t seq) { return radio::make_get_node_num(seq); });
    uint32_t id = 0;
    if (!radio::parse_node_num(reply, id)) throw TransportError("reply without NODE_NUM");
    local_id_.store(id);
  } catch (const TransportError& e) {
    log_.error("radio_probe_failed", {{"device", options_.device}, {"reason", e.what()}});
    close();
    return false;
  }

  log_.info("radio_open", {{"device", options_.device}, {"baud", options_.baud},
                           {"local", format_node_id(local_id_.load())}});
  return true;
}

void SerialRadio::close() {
  running_.store(false);
  if (reader_.joinable()) reader_.join();
  port_.close();
  connected_.store(false);
  {
    std::lock_guard<std::mutex> lock(reply_mu_);
    waiting_seq_.reset();
    reply_.reset();
  }
  reply_cv_.notify_all();
}

uint32_t SerialRadio::send_text(uint32_t node_id, const std::string& payload,
                                uint8_t channel, EncryptionMode mode) {
  if (payload.size() > radio::MAX_TEXT_LEN) {
    throw TransportError("payload of " + std::to_string(payload.size()) + " bytes exceeds " +
                         std::to_string(radio::MAX_TEXT_LEN));
  }

  const auto reply = request("send_text", [&](uint8_t seq) {
    return radio::make_send_text(seq, node_id, channel, mode, payload);
  });

  uint32_t packet_id = 0;
  if (!radio::parse_packet_id(reply, packet_id)) {
    throw TransportError("send_text reply without PACKET_ID: " + radio::describe_frame(reply));
  }
  return packet_id;
}

NodeLink SerialRadio::node_link(uint32_t node_id) {
  const auto reply = request("get_node_info", [&](uint8_t seq) {
    return radio::make_get_node_info(seq, node_id);
  });
  return radio::parse_node_info(reply);
}

void SerialRadio::set_delivery_listener(DeliveryListener listener) {
  // Taking the lock also waits out a callback that is running right now.
  std::lock_guard<std::mutex> lock(listener_mu_);
  listener_ = std::move(listener);
}

// ---------- private ----------

template <typename Build>
std::vector<uint8_t> SerialRadio::request(const char* what, Build build) {
  std::lock_guard<std::mutex> one_at_a_time(request_mu_);
  if (!connected_.load()) throw TransportError(std::string(what) + ": radio not connected");

  uint8_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(reply_mu_);
    if (++next_seq_ == 0) next_seq_ = 1;   // seq 0 is reserved for events
    seq = next_seq_;
    waiting_seq_ = seq;
    reply_.reset();
  }

  if (!port_.write_frame(build(seq))) {
    std::lock_guard<std::mutex> lock(reply_mu_);
    waiting_seq_.reset();
    throw TransportError(std::string(what) + ": " + port_.last_error());
  }

  std::unique_lock<std::mutex> lock(reply_mu_);
  const bool got = reply_cv_.wait_for(lock, std::chrono::milliseconds(options_.timeout_ms),
                                      [this] { return reply_.has_value() || !running_.load() || !connected_.load(); });
  waiting_seq_.reset();
  if (!got || !reply_) throw TransportError(std::string(what) + ": no reply within " +
                                            std::to_string(options_.timeout_ms) + " ms");

  std::vector<uint8_t> frame = std::move(*reply_);
  reply_.reset();
  lock.unlock();

  if (radio::frame_verb(frame) == radio::RESP_ERR) {
    throw TransportError(std::string(what) + ": radio error " + radio::error_text(frame));
  }
  return frame;
}

void SerialRadio::reader_loop() {
  std::vector<uint8_t> frame;
  while (running_.load()) {
    if (!port_.read_frame(frame, kReadSliceMs)) {
      const std::string err = port_.last_error();
      if (err == "timeout") continue;
      log_.error("radio_lost", {{"device", options_.device}, {"reason", err}});
      connected_.store(false);
      reply_cv_.notify_all();
      return;
    }

    const uint8_t verb = radio::frame_verb(frame);
    if (verb == radio::EVT_DELIVERY) {
      dispatch_event(frame);
      continue;
    }

    if (verb == radio::RESP_OK || verb == radio::RESP_ERR) {
      std::lock_guard<std::mutex> lock(reply_mu_);
      if (waiting_seq_ && *waiting_seq_ == radio::frame_seq(frame)) {
        reply_ = frame;
        reply_cv_.notify_all();
        continue;
      }
    }
    log_.debug("radio_stray_frame", {{"frame", radio::describe_frame(frame)}});
  }
}

void SerialRadio::dispatch_event(const std::vector<uint8_t>& frame) {
  std::lock_guard<std::mutex> lock(listener_mu_);
  if (!listener_) {
    log_.debug("delivery_event_unheard", {{"frame", radio::describe_frame(frame)}});
    return;
  }
  listener_(frame);
}

} // namespace meshwx
