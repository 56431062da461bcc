/**
 * @file serial_radio.hpp
 * @brief IMeshTransport over a USB serial radio bridge.
 *
 * One reader thread owns the receive side of the port. It routes each
 * incoming frame either to the request waiting for that sequence number or,
 * for EVT_DELIVERY, to the delivery listener. Requests are serialized: one
 * outstanding request at a time, matched by seq, bounded by `timeout_ms`.
 *
 * Linux-only (termios).
 */
#ifndef MESHWX_TRANSPORT_SERIAL_RADIO_HPP
#define MESHWX_TRANSPORT_SERIAL_RADIO_HPP

#if !defined(__linux__)
#  error "serial_radio.hpp is Linux-only."
#endif

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "meshwx/log.hpp"
#include "meshwx/transport/transport.hpp"
#include "serial_io.hpp"

namespace meshwx {

struct SerialRadioOptions {
  std::string device;
  int baud{115200};
  int timeout_ms{1500};
  int boot_delay_ms{400};
};

class SerialRadio : public IMeshTransport {
public:
  SerialRadio(SerialRadioOptions options, Logger& log);
  ~SerialRadio() override;

  SerialRadio(const SerialRadio&) = delete;
  SerialRadio& operator=(const SerialRadio&) = delete;

  /// Open the port, start the reader, learn the local node number. False on any failure (logged).
  bool open();
  void close();

  /// False once the reader has seen the device disappear.
  bool connected() const { return connected_.load(); }

  uint32_t send_text(uint32_t node_id, const std::string& payload,
                     uint8_t channel, EncryptionMode mode) override;
  uint32_t local_node_id() const override { return local_id_.load(); }
  NodeLink node_link(uint32_t node_id) override;
  void set_delivery_listener(DeliveryListener listener) override;
  std::string name() const override { return "serial:" + options_.device; }

private:
  /// Send one request and wait for its response. Throws TransportError on timeout or RESP_ERR.
  template <typename Build>
  std::vector<uint8_t> request(const char* what, Build build);

  void reader_loop();
  void dispatch_event(const std::vector<uint8_t>& frame);

  const SerialRadioOptions options_;
  Logger& log_;
  SerialPort port_;

  std::thread reader_;
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  std::atomic<uint32_t> local_id_{0};

  std::mutex request_mu_;                  // one outstanding request
  std::mutex reply_mu_;
  std::condition_variable reply_cv_;
  uint8_t next_seq_{0};
  std::optional<uint8_t> waiting_seq_;
  std::optional<std::vector<uint8_t>> reply_;

  std::mutex listener_mu_;
  DeliveryListener listener_;
};

} // namespace meshwx

#endif // MESHWX_TRANSPORT_SERIAL_RADIO_HPP
