/**
 * @file transport.hpp
 * @brief IMeshTransport — what the delivery engine needs from a mesh radio.
 *
 * Contract:
 *  - send_text() hands one text packet to the local radio and returns the
 *    packet id the radio assigned. Delivery is NOT implied; it is reported
 *    later through the delivery listener. Throws TransportError if the radio
 *    refused or did not answer.
 *  - local_node_id() is the node number of the attached radio.
 *  - node_link() is the radio's last view of a peer (may be all-empty).
 *  - The delivery listener receives raw EVT_DELIVERY frames on the
 *    transport's own thread. It must not block.
 */
#ifndef MESHWX_TRANSPORT_TRANSPORT_HPP
#define MESHWX_TRANSPORT_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshwx {

enum class EncryptionMode : uint8_t { Channel = 0, Pki = 1 };

/// Link quality of a peer as last heard by the local radio.
struct NodeLink {
  std::optional<float> snr;
  std::optional<uint8_t> hops;
  std::optional<uint32_t> last_heard_s;  ///< epoch seconds
};

using DeliveryListener = std::function<void(const std::vector<uint8_t>& frame)>;

class IMeshTransport {
public:
  virtual ~IMeshTransport() = default;

  virtual uint32_t send_text(uint32_t node_id,
                             const std::string& payload,
                             uint8_t channel,
                             EncryptionMode mode) = 0;

  virtual uint32_t local_node_id() const = 0;

  virtual NodeLink node_link(uint32_t node_id) = 0;

  virtual void set_delivery_listener(DeliveryListener listener) = 0;

  /// Short identifier for logs ("serial:/dev/ttyACM0", "fake").
  virtual std::string name() const = 0;
};

} // namespace meshwx

#endif // MESHWX_TRANSPORT_TRANSPORT_HPP
