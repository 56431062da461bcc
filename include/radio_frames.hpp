#pragma once
/**
 * @file radio_frames.hpp
 * @brief Request builders, response parsing and delivery-event decoding for the radio bridge.
 *
 * @details
 * PURPOSE
 * -------
 * The radio bridge is a small firmware shim on the USB-attached mesh radio.
 * The host talks to it with compact binary frames; this file is the only
 * place that knows their layout. Everything above it (the serial transport,
 * discovery, the ack handler) deals in node numbers, packet ids and SNR
 * floats, never in bytes.
 *
 * FRAME LAYOUT
 * ------------
 *   [verb][flags][seq][tlv_len][TLV...]
 *
 *   - verb     one byte, see "Verbs"
 *   - flags    reserved, 0
 *   - seq      host-chosen request number, echoed in the matching response;
 *              0 on unsolicited events
 *   - tlv_len  byte count of the TLV section
 *   - TLV      [tag][len][value...], integers little endian
 *
 * SLIP framing (slip.hpp) wraps each frame on the wire.
 *
 * EXAMPLE FLOW
 * ------------
 *   Host:   make_send_text(7, 0x0a1b2c3d, 0, EncryptionMode::Channel, "hi")
 *   Radio:  RESP_OK seq=7 TLV(PACKET_ID=1234)
 *   ...later, unsolicited...
 *   Radio:  EVT_DELIVERY seq=0 TLV(PACKET_ID=1234, FROM=0x0a1b2c3d, SNR_Q4=28)
 *   Host:   parse_delivery_event() → {1234, 0x0a1b2c3d, "", 7.0}
 *
 * MAINTENANCE
 * -----------
 * - Tags are part of the wire contract with the bridge firmware. Add, never renumber.
 * - describe_frame() output is grepped by scripts; keep keys stable.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "meshwx/transport/transport.hpp"

namespace meshwx {
namespace radio {

// =============================== Verbs ===============================
enum : uint8_t {
    GET_NODE_NUM  = 0x01,  /**< Local radio node number. Reply carries TAG_NODE_NUM. */
    SEND_TEXT     = 0x20,  /**< Queue a text packet: DEST, CHANNEL, ENCRYPTION, TEXT. Reply carries PACKET_ID. */
    GET_NODE_INFO = 0x21,  /**< Peer link view: request carries NODE_NUM; reply SNR_Q4/HOPS/LAST_HEARD (each optional). */

    RESP_OK       = 0x90,
    RESP_ERR      = 0x91,  /**< Reply may carry TAG_ERROR. */
    EVT_DELIVERY  = 0xA0   /**< Unsolicited routing report: PACKET_ID, FROM, ERROR?, SNR_Q4?. */
};

// ============================== TLV Tags =============================
enum : uint8_t {
    TAG_NODE_NUM   = 0x01, /**< u32 */
    TAG_SNR_Q4     = 0x31, /**< i16: SNR in quarter dB (28 → 7.0 dB) */
    TAG_HOPS       = 0x32, /**< u8  */
    TAG_LAST_HEARD = 0x33, /**< u32: epoch seconds */
    TAG_DEST       = 0x40, /**< u32 */
    TAG_CHANNEL    = 0x41, /**< u8  */
    TAG_ENCRYPTION = 0x42, /**< u8 : 0 channel key, 1 PKI */
    TAG_TEXT       = 0x43, /**< str */
    TAG_PACKET_ID  = 0x44, /**< u32 */
    TAG_FROM       = 0x45, /**< u32 */
    TAG_ERROR      = 0x46  /**< str: routing error name, "NONE" or empty on success */
};

constexpr size_t HEADER_LEN = 4;

/// Longest text the bridge accepts in one SEND_TEXT.
constexpr size_t MAX_TEXT_LEN = 228;

/// A parsed TLV. The value may hold arbitrary bytes, including '\0'.
struct Tlv {
    uint8_t tag;
    std::string val;
};

/// One decoded EVT_DELIVERY frame.
struct DeliveryEvent {
    uint32_t packet_id{0};
    uint32_t from{0};
    std::string error;          ///< empty or "NONE" means delivered
    std::optional<float> snr;
};

// ========================= Request builders =========================
std::vector<uint8_t> make_get_node_num(uint8_t seq);

/**
 * @brief SEND_TEXT request.
 * @param text Clamped to MAX_TEXT_LEN bytes; callers that care check first.
 */
std::vector<uint8_t> make_send_text(uint8_t seq, uint32_t dest, uint8_t channel,
                                    EncryptionMode mode, const std::string& text);

std::vector<uint8_t> make_get_node_info(uint8_t seq, uint32_t node);

// ================= Radio-side builders (bridge emulation, tests) =================
std::vector<uint8_t> make_resp_ok(uint8_t seq, const std::vector<Tlv>& tlvs = {});
std::vector<uint8_t> make_resp_err(uint8_t seq, const std::string& error);
std::vector<uint8_t> make_delivery_event(const DeliveryEvent& ev);

// =============================== Parsing ===============================
/**
 * @brief Split the TLV section of @p frame.
 * @return false if the header is short, tlv_len disagrees with the frame
 *         size, or a TLV runs past the end. @p out then holds the TLVs that
 *         did parse.
 */
bool parse_tlvs(const std::vector<uint8_t>& frame, std::vector<Tlv>& out);

/// First TLV with @p tag, or nullptr.
const Tlv* find_tlv(const std::vector<Tlv>& tlvs, uint8_t tag);

bool as_u8 (const std::string& s, uint8_t& out);
bool as_i16(const std::string& s, int16_t& out);
bool as_u32(const std::string& s, uint32_t& out);

inline uint8_t frame_verb(const std::vector<uint8_t>& f) { return f.empty() ? 0 : f[0]; }
inline uint8_t frame_seq (const std::vector<uint8_t>& f) { return f.size() < 3 ? 0 : f[2]; }

/**
 * @brief Decode an EVT_DELIVERY frame.
 * @throws CallbackParseError on wrong verb, bad TLV section, or a missing or
 *         mis-sized PACKET_ID / FROM.
 */
DeliveryEvent parse_delivery_event(const std::vector<uint8_t>& frame);

/// NODE_NUM from a GET_NODE_NUM reply. False if absent or the reply is RESP_ERR.
bool parse_node_num(const std::vector<uint8_t>& frame, uint32_t& out);

/// PACKET_ID from a SEND_TEXT reply.
bool parse_packet_id(const std::vector<uint8_t>& frame, uint32_t& out);

/// Link view from a GET_NODE_INFO reply; absent tags stay empty.
NodeLink parse_node_info(const std::vector<uint8_t>& frame);

/// TAG_ERROR text of a RESP_ERR (or "unknown").
std::string error_text(const std::vector<uint8_t>& frame);

/**
 * @brief One-line `key=value` summary of any frame.
 *
 *   "status=ok seq=7 packet_id=1234"
 *   "event=delivery packet_id=1234 from=!0a1b2c3d snr_db=7.00"
 *   "status=error reason=bad_frame"
 */
std::string describe_frame(const std::vector<uint8_t>& frame);

/// "c0 01 ff" style dump for diagnostics.
std::string hex_dump(const std::vector<uint8_t>& bytes);

} // namespace radio
} // namespace meshwx
