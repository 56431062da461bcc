// ============================================================================
// radio_frames.cpp — implementation for radio_frames.hpp
// For the frame layout see the header. For usage examples, check tests/.
// ============================================================================
#include "radio_frames.hpp"
#include "meshwx/errors.hpp"
#include "meshwx/node_directory.hpp"   // format_node_id()

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace meshwx {
namespace radio {

// ============================================================================
// Low-level helpers
// ============================================================================

// [verb][flags][seq][tlv_len], length backfilled by finalize().
static inline std::vector<uint8_t> header(uint8_t verb, uint8_t seq) {
    std::vector<uint8_t> b;
    b.reserve(64);
    b.push_back(verb);
    b.push_back(0);
    b.push_back(seq);
    b.push_back(0);
    return b;
}

static inline void add_tlv_bytes(std::vector<uint8_t>& b, uint8_t tag,
                                 const uint8_t* p, uint8_t len) {
    b.push_back(tag);
    b.push_back(len);
    if (len) b.insert(b.end(), p, p + len);
}

static inline void add_tlv_u8(std::vector<uint8_t>& b, uint8_t tag, uint8_t v) {
    add_tlv_bytes(b, tag, &v, 1);
}

static inline void add_tlv_i16(std::vector<uint8_t>& b, uint8_t tag, int16_t v) {
    const uint16_t u = static_cast<uint16_t>(v);
    uint8_t x[2] = { static_cast<uint8_t>(u & 0xFF), static_cast<uint8_t>(u >> 8) };
    add_tlv_bytes(b, tag, x, 2);
}

static inline void add_tlv_u32(std::vector<uint8_t>& b, uint8_t tag, uint32_t v) {
    uint8_t x[4] = { static_cast<uint8_t>(v & 0xFF),
                     static_cast<uint8_t>((v >> 8) & 0xFF),
                     static_cast<uint8_t>((v >> 16) & 0xFF),
                     static_cast<uint8_t>((v >> 24) & 0xFF) };
    add_tlv_bytes(b, tag, x, 4);
}

static inline void add_tlv_str(std::vector<uint8_t>& b, uint8_t tag, const std::string& s, size_t cap = 255) {
    const uint8_t L = static_cast<uint8_t>(std::min<size_t>(s.size(), std::min<size_t>(cap, 255)));
    add_tlv_bytes(b, tag, reinterpret_cast<const uint8_t*>(s.data()), L);
}

static inline void finalize(std::vector<uint8_t>& b) {
    b[3] = static_cast<uint8_t>(b.size() - HEADER_LEN);
}

static inline int16_t snr_to_q4(float snr) {
    const float q = std::round(snr * 4.0f);
    return static_cast<int16_t>(std::max(-32768.0f, std::min(32767.0f, q)));
}

// ============================================================================
// Request builders
// ============================================================================

std::vector<uint8_t> make_get_node_num(uint8_t seq) {
    auto b = header(GET_NODE_NUM, seq);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_send_text(uint8_t seq, uint32_t dest, uint8_t channel,
                                    EncryptionMode mode, const std::string& text) {
    auto b = header(SEND_TEXT, seq);
    add_tlv_u32(b, TAG_DEST, dest);
    add_tlv_u8 (b, TAG_CHANNEL, channel);
    add_tlv_u8 (b, TAG_ENCRYPTION, static_cast<uint8_t>(mode));
    add_tlv_str(b, TAG_TEXT, text, MAX_TEXT_LEN);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_get_node_info(uint8_t seq, uint32_t node) {
    auto b = header(GET_NODE_INFO, seq);
    add_tlv_u32(b, TAG_NODE_NUM, node);
    finalize(b);
    return b;
}

// ============================================================================
// Radio-side builders
// ============================================================================

std::vector<uint8_t> make_resp_ok(uint8_t seq, const std::vector<Tlv>& tlvs) {
    auto b = header(RESP_OK, seq);
    for (const auto& t : tlvs) add_tlv_str(b, t.tag, t.val);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_resp_err(uint8_t seq, const std::string& error) {
    auto b = header(RESP_ERR, seq);
    add_tlv_str(b, TAG_ERROR, error);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_delivery_event(const DeliveryEvent& ev) {
    auto b = header(EVT_DELIVERY, 0);
    add_tlv_u32(b, TAG_PACKET_ID, ev.packet_id);
    add_tlv_u32(b, TAG_FROM, ev.from);
    if (!ev.error.empty()) add_tlv_str(b, TAG_ERROR, ev.error);
    if (ev.snr) add_tlv_i16(b, TAG_SNR_Q4, snr_to_q4(*ev.snr));
    finalize(b);
    return b;
}

// ============================================================================
// Parsing
// ============================================================================

bool parse_tlvs(const std::vector<uint8_t>& f, std::vector<Tlv>& out) {
    out.clear();
    if (f.size() < HEADER_LEN) return false;

    const size_t tl = f[3];
    bool ok = (HEADER_LEN + tl == f.size());
    const size_t end = std::min(f.size(), HEADER_LEN + tl);
    size_t off = HEADER_LEN;

    while (off + 2 <= end) {
        const uint8_t tag = f[off++];
        const uint8_t len = f[off++];
        if (off + len > end) return false;   // value runs past the section
        out.push_back({ tag, std::string(reinterpret_cast<const char*>(f.data() + off), len) });
        off += len;
    }
    if (off != end) ok = false;              // dangling tag byte
    return ok;
}

const Tlv* find_tlv(const std::vector<Tlv>& tlvs, uint8_t tag) {
    for (const auto& t : tlvs) {
        if (t.tag == tag) return &t;
    }
    return nullptr;
}

bool as_u8(const std::string& s, uint8_t& out) {
    if (s.size() != 1) return false;
    out = static_cast<uint8_t>(s[0]);
    return true;
}

bool as_i16(const std::string& s, int16_t& out) {
    if (s.size() != 2) return false;
    const uint16_t u = static_cast<uint16_t>(
        static_cast<uint16_t>(static_cast<uint8_t>(s[0])) |
       (static_cast<uint16_t>(static_cast<uint8_t>(s[1])) << 8));
    out = static_cast<int16_t>(u);
    return true;
}

bool as_u32(const std::string& s, uint32_t& out) {
    if (s.size() != 4) return false;
    out =  static_cast<uint32_t>(static_cast<uint8_t>(s[0])) |
          (static_cast<uint32_t>(static_cast<uint8_t>(s[1])) << 8) |
          (static_cast<uint32_t>(static_cast<uint8_t>(s[2])) << 16) |
          (static_cast<uint32_t>(static_cast<uint8_t>(s[3])) << 24);
    return true;
}

DeliveryEvent parse_delivery_event(const std::vector<uint8_t>& f) {
    if (frame_verb(f) != EVT_DELIVERY) {
        throw CallbackParseError("not a delivery event (verb " + std::to_string(frame_verb(f)) + ")");
    }
    std::vector<Tlv> tlvs;
    if (!parse_tlvs(f, tlvs)) throw CallbackParseError("truncated TLV section");

    DeliveryEvent ev;
    const Tlv* id = find_tlv(tlvs, TAG_PACKET_ID);
    if (!id || !as_u32(id->val, ev.packet_id)) throw CallbackParseError("missing or bad PACKET_ID");

    const Tlv* from = find_tlv(tlvs, TAG_FROM);
    if (!from || !as_u32(from->val, ev.from)) throw CallbackParseError("missing or bad FROM");

    if (const Tlv* err = find_tlv(tlvs, TAG_ERROR)) ev.error = err->val;

    if (const Tlv* snr = find_tlv(tlvs, TAG_SNR_Q4)) {
        int16_t q = 0;
        if (!as_i16(snr->val, q)) throw CallbackParseError("bad SNR_Q4 length");
        ev.snr = static_cast<float>(q) / 4.0f;
    }
    return ev;
}

bool parse_node_num(const std::vector<uint8_t>& f, uint32_t& out) {
    if (frame_verb(f) != RESP_OK) return false;
    std::vector<Tlv> tlvs;
    if (!parse_tlvs(f, tlvs)) return false;
    const Tlv* t = find_tlv(tlvs, TAG_NODE_NUM);
    return t && as_u32(t->val, out);
}

bool parse_packet_id(const std::vector<uint8_t>& f, uint32_t& out) {
    if (frame_verb(f) != RESP_OK) return false;
    std::vector<Tlv> tlvs;
    if (!parse_tlvs(f, tlvs)) return false;
    const Tlv* t = find_tlv(tlvs, TAG_PACKET_ID);
    return t && as_u32(t->val, out);
}

NodeLink parse_node_info(const std::vector<uint8_t>& f) {
    NodeLink link;
    if (frame_verb(f) != RESP_OK) return link;
    std::vector<Tlv> tlvs;
    // A truncated section still yields whatever parsed before the cut.
    if (!parse_tlvs(f, tlvs) && tlvs.empty()) return link;

    int16_t q = 0;
    uint8_t hops = 0;
    uint32_t heard = 0;
    if (const Tlv* t = find_tlv(tlvs, TAG_SNR_Q4); t && as_i16(t->val, q)) link.snr = static_cast<float>(q) / 4.0f;
    if (const Tlv* t = find_tlv(tlvs, TAG_HOPS); t && as_u8(t->val, hops)) link.hops = hops;
    if (const Tlv* t = find_tlv(tlvs, TAG_LAST_HEARD); t && as_u32(t->val, heard)) link.last_heard_s = heard;
    return link;
}

std::string error_text(const std::vector<uint8_t>& f) {
    std::vector<Tlv> tlvs;
    if (!parse_tlvs(f, tlvs) && tlvs.empty()) return "unknown";
    const Tlv* t = find_tlv(tlvs, TAG_ERROR);
    return (t && !t->val.empty()) ? t->val : std::string("unknown");
}

// ============================================================================
// describe_frame()
// ---------------------------------------------------------------------------
// Lossy one-liner for logs and --scan output. Unknown tags fall back to hex.
// ============================================================================

std::string describe_frame(const std::vector<uint8_t>& f) {
    std::ostringstream os;
    if (f.size() < HEADER_LEN) {
        os << "status=error reason=bad_frame";
        return os.str();
    }

    const uint8_t verb = f[0];
    if (verb == RESP_OK)            os << "status=ok seq=" << unsigned(f[2]);
    else if (verb == RESP_ERR)      os << "status=error seq=" << unsigned(f[2]);
    else if (verb == EVT_DELIVERY)  os << "event=delivery";
    else                            os << "verb=0x" << std::hex << unsigned(verb) << std::dec << " seq=" << unsigned(f[2]);

    std::vector<Tlv> tlvs;
    const bool complete = parse_tlvs(f, tlvs);

    for (const auto& t : tlvs) {
        switch (t.tag) {
            case TAG_NODE_NUM: { uint32_t v; if (as_u32(t.val, v)) os << " node_num=" << format_node_id(v); break; }
            case TAG_SNR_Q4: {
                int16_t v;
                if (as_i16(t.val, v)) os << " snr_db=" << std::fixed << std::setprecision(2) << (v / 4.0);
                break;
            }
            case TAG_HOPS:       { uint8_t v;  if (as_u8(t.val, v))  os << " hops=" << unsigned(v); break; }
            case TAG_LAST_HEARD: { uint32_t v; if (as_u32(t.val, v)) os << " last_heard=" << v; break; }
            case TAG_DEST:       { uint32_t v; if (as_u32(t.val, v)) os << " dest=" << format_node_id(v); break; }
            case TAG_CHANNEL:    { uint8_t v;  if (as_u8(t.val, v))  os << " channel=" << unsigned(v); break; }
            case TAG_ENCRYPTION: { uint8_t v;  if (as_u8(t.val, v))  os << " encryption=" << (v ? "pki" : "channel"); break; }
            case TAG_TEXT:       os << " text_len=" << t.val.size(); break;
            case TAG_PACKET_ID:  { uint32_t v; if (as_u32(t.val, v)) os << " packet_id=" << v; break; }
            case TAG_FROM:       { uint32_t v; if (as_u32(t.val, v)) os << " from=" << format_node_id(v); break; }
            case TAG_ERROR:      os << " error=" << (t.val.empty() ? "NONE" : t.val); break;
            default: {
                os << " tag" << unsigned(t.tag) << "=0x";
                std::ios_base::fmtflags f0 = os.flags();
                char fill0 = os.fill();
                for (unsigned char c : t.val) os << std::hex << std::setw(2) << std::setfill('0') << unsigned(c);
                os.flags(f0);
                os.fill(fill0);
                break;
            }
        }
    }
    if (!complete) os << " truncated=1";
    return os.str();
}

std::string hex_dump(const std::vector<uint8_t>& bytes) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i) os << ' ';
        os << std::setw(2) << unsigned(bytes[i]);
    }
    return os.str();
}

} // namespace radio
} // namespace meshwx
