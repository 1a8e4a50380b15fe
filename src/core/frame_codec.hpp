// src/core/frame_codec.hpp
// WebSocket frame codec (RFC 6455 client subset)
//
// Stateless functions shared by every transport:
//   - Frame building: TEXT, PONG, CLOSE (client frames are always masked)
//   - Frame parsing: one frame at a time (parse_frame_header) or a whole receive
//     buffer (decode_frames), never consuming a partially received frame
//   - Masking: in-place XOR with a 4-byte key (its own inverse)
//
// Frame layout:
//   Byte 0: [FIN:1][RSV:3][OPCODE:4]
//   Byte 1: [MASK:1][PAYLOAD_LEN:7]
//   If PAYLOAD_LEN == 126: Bytes 2-3 = 16-bit length
//   If PAYLOAD_LEN == 127: Bytes 2-9 = 64-bit length
//   If MASK == 1: 4 bytes masking key follows
//
// Known limits:
//   - 64-bit lengths are decoded from their low 32 bits; a non-zero high half
//     is rejected (payloads beyond 4 GiB are not supported)
//   - No fragmentation reassembly: CONTINUATION frames are returned as-is

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "random.hpp"

namespace tinyws {
namespace codec {

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Constants
// ═══════════════════════════════════════════════════════════════════════════

// Byte 0
constexpr uint8_t FIN_BIT = 0x80;
constexpr uint8_t RSV_BITS = 0x70;
constexpr uint8_t OPCODE_BITS = 0x0F;

// Byte 1
constexpr uint8_t MASK_BIT = 0x80;
constexpr uint8_t PAYLOAD_LEN_BITS = 0x7F;
constexpr uint8_t PAYLOAD_LEN_16BIT = 126;   // Extended 16-bit length follows
constexpr uint8_t PAYLOAD_LEN_64BIT = 127;   // Extended 64-bit length follows

// Size classes
constexpr size_t MAX_SMALL_PAYLOAD = 125;          // Fits the 7-bit length field
constexpr size_t EXTENDED_16BIT_LIMIT = 65536;     // First size needing 64-bit length
constexpr uint64_t MAX_DECODABLE_PAYLOAD = 0xFFFFFFFFull;

// Header sizes
constexpr size_t MASK_KEY_SIZE = 4;
constexpr size_t MIN_HEADER_SIZE = 2;      // opcode + len7
constexpr size_t HEADER_16BIT_SIZE = 4;    // 2 base + 2 ext len
constexpr size_t HEADER_64BIT_SIZE = 10;   // 2 base + 8 ext len
constexpr size_t MAX_HEADER_SIZE = 14;     // 2 base + 8 ext len + 4 mask

// Control frames
constexpr size_t MAX_CONTROL_PAYLOAD = 125;
constexpr size_t CLOSE_FRAME_SIZE = 6;     // Empty masked CLOSE

// Close status codes
constexpr uint16_t CLOSE_NORMAL = 1000;
constexpr uint16_t CLOSE_PROTOCOL_ERROR = 1002;
constexpr uint16_t CLOSE_NO_STATUS = 1005;
constexpr uint16_t CLOSE_ABNORMAL = 1006;
constexpr uint16_t CLOSE_MESSAGE_TOO_BIG = 1009;

// ═══════════════════════════════════════════════════════════════════════════
// Frame Structures
// ═══════════════════════════════════════════════════════════════════════════

enum class Opcode : uint8_t {
    CONTINUATION = 0x00,
    TEXT = 0x01,
    BINARY = 0x02,
    CLOSE = 0x08,
    PING = 0x09,
    PONG = 0x0A,
};

inline bool is_control_opcode(uint8_t opcode) {
    return (opcode & 0x08) != 0;
}

inline bool is_known_opcode(uint8_t opcode) {
    switch (static_cast<Opcode>(opcode)) {
        case Opcode::CONTINUATION:
        case Opcode::TEXT:
        case Opcode::BINARY:
        case Opcode::CLOSE:
        case Opcode::PING:
        case Opcode::PONG:
            return true;
    }
    return false;
}

inline const char* opcode_name(Opcode opcode) {
    switch (opcode) {
        case Opcode::CONTINUATION: return "CONTINUATION";
        case Opcode::TEXT:         return "TEXT";
        case Opcode::BINARY:       return "BINARY";
        case Opcode::CLOSE:        return "CLOSE";
        case Opcode::PING:         return "PING";
        case Opcode::PONG:         return "PONG";
    }
    return "RESERVED";
}

using MaskKey = std::array<uint8_t, MASK_KEY_SIZE>;

/**
 * Fresh masking key from the CSPRNG (one per outgoing frame)
 */
inline MaskKey generate_mask_key() {
    return secure_random_array<MASK_KEY_SIZE>();
}

/**
 * Decoded frame. Payload is owned and already unmasked.
 */
struct Frame {
    bool fin = true;
    Opcode opcode = Opcode::TEXT;
    bool masked = false;
    std::vector<uint8_t> payload;

    std::string text() const {
        return std::string(payload.begin(), payload.end());
    }
};

/**
 * Parsed frame header. Does NOT own or copy the payload.
 */
struct FrameHeader {
    bool fin = false;
    uint8_t opcode = 0;
    bool masked = false;
    uint64_t payload_len = 0;
    MaskKey mask_key{};
    size_t header_len = 0;     // 2-14 bytes

    uint64_t frame_len() const { return header_len + payload_len; }
};

enum class ParseStatus : uint8_t {
    Complete,     // Header and full payload are buffered
    Incomplete,   // Need more data, nothing may be consumed
    Invalid,      // Stream cannot be parsed past this point
};

// ═══════════════════════════════════════════════════════════════════════════
// Masking
// ═══════════════════════════════════════════════════════════════════════════

/**
 * XOR data in place with the cyclic 4-byte key. Applying twice restores
 * the input.
 */
inline void apply_mask(uint8_t* data, size_t len, const MaskKey& mask_key) {
    for (size_t i = 0; i < len; i++) {
        data[i] ^= mask_key[i & 3];
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame Builders
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Header size for a masked client frame carrying payload_len bytes
 */
inline size_t masked_header_size(size_t payload_len) {
    if (payload_len <= MAX_SMALL_PAYLOAD) {
        return MIN_HEADER_SIZE + MASK_KEY_SIZE;
    } else if (payload_len < EXTENDED_16BIT_LIMIT) {
        return HEADER_16BIT_SIZE + MASK_KEY_SIZE;
    }
    return HEADER_64BIT_SIZE + MASK_KEY_SIZE;
}

/**
 * Write FIN + opcode, masked length field and masking key
 *
 * @param out Output buffer (must be >= masked_header_size(payload_len))
 * @param opcode Frame opcode
 * @param payload_len Length of payload that will follow
 * @param mask_key 4-byte masking key
 * @return Header size (6, 8, or 14 bytes)
 */
inline size_t write_masked_header(uint8_t* out, Opcode opcode, size_t payload_len,
                                  const MaskKey& mask_key) {
    size_t header_len = 2;

    out[0] = FIN_BIT | (static_cast<uint8_t>(opcode) & OPCODE_BITS);

    if (payload_len <= MAX_SMALL_PAYLOAD) {
        out[1] = MASK_BIT | static_cast<uint8_t>(payload_len);
    } else if (payload_len < EXTENDED_16BIT_LIMIT) {
        out[1] = MASK_BIT | PAYLOAD_LEN_16BIT;
        out[2] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
        out[3] = static_cast<uint8_t>(payload_len & 0xFF);
        header_len = HEADER_16BIT_SIZE;
    } else {
        out[1] = MASK_BIT | PAYLOAD_LEN_64BIT;
        uint64_t len64 = static_cast<uint64_t>(payload_len);
        for (int i = 0; i < 8; i++) {
            out[2 + i] = static_cast<uint8_t>((len64 >> (56 - i * 8)) & 0xFF);
        }
        header_len = HEADER_64BIT_SIZE;
    }

    std::memcpy(out + header_len, mask_key.data(), MASK_KEY_SIZE);
    return header_len + MASK_KEY_SIZE;
}

/**
 * Build a complete, final, masked frame
 *
 * @param opcode Frame opcode
 * @param payload Unmasked payload (may be nullptr when payload_len == 0)
 * @param payload_len Payload length
 * @param mask_key 4-byte masking key
 * @return Wire bytes (header + masked payload)
 */
inline std::vector<uint8_t> encode_frame(Opcode opcode, const uint8_t* payload,
                                         size_t payload_len, const MaskKey& mask_key) {
    std::vector<uint8_t> frame(masked_header_size(payload_len) + payload_len);
    size_t header_len = write_masked_header(frame.data(), opcode, payload_len, mask_key);

    for (size_t i = 0; i < payload_len; i++) {
        frame[header_len + i] = payload[i] ^ mask_key[i & 3];
    }
    return frame;
}

/**
 * Build TEXT frame (FIN=1, masked)
 */
inline std::vector<uint8_t> encode_text_frame(std::string_view text, const MaskKey& mask_key) {
    return encode_frame(Opcode::TEXT, reinterpret_cast<const uint8_t*>(text.data()),
                        text.size(), mask_key);
}

inline std::vector<uint8_t> encode_text_frame(std::string_view text) {
    return encode_text_frame(text, generate_mask_key());
}

/**
 * Build PONG frame echoing a PING payload verbatim
 *
 * @throws std::invalid_argument if payload_len > 125 (control frame limit)
 */
inline std::vector<uint8_t> encode_pong_frame(const uint8_t* payload, size_t payload_len,
                                              const MaskKey& mask_key) {
    if (payload_len > MAX_CONTROL_PAYLOAD) {
        throw std::invalid_argument("PONG payload exceeds 125 bytes");
    }
    return encode_frame(Opcode::PONG, payload, payload_len, mask_key);
}

inline std::vector<uint8_t> encode_pong_frame(const uint8_t* payload, size_t payload_len) {
    return encode_pong_frame(payload, payload_len, generate_mask_key());
}

/**
 * Build the minimal CLOSE frame: FIN + CLOSE, masked, no status code (6 bytes)
 */
inline std::vector<uint8_t> encode_close_frame(const MaskKey& mask_key) {
    return encode_frame(Opcode::CLOSE, nullptr, 0, mask_key);
}

inline std::vector<uint8_t> encode_close_frame() {
    return encode_close_frame(generate_mask_key());
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame Parsing
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

inline uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline ParseStatus invalid(std::string* error, std::string message) {
    if (error) {
        *error = std::move(message);
    }
    return ParseStatus::Invalid;
}

} // namespace detail

/**
 * Parse one frame at the start of data
 *
 * Validates the header as soon as the relevant bytes are present, so a broken
 * stream is reported even before its payload arrives.
 *
 * @param data Receive buffer
 * @param len Buffered bytes
 * @param out Parsed header (valid when Complete)
 * @param max_payload Largest acceptable payload length
 * @param error Receives the reason when Invalid (optional)
 * @return Complete if header + payload are buffered, Incomplete if more data
 *         is needed, Invalid on a protocol violation
 */
inline ParseStatus parse_frame_header(const uint8_t* data, size_t len, FrameHeader& out,
                                      uint64_t max_payload = MAX_DECODABLE_PAYLOAD,
                                      std::string* error = nullptr) {
    if (len < MIN_HEADER_SIZE) {
        return ParseStatus::Incomplete;
    }

    uint8_t byte0 = data[0];
    uint8_t byte1 = data[1];
    out.fin = (byte0 & FIN_BIT) != 0;
    out.opcode = byte0 & OPCODE_BITS;
    out.masked = (byte1 & MASK_BIT) != 0;
    uint64_t payload_len = byte1 & PAYLOAD_LEN_BITS;

    if (byte0 & RSV_BITS) {
        return detail::invalid(error, "RSV bits set without a negotiated extension");
    }
    if (!is_known_opcode(out.opcode)) {
        return detail::invalid(error, "reserved opcode " + std::to_string(out.opcode));
    }
    if (is_control_opcode(out.opcode)) {
        if (!out.fin) {
            return detail::invalid(error, "fragmented control frame");
        }
        if (payload_len > MAX_CONTROL_PAYLOAD) {
            return detail::invalid(error, "control frame payload exceeds 125 bytes");
        }
    }

    size_t header_len = MIN_HEADER_SIZE;
    if (payload_len == PAYLOAD_LEN_16BIT) {
        if (len < HEADER_16BIT_SIZE) return ParseStatus::Incomplete;
        payload_len = (static_cast<uint64_t>(data[2]) << 8) | static_cast<uint64_t>(data[3]);
        header_len = HEADER_16BIT_SIZE;
    } else if (payload_len == PAYLOAD_LEN_64BIT) {
        if (len < HEADER_64BIT_SIZE) return ParseStatus::Incomplete;
        if (detail::read_be32(data + 2) != 0) {
            return detail::invalid(error, "64-bit payload length exceeds 4 GiB");
        }
        payload_len = detail::read_be32(data + 6);
        header_len = HEADER_64BIT_SIZE;
    }

    if (payload_len > max_payload) {
        return detail::invalid(error, "frame payload of " + std::to_string(payload_len) +
                                      " bytes exceeds limit of " + std::to_string(max_payload));
    }

    if (out.masked) {
        if (len < header_len + MASK_KEY_SIZE) return ParseStatus::Incomplete;
        std::memcpy(out.mask_key.data(), data + header_len, MASK_KEY_SIZE);
        header_len += MASK_KEY_SIZE;
    }

    out.payload_len = payload_len;
    out.header_len = header_len;

    if (len - header_len < payload_len) {
        return ParseStatus::Incomplete;
    }
    return ParseStatus::Complete;
}

/**
 * Result of one decode pass over a receive buffer
 */
struct DecodeResult {
    std::vector<Frame> frames;    // Complete frames in wire order
    size_t consumed = 0;          // Bytes covered by frames (drop from buffer front)
    bool close_received = false;  // Last frame is CLOSE, remaining bytes not examined
    bool protocol_error = false;  // Buffer is unparsable at offset `consumed`
    std::string error;            // Reason when protocol_error
};

/**
 * Decode every complete frame in data
 *
 * Stops at the first incomplete frame (its bytes are left for the next call),
 * right after a CLOSE frame, or at a protocol violation. Frames that precede
 * a violation are still returned.
 *
 * @param data Receive buffer
 * @param len Buffered bytes
 * @param max_payload Largest acceptable payload length per frame
 */
inline DecodeResult decode_frames(const uint8_t* data, size_t len,
                                  uint64_t max_payload = MAX_DECODABLE_PAYLOAD) {
    DecodeResult result;

    while (len - result.consumed >= MIN_HEADER_SIZE) {
        const uint8_t* p = data + result.consumed;
        size_t available = len - result.consumed;

        FrameHeader header;
        ParseStatus status = parse_frame_header(p, available, header, max_payload, &result.error);
        if (status == ParseStatus::Incomplete) {
            break;
        }
        if (status == ParseStatus::Invalid) {
            result.protocol_error = true;
            break;
        }

        size_t frame_len = static_cast<size_t>(header.frame_len());
        Frame frame;
        frame.fin = header.fin;
        frame.opcode = static_cast<Opcode>(header.opcode);
        frame.masked = header.masked;
        frame.payload.assign(p + header.header_len, p + frame_len);
        if (header.masked) {
            apply_mask(frame.payload.data(), frame.payload.size(), header.mask_key);
        }

        result.consumed += frame_len;
        bool is_close = frame.opcode == Opcode::CLOSE;
        result.frames.push_back(std::move(frame));

        if (is_close) {
            result.close_received = true;
            break;
        }
    }

    return result;
}

inline DecodeResult decode_frames(const std::vector<uint8_t>& buffer,
                                  uint64_t max_payload = MAX_DECODABLE_PAYLOAD) {
    return decode_frames(buffer.data(), buffer.size(), max_payload);
}

/**
 * Split a CLOSE payload into status code and reason
 *
 * @return {1005, ""} when the payload carries no status code
 */
inline std::pair<uint16_t, std::string> parse_close_payload(const Frame& frame) {
    // A lone byte cannot hold a code; it is read as "no status" rather than
    // failing a connection that is already closing
    if (frame.payload.size() < 2) {
        return {CLOSE_NO_STATUS, std::string()};
    }
    uint16_t code = static_cast<uint16_t>((frame.payload[0] << 8) | frame.payload[1]);
    return {code, std::string(frame.payload.begin() + 2, frame.payload.end())};
}

} // namespace codec
} // namespace tinyws
