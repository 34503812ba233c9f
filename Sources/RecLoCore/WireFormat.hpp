#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace reclo {

// ===== Chunk transfer protocol =====
// Packet (244 bytes, multi-byte fields little-endian):
//   [0]       type
//   [1..4]    chunk_ts      u32
//   [5..6]    chunk_idx     u16
//   [7..8]    total_chunks  u16
//   [9..10]   seq           u16
//   [11..12]  total_seqs    u16
//   [13..14]  payload_len   u16
//   [15..243] payload
// HEADER payload (13 bytes): data_size u32 | codec_id u8 | sample_rate u32 | crc32 u32
// Control (central -> peripheral): 0x01 | 0x02 ts u32 | 0x03

static constexpr size_t kPacketSize        = 244;
static constexpr size_t kPacketHeaderSize  = 15;
static constexpr size_t kPayloadSize       = kPacketSize - kPacketHeaderSize;   // 229
static constexpr size_t kChunkMetaSize     = 13;
static constexpr size_t kAckCommandSize    = 5;

enum class PacketType : uint8_t {
    header = 0x01,
    data   = 0x02,
    done   = 0x03,
};

enum class ControlCommand : uint8_t {
    request_upload = 0x01,
    ack_chunk      = 0x02,
    abort          = 0x03,
};

using PacketBytes = std::array<uint8_t, kPacketSize>;

struct Packet {
    PacketType type         = PacketType::done;
    uint32_t   chunk_ts     = 0;
    uint16_t   chunk_idx    = 0;
    uint16_t   total_chunks = 0;
    uint16_t   seq          = 0;
    uint16_t   total_seqs   = 0;
    uint16_t   payload_len  = 0;
    std::array<uint8_t, kPayloadSize> payload{};
};

/// Metadata carried in a HEADER packet's payload.
struct ChunkMeta {
    uint32_t data_size   = 0;
    uint8_t  codec_id    = 0;
    uint32_t sample_rate = 0;
    uint32_t crc32       = 0;
};

/// A decoded control write.
struct ControlMessage {
    ControlCommand command   = ControlCommand::request_upload;
    uint32_t       timestamp = 0;   // ACK_CHUNK only
};

// ---- Little-endian helpers ----
inline void put_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void put_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ---- CRC-32/ISO-HDLC ----
/// Continue a CRC-32 over more bytes. Start with crc = 0.
uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len);

inline uint32_t crc32(const uint8_t* data, size_t len) {
    return crc32_update(0, data, len);
}

// ---- Packets ----
PacketBytes encode_packet(const Packet& pkt);

/// Decode a raw notification. Returns nullopt if the size is not exactly
/// kPacketSize, the type is unknown, or payload_len exceeds kPayloadSize.
std::optional<Packet> decode_packet(const uint8_t* data, size_t len);

std::array<uint8_t, kChunkMetaSize> encode_chunk_meta(const ChunkMeta& meta);
std::optional<ChunkMeta> decode_chunk_meta(const uint8_t* data, size_t len);

/// Number of DATA packets needed for a payload of data_size bytes.
inline uint16_t data_packet_count(uint32_t data_size) {
    return static_cast<uint16_t>((data_size + kPayloadSize - 1) / kPayloadSize);
}

// ---- Control commands ----
std::vector<uint8_t> encode_request_upload();
std::vector<uint8_t> encode_ack_chunk(uint32_t timestamp);
std::vector<uint8_t> encode_abort();

/// Returns nullopt for an empty write, an unknown command byte, or a
/// truncated ACK_CHUNK.
std::optional<ControlMessage> decode_control(const uint8_t* data, size_t len);

} // namespace reclo
