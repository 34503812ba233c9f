#include "WireFormat.hpp"

#include <algorithm>
#include <cstring>

namespace reclo {

// ---------------------------------------------------------------------------
// CRC-32 (reflected, poly 0xEDB88320, init/xorout 0xFFFFFFFF)
// ---------------------------------------------------------------------------

namespace {

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int b = 0; b < 8; ++b) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

} // namespace

uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len) {
    static const std::array<uint32_t, 256> table = make_crc_table();

    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

// ---------------------------------------------------------------------------
// Packets
// ---------------------------------------------------------------------------

PacketBytes encode_packet(const Packet& pkt) {
    PacketBytes out{};
    out[0] = static_cast<uint8_t>(pkt.type);
    put_u32(&out[1],  pkt.chunk_ts);
    put_u16(&out[5],  pkt.chunk_idx);
    put_u16(&out[7],  pkt.total_chunks);
    put_u16(&out[9],  pkt.seq);
    put_u16(&out[11], pkt.total_seqs);

    uint16_t len = std::min<uint16_t>(pkt.payload_len, static_cast<uint16_t>(kPayloadSize));
    put_u16(&out[13], len);
    std::memcpy(&out[kPacketHeaderSize], pkt.payload.data(), len);
    return out;
}

std::optional<Packet> decode_packet(const uint8_t* data, size_t len) {
    if (!data || len != kPacketSize) return std::nullopt;

    Packet pkt;
    switch (data[0]) {
        case 0x01: pkt.type = PacketType::header; break;
        case 0x02: pkt.type = PacketType::data;   break;
        case 0x03: pkt.type = PacketType::done;   break;
        default:   return std::nullopt;
    }

    pkt.chunk_ts     = get_u32(&data[1]);
    pkt.chunk_idx    = get_u16(&data[5]);
    pkt.total_chunks = get_u16(&data[7]);
    pkt.seq          = get_u16(&data[9]);
    pkt.total_seqs   = get_u16(&data[11]);
    pkt.payload_len  = get_u16(&data[13]);
    if (pkt.payload_len > kPayloadSize) return std::nullopt;

    std::memcpy(pkt.payload.data(), &data[kPacketHeaderSize], kPayloadSize);
    return pkt;
}

std::array<uint8_t, kChunkMetaSize> encode_chunk_meta(const ChunkMeta& meta) {
    std::array<uint8_t, kChunkMetaSize> out{};
    put_u32(&out[0], meta.data_size);
    out[4] = meta.codec_id;
    put_u32(&out[5], meta.sample_rate);
    put_u32(&out[9], meta.crc32);
    return out;
}

std::optional<ChunkMeta> decode_chunk_meta(const uint8_t* data, size_t len) {
    if (!data || len < kChunkMetaSize) return std::nullopt;

    ChunkMeta meta;
    meta.data_size   = get_u32(&data[0]);
    meta.codec_id    = data[4];
    meta.sample_rate = get_u32(&data[5]);
    meta.crc32       = get_u32(&data[9]);
    return meta;
}

// ---------------------------------------------------------------------------
// Control commands
// ---------------------------------------------------------------------------

std::vector<uint8_t> encode_request_upload() {
    return {static_cast<uint8_t>(ControlCommand::request_upload)};
}

std::vector<uint8_t> encode_ack_chunk(uint32_t timestamp) {
    std::vector<uint8_t> out(kAckCommandSize);
    out[0] = static_cast<uint8_t>(ControlCommand::ack_chunk);
    put_u32(&out[1], timestamp);
    return out;
}

std::vector<uint8_t> encode_abort() {
    return {static_cast<uint8_t>(ControlCommand::abort)};
}

std::optional<ControlMessage> decode_control(const uint8_t* data, size_t len) {
    if (!data || len == 0) return std::nullopt;

    ControlMessage msg;
    switch (data[0]) {
        case 0x01:
            msg.command = ControlCommand::request_upload;
            return msg;
        case 0x02:
            if (len < kAckCommandSize) return std::nullopt;
            msg.command   = ControlCommand::ack_chunk;
            msg.timestamp = get_u32(&data[1]);
            return msg;
        case 0x03:
            msg.command = ControlCommand::abort;
            return msg;
        default:
            return std::nullopt;
    }
}

} // namespace reclo
