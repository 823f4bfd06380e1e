/*
* @license
* (C) zachbabanov
*
*/

#include <shard_packet.hpp>
#include <logger.hpp>

#include <cstring>

using namespace gamecast::common;

namespace gamecast::fec {

    std::vector<uint8_t> ShardPacket::serialize() const {
        std::vector<uint8_t> out;
        serialize_into(out);
        return out;
    }

    void ShardPacket::serialize_into(std::vector<uint8_t> &out) const {
        ShardWireHeader hdr{};
        hdr.magic = hton_u16(SHARD_MAGIC);
        hdr.version = SHARD_VERSION;
        hdr.flags = (uint8_t)((parity ? SHARD_FLAG_PARITY : 0) | (keyframe ? SHARD_FLAG_KEYFRAME : 0));
        hdr.media_kind = (uint8_t)kind;
        hdr.reserved = 0;
        hdr.session_tag = hton_u16(session_tag);
        hdr.fec_k = hton_u16(k);
        hdr.fec_m = hton_u16(m);
        hdr.shard_index = hton_u16(shard_index);
        hdr.shard_size = hton_u16(shard_size());
        hdr.payload_len = hton_u32(payload_len);
        hdr.frame_seq = hton_u64(frame_seq);
        hdr.capture_ts_us = hton_u64(capture_ts_us);

        out.resize(SHARD_HEADER_SIZE + shard.size());
        std::memcpy(out.data(), &hdr, SHARD_HEADER_SIZE);
        if (!shard.empty()) std::memcpy(out.data() + SHARD_HEADER_SIZE, shard.data(), shard.size());
    }

    bool ShardPacket::parse(const uint8_t *data, size_t len, ShardPacket &out) {
        if (len < SHARD_HEADER_SIZE) return false;
        ShardWireHeader hdr{};
        std::memcpy(&hdr, data, SHARD_HEADER_SIZE);

        if (ntoh_u16(hdr.magic) != SHARD_MAGIC || hdr.version != SHARD_VERSION) return false;
        if (hdr.media_kind > (uint8_t)MediaKind::AUDIO) return false;

        uint16_t k = ntoh_u16(hdr.fec_k);
        uint16_t m = ntoh_u16(hdr.fec_m);
        uint16_t idx = ntoh_u16(hdr.shard_index);
        uint16_t shard_size = ntoh_u16(hdr.shard_size);
        uint32_t payload_len = ntoh_u32(hdr.payload_len);

        if (k == 0 || (size_t)k + m > 255 || idx >= k + m) return false;
        if (shard_size == 0 || len != SHARD_HEADER_SIZE + shard_size) return false;
        if ((uint64_t)payload_len > (uint64_t)k * shard_size) return false;
        bool parity = (hdr.flags & SHARD_FLAG_PARITY) != 0;
        if (parity != (idx >= k)) return false;

        out.frame_seq = ntoh_u64(hdr.frame_seq);
        out.kind = (MediaKind)hdr.media_kind;
        out.keyframe = (hdr.flags & SHARD_FLAG_KEYFRAME) != 0;
        out.parity = parity;
        out.session_tag = ntoh_u16(hdr.session_tag);
        out.k = k;
        out.m = m;
        out.shard_index = idx;
        out.payload_len = payload_len;
        out.capture_ts_us = ntoh_u64(hdr.capture_ts_us);
        out.shard.assign(data + SHARD_HEADER_SIZE, data + len);
        return true;
    }

} // namespace gamecast::fec
