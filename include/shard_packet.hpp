/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_SHARD_PACKET_HPP
#define GAMECAST_SHARD_PACKET_HPP

#pragma once

#include <common.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gamecast::fec {

    using common::MediaKind;

    constexpr uint16_t SHARD_MAGIC = 0x4743;   // "GC"
    constexpr uint8_t SHARD_VERSION = 1;

    constexpr uint8_t SHARD_FLAG_PARITY = 0x01;
    constexpr uint8_t SHARD_FLAG_KEYFRAME = 0x02;

/**
 * @brief Header prepended to every media datagram.
 *
 * Fields are stored on the wire in network byte order.
 *
 * Layout (packed, 36 bytes):
 *   uint16_t magic;          // SHARD_MAGIC
 *   uint8_t  version;
 *   uint8_t  flags;          // SHARD_FLAG_*
 *   uint8_t  media_kind;     // MediaKind
 *   uint8_t  reserved;
 *   uint16_t session_tag;    // low 16 bits of the session token
 *   uint16_t fec_k;          // data shards in this block
 *   uint16_t fec_m;          // parity shards in this block
 *   uint16_t shard_index;    // 0..k-1 data, k..k+m-1 parity
 *   uint16_t shard_size;     // payload bytes following the header
 *   uint32_t payload_len;    // original access unit length (pre-padding)
 *   uint64_t frame_seq;
 *   uint64_t capture_ts_us;
 */
#pragma pack(push,1)
    struct ShardWireHeader {
        uint16_t magic;
        uint8_t version;
        uint8_t flags;
        uint8_t media_kind;
        uint8_t reserved;
        uint16_t session_tag;
        uint16_t fec_k;
        uint16_t fec_m;
        uint16_t shard_index;
        uint16_t shard_size;
        uint32_t payload_len;
        uint64_t frame_seq;
        uint64_t capture_ts_us;
    };
#pragma pack(pop)

    constexpr size_t SHARD_HEADER_SIZE = sizeof(ShardWireHeader);
    static_assert(SHARD_HEADER_SIZE == 36, "ShardWireHeader must be 36 bytes");

/**
 * @brief One FEC shard ready for the media channel.
 *
 * Everything a receiver needs to rebuild the frame travels in each packet:
 * no per-session FEC state is kept on the client side.
 */
    struct ShardPacket {
        uint64_t frame_seq = 0;
        MediaKind kind = MediaKind::VIDEO;
        bool keyframe = false;
        bool parity = false;
        uint16_t session_tag = 0;
        uint16_t k = 0;
        uint16_t m = 0;
        uint16_t shard_index = 0;
        uint32_t payload_len = 0;
        uint64_t capture_ts_us = 0;
        std::vector<uint8_t> shard;   // exactly shard_size bytes

        uint16_t shard_size() const { return (uint16_t)shard.size(); }

        /// Header + shard bytes, network byte order.
        std::vector<uint8_t> serialize() const;
        void serialize_into(std::vector<uint8_t> &out) const;

        /**
         * @brief Parse and validate one datagram.
         * @return false on any structural inconsistency (bad magic, index out of
         *         range, length mismatch, parity flag disagreeing with the index).
         */
        static bool parse(const uint8_t *data, size_t len, ShardPacket &out);
    };

} // namespace gamecast::fec

#endif // GAMECAST_SHARD_PACKET_HPP
