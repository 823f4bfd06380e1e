/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_FEC_HPP
#define GAMECAST_FEC_HPP

#pragma once

#include <common.hpp>
#include <media.hpp>
#include <shard_packet.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace gamecast::fec {

    /// GF(2^8) bounds the code length.
    constexpr size_t MAX_TOTAL_SHARDS = 255;
    /// Largest shard that still fits a single UDP datagram with our header.
    constexpr size_t MAX_SHARD_BYTES = 65000;

    struct FecConfig {
        uint16_t shard_size = 1280;
        double max_overhead_ratio = 1.0;   // parity never exceeds this fraction of k
        double base_ratio = 0.0;           // floor under the adaptive ratio
        uint16_t min_parity = 1;           // at least 1, whatever the config says
        double loss_alpha = 0.25;          // EWMA weight of a new loss sample
    };

    struct FecParams {
        uint16_t k = 1;
        uint16_t m = 1;
        uint16_t shard_size = 0;
    };

    /**
     * @brief Choose k, m and the shard size for one frame.
     *
     * k = ceil(payload / shard_size) (min 1); m = ceil(k * max(loss, base_ratio)),
     * clamped to floor(k * max_overhead_ratio) and raised to min_parity. The
     * minimum applies to every frame, keyframes included, whatever the loss
     * estimate. The returned shard size is ceil(payload / k), never above the
     * configured one, unless k + m would exceed MAX_TOTAL_SHARDS: then the
     * shard grows for this frame. shard_size is 0 when the payload is too
     * large to code at all.
     */
    FecParams select_params(size_t payload_len, double loss_estimate, const FecConfig &cfg);

/**
 * @brief Exponentially-smoothed loss estimate.
 *
 * Owned by the session; updated only through update().
 */
    class LossEstimator {
    public:
        explicit LossEstimator(double alpha = 0.25, double initial = 0.0);

        /// Fold in one sample (clamped to [0,1]) and return the new estimate.
        double update(double sample);
        double value() const { return estimate_; }
        uint64_t samples() const { return samples_; }
        void reset(double v = 0.0);

    private:
        double alpha_;
        double estimate_;
        uint64_t samples_;
    };

/**
 * @brief Systematic MDS erasure code over GF(256).
 *
 * Generator = [ I_k ; C ] where C[i][j] = 1 / (x_i + y_j), x_i = k + i, y_j = j.
 * Every square submatrix of a Cauchy matrix is non-singular, so any k of the
 * k + m shards determine the data.
 */
    class ErasureCoder {
    public:
        /**
         * @brief Fill shards[k..k+m-1] from shards[0..k-1].
         * All shards must already have identical size.
         */
        static void encode(std::vector<std::vector<uint8_t>> &shards, uint16_t k, uint16_t m);

        /**
         * @brief Rebuild missing data shards in place.
         * @param present one flag per shard (k + m entries)
         * @return false when fewer than k shards are present.
         */
        static bool reconstruct(std::vector<std::vector<uint8_t>> &shards, const std::vector<uint8_t> &present,
                                uint16_t k, uint16_t m);

        static uint8_t coefficient(uint16_t k, uint16_t parity_row, uint16_t data_col);
    };

/**
 * @brief All shards derived from one EncodedFrame.
 */
    struct FecBlock {
        uint64_t frame_seq = 0;
        MediaKind kind = MediaKind::VIDEO;
        bool keyframe = false;
        FecParams params;
        common::TimePoint captured_at{};
        std::vector<ShardPacket> packets;   // k data then m parity
    };

/**
 * @brief Turns encoded frames into self-describing shard packets.
 */
    class FecPacketizer {
    public:
        explicit FecPacketizer(const FecConfig &cfg);

        /**
         * @brief Protect one frame.
         * @return false for payloads that cannot be coded (empty or beyond
         *         MAX_TOTAL_SHARDS * MAX_SHARD_BYTES).
         */
        bool packetize(const media::EncodedFrame &frame, double loss_estimate, uint16_t session_tag, FecBlock &out);

        void set_config(const FecConfig &cfg) { cfg_ = cfg; }
        const FecConfig &config() const { return cfg_; }
        const FecParams &last_params() const { return last_; }

    private:
        FecConfig cfg_;
        FecParams last_;
    };

    struct ReassembledFrame {
        uint64_t frame_seq = 0;
        MediaKind kind = MediaKind::VIDEO;
        bool keyframe = false;
        bool used_parity = false;
        uint64_t capture_ts_us = 0;
        std::vector<uint8_t> payload;
    };

    /// Totals accumulated since the last take_counters() call.
    struct ReassemblyCounters {
        uint64_t shards_received = 0;
        uint64_t shards_expected = 0;      // k + m of each finalized block
        uint64_t frames_completed = 0;
        uint64_t frames_recovered = 0;     // completed only thanks to parity
        uint64_t frames_unrecoverable = 0;
        uint64_t unrecoverable_video = 0;

        double loss_ratio() const {
            if (shards_expected == 0) return 0.0;
            uint64_t got = shards_received > shards_expected ? shards_expected : shards_received;
            return 1.0 - (double)got / (double)shards_expected;
        }
    };

/**
 * @brief Receiver side: collects shards per frame and decodes once k arrived.
 *
 * Blocks stay tracked for max_age after their first shard so late shards are
 * still counted; a block that never reached k shards by then is reported as
 * unrecoverable.
 */
    class FecReassembler {
    public:
        enum class Result {
            PENDING,     // stored, fewer than k shards so far
            COMPLETE,    // this shard completed the frame; out is filled
            DUPLICATE,   // shard already seen or frame already delivered
            STALE,       // block already finalized
            INVALID      // k/m/size disagree with earlier shards of the same frame
        };

        explicit FecReassembler(std::chrono::milliseconds max_age = std::chrono::milliseconds(500),
                                size_t max_blocks = 512);

        Result add(const ShardPacket &pkt, common::TimePoint now, ReassembledFrame &out);

        /**
         * @brief Finalize blocks older than max_age.
         * @param video_lost optional, receives how many of them were video frames
         * @return number of frames declared unrecoverable.
         */
        size_t expire(common::TimePoint now, size_t *video_lost = nullptr);

        ReassemblyCounters take_counters();
        size_t in_progress() const { return blocks_.size(); }

    private:
        struct Block {
            uint16_t k = 0;
            uint16_t m = 0;
            uint16_t shard_size = 0;
            uint32_t payload_len = 0;
            bool keyframe = false;
            bool decoded = false;
            uint64_t capture_ts_us = 0;
            size_t received = 0;
            std::vector<std::vector<uint8_t>> shards;
            std::vector<uint8_t> present;
            common::TimePoint first_seen{};
        };

        using Key = std::pair<uint8_t, uint64_t>;   // (media kind, frame_seq)

        bool decode(Block &b, ReassembledFrame &out, MediaKind kind, uint64_t seq);
        // Returns true when the block never produced its frame.
        bool finalize(const Key &key, const Block &b);

        std::chrono::milliseconds max_age_;
        size_t max_blocks_;
        std::map<Key, Block> blocks_;
        std::deque<Key> finished_order_;
        std::set<Key> finished_;
        ReassemblyCounters counters_;
    };

    const char *result_name(FecReassembler::Result r);

} // namespace gamecast::fec

#endif // GAMECAST_FEC_HPP
