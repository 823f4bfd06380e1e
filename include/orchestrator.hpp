/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_ORCHESTRATOR_HPP
#define GAMECAST_ORCHESTRATOR_HPP

#pragma once

#include <capture.hpp>
#include <common.hpp>
#include <encoder.hpp>
#include <fec.hpp>
#include <media.hpp>
#include <transport.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace gamecast::pipeline {

    using common::MediaKind;
    using common::SessionToken;
    using common::TimePoint;

    struct PipelineConfig {
        size_t max_input_frames = 2;        // raw frames waiting for the encoder, per track
        size_t max_pending_blocks = 3;      // FEC blocks waiting for transport room
        uint32_t max_encoder_restarts = 3;
        size_t drop_log_capacity = 64;
        uint32_t gop_frames = 0;            // 0 = keyframes on demand only
    };

    enum class DropReason {
        TRANSPORT_BACKLOG,
        OVERSIZED_BLOCK,    // more shards than the transport queue can ever hold
        PAUSED,
        RECONFIGURE,
        CANCELLED
    };

    const char *drop_reason_name(DropReason r);

    /// One whole FecBlock that never reached the transport.
    struct DropRecord {
        MediaKind kind = MediaKind::VIDEO;
        uint64_t frame_seq = 0;
        size_t shards = 0;
        DropReason reason = DropReason::TRANSPORT_BACKLOG;
    };

    struct TrackStats {
        uint64_t frames_captured = 0;
        uint64_t input_dropped = 0;
        uint64_t frames_encoded = 0;
        uint64_t frames_uncodable = 0;
        uint64_t blocks_sent = 0;
        uint64_t shards_sent = 0;
        uint64_t blocks_dropped = 0;
        uint64_t deadline_misses = 0;
        uint64_t keyframes_forced = 0;
        uint64_t encoder_restarts = 0;
    };

    struct OrchestratorStats {
        TrackStats tracks[2];

        const TrackStats &video() const { return tracks[common::media_index(MediaKind::VIDEO)]; }
        const TrackStats &audio() const { return tracks[common::media_index(MediaKind::AUDIO)]; }
    };

/**
 * @brief Capture -> encoder -> FEC -> transport for one session.
 *
 * Runs as cooperative steps on the host reactor. Capture pushes frames in
 * through on_captured(), which only enqueues; step() moves work forward as
 * far as the encoder and the transport queue allow, and never waits.
 *
 * Backpressure:
 *  - more than max_input_frames waiting for the encoder: the oldest input
 *    not bound to become a keyframe is dropped;
 *  - transport queue too full for the oldest FEC block: the block waits,
 *    and once more than max_pending_blocks are waiting the oldest one is
 *    dropped whole. A block is never handed over partially.
 * Any drop touching video forces the next video frame to be a keyframe.
 *
 * Frame sequence numbers are assigned at encoder output, so they only skip
 * where a whole block was dropped; every such block is in drop_log().
 */
    class StreamOrchestrator : public capture::ICaptureSink {
    public:
        StreamOrchestrator(SessionToken token, const media::StreamParams &params, const PipelineConfig &cfg,
                           const fec::FecConfig &fec_cfg, media::EncoderLease video, media::EncoderLease audio,
                           transport::IMediaSink &sink);
        ~StreamOrchestrator() override;

        StreamOrchestrator(const StreamOrchestrator &) = delete;
        StreamOrchestrator &operator=(const StreamOrchestrator &) = delete;

        /// Configure the encoders and begin accepting frames.
        bool start();

        // capture::ICaptureSink
        void on_captured(const media::RawFrame &frame) override;
        void on_capture_failed(MediaKind kind, const std::string &reason) override;

        void step(TimePoint now);

        /// Stop taking frames, hand over what fits and drop the rest.
        void pause(TimePoint now);
        void resume();

        /**
         * @brief Switch to new parameters.
         *
         * Work produced for the old parameters is drained first; the next
         * video frame is a keyframe. False when an encoder refuses the new
         * settings, which leaves the pipeline fatal.
         */
        bool reconfigure(const media::StreamParams &params, TimePoint now);

        void request_keyframe();
        void update_loss_estimate(double estimate);

        /// Drop every queued frame, block and datagram of this session.
        void cancel();

        bool running() const { return running_; }
        bool paused() const { return paused_; }
        bool fatal() const { return fatal_; }
        const std::string &fatal_reason() const { return fatal_reason_; }

        const OrchestratorStats &stats() const { return stats_; }
        const std::deque<DropRecord> &drop_log() const { return drop_log_; }
        const media::StreamParams &params() const { return params_; }
        double loss_estimate() const { return loss_estimate_; }
        const fec::FecParams &last_fec_params() const { return packetizer_.last_params(); }

        size_t pending_blocks() const { return pending_.size(); }
        size_t queued_inputs(MediaKind kind) const { return tracks_[common::media_index(kind)].input.size(); }
        /// Sequence number the next frame of @p kind will get.
        uint64_t next_frame_seq(MediaKind kind) const { return tracks_[common::media_index(kind)].next_seq; }
        bool keyframe_pending() const { return tracks_[common::media_index(MediaKind::VIDEO)].force_keyframe; }

    private:
        struct Track {
            MediaKind kind = MediaKind::VIDEO;
            media::EncoderLease encoder;
            std::deque<media::RawFrame> input;
            uint64_t next_seq = 0;
            bool force_keyframe = false;
            uint32_t restarts = 0;
        };

        struct PendingBlock {
            fec::FecBlock block;
            TimePoint deadline;
        };

        Track &track(MediaKind kind) { return tracks_[common::media_index(kind)]; }
        TrackStats &track_stats(MediaKind kind) { return stats_.tracks[common::media_index(kind)]; }

        bool configure_encoder(Track &t);
        void encode_stage(Track &t);
        void fec_stage(Track &t);
        void transport_stage(TimePoint now);
        void drop_block(PendingBlock &pb, DropReason reason);
        void force_keyframe(MediaKind kind);
        void drain(TimePoint now, DropReason reason);
        void set_fatal(const std::string &reason);

        SessionToken token_;
        media::StreamParams params_;
        PipelineConfig cfg_;
        fec::FecConfig fec_base_;
        fec::FecPacketizer packetizer_;
        transport::IMediaSink &sink_;
        Track tracks_[2];
        std::deque<PendingBlock> pending_;
        std::deque<DropRecord> drop_log_;
        OrchestratorStats stats_;
        double loss_estimate_ = 0.0;
        bool running_ = false;
        bool paused_ = false;
        bool fatal_ = false;
        std::string fatal_reason_;
    };

} // namespace gamecast::pipeline

#endif // GAMECAST_ORCHESTRATOR_HPP
