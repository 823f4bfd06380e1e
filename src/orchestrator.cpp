/*
* @license
* (C) zachbabanov
*
*/

#include <orchestrator.hpp>
#include <logger.hpp>

#include <algorithm>
#include <utility>

using namespace gamecast::common;

namespace gamecast::pipeline {

namespace {

    fec::FecConfig session_fec_config(const fec::FecConfig &base, const media::StreamParams &p) {
        fec::FecConfig c = base;
        if (p.shard_size > 0) c.shard_size = p.shard_size;
        c.min_parity = std::max(base.min_parity, p.min_fec_shards);
        return c;
    }

    Clock::duration frame_budget(uint32_t fps) {
        return std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(1000000000LL / std::max<uint32_t>(1, fps)));
    }

} // namespace

    const char *drop_reason_name(DropReason r) {
        switch (r) {
            case DropReason::TRANSPORT_BACKLOG: return "transport-backlog";
            case DropReason::OVERSIZED_BLOCK: return "oversized-block";
            case DropReason::PAUSED: return "paused";
            case DropReason::RECONFIGURE: return "reconfigure";
            case DropReason::CANCELLED: return "cancelled";
        }
        return "unknown";
    }

    StreamOrchestrator::StreamOrchestrator(SessionToken token, const media::StreamParams &params,
                                           const PipelineConfig &cfg, const fec::FecConfig &fec_cfg,
                                           media::EncoderLease video, media::EncoderLease audio,
                                           transport::IMediaSink &sink)
        : token_(token), params_(params), cfg_(cfg), fec_base_(fec_cfg),
          packetizer_(session_fec_config(fec_cfg, params)), sink_(sink) {
        if (cfg_.max_input_frames == 0) cfg_.max_input_frames = 1;
        Track &v = track(MediaKind::VIDEO);
        v.kind = MediaKind::VIDEO;
        v.encoder = std::move(video);
        Track &a = track(MediaKind::AUDIO);
        a.kind = MediaKind::AUDIO;
        a.encoder = std::move(audio);
    }

    StreamOrchestrator::~StreamOrchestrator() {
        if (running_) cancel();
    }

    bool StreamOrchestrator::configure_encoder(Track &t) {
        if (!t.encoder) return true;
        bool ok = (t.kind == MediaKind::VIDEO)
                  ? t.encoder->configure(media::video_settings(params_, cfg_.gop_frames))
                  : t.encoder->configure(media::audio_settings(params_));
        if (!ok) {
            LOG_PIPE_ERROR("session {:016x}: {} encoder '{}' rejected {}", token_, media_kind_name(t.kind),
                           t.encoder->name(), params_.describe());
        }
        return ok;
    }

    bool StreamOrchestrator::start() {
        if (running_) return true;
        if (!track(MediaKind::VIDEO).encoder) {
            LOG_PIPE_ERROR("session {:016x}: cannot start without a video encoder", token_);
            return false;
        }
        for (Track &t : tracks_) {
            if (!configure_encoder(t)) {
                set_fatal(std::string(media_kind_name(t.kind)) + " encoder configuration failed");
                return false;
            }
        }
        running_ = true;
        paused_ = false;
        // a fresh encoder opens with a keyframe anyway; the flag keeps the first frame honest
        track(MediaKind::VIDEO).force_keyframe = true;
        LOG_PIPE_INFO("session {:016x}: pipeline started {}", token_, params_.describe());
        return true;
    }

    void StreamOrchestrator::on_captured(const media::RawFrame &frame) {
        if (!running_ || paused_ || fatal_) return;
        Track &t = track(frame.kind);
        if (!t.encoder) return;
        TrackStats &ts = track_stats(frame.kind);
        ++ts.frames_captured;

        if (t.input.size() >= cfg_.max_input_frames) {
            // the keyframe flag lives on the track and outlasts the dropped frame
            LOG_PIPE_DEBUG("session {:016x}: encoder backlog, dropping {} capture #{}",
                           token_, media_kind_name(frame.kind), t.input.front().capture_index);
            t.input.pop_front();
            ++ts.input_dropped;
            force_keyframe(frame.kind);
        }

        t.input.push_back(frame);
    }

    void StreamOrchestrator::on_capture_failed(MediaKind kind, const std::string &reason) {
        set_fatal(std::string(media_kind_name(kind)) + " capture failed: " + reason);
    }

    void StreamOrchestrator::force_keyframe(MediaKind kind) {
        if (kind != MediaKind::VIDEO) return;
        Track &t = track(MediaKind::VIDEO);
        if (!t.force_keyframe) LOG_VIDEO_DEBUG("session {:016x}: keyframe requested", token_);
        t.force_keyframe = true;
    }

    void StreamOrchestrator::request_keyframe() {
        force_keyframe(MediaKind::VIDEO);
    }

    void StreamOrchestrator::update_loss_estimate(double estimate) {
        if (estimate != estimate) return;   // NaN
        loss_estimate_ = std::min(1.0, std::max(0.0, estimate));
    }

    void StreamOrchestrator::set_fatal(const std::string &reason) {
        if (fatal_) return;
        fatal_ = true;
        fatal_reason_ = reason;
        LOG_PIPE_ERROR("session {:016x}: pipeline failed: {}", token_, reason);
    }

    void StreamOrchestrator::encode_stage(Track &t) {
        // keep the encoder fed with one frame at a time; the rest waits in t.input
        while (!t.input.empty() && t.encoder->pending() < 1 && !fatal_) {
            media::RawFrame frame = std::move(t.input.front());
            t.input.pop_front();

            bool force = t.kind == MediaKind::VIDEO && t.force_keyframe;
            if (t.encoder->submit(frame, force)) {
                t.restarts = 0;
                if (force) {
                    t.force_keyframe = false;
                    ++track_stats(t.kind).keyframes_forced;
                }
                continue;
            }

            // the frame is lost; restart the encoder a bounded number of times
            ++track_stats(t.kind).input_dropped;
            force_keyframe(t.kind);
            while (true) {
                if (t.restarts >= cfg_.max_encoder_restarts) {
                    set_fatal(std::string(media_kind_name(t.kind)) + " encoder failed after " +
                              std::to_string(t.restarts) + " restarts");
                    return;
                }
                ++t.restarts;
                ++track_stats(t.kind).encoder_restarts;
                LOG_PIPE_WARN("session {:016x}: restarting {} encoder (attempt {}/{})", token_,
                              media_kind_name(t.kind), t.restarts, cfg_.max_encoder_restarts);
                if (configure_encoder(t)) break;
            }
        }
    }

    void StreamOrchestrator::fec_stage(Track &t) {
        media::EncodedFrame ef;
        while (t.encoder->poll(ef)) {
            ef.frame_seq = t.next_seq;
            PendingBlock pb;
            if (!packetizer_.packetize(ef, loss_estimate_, (uint16_t)(token_ & 0xFFFF), pb.block)) {
                // sequence number not consumed: nothing with it ever existed
                ++track_stats(t.kind).frames_uncodable;
                force_keyframe(t.kind);
                continue;
            }
            ++t.next_seq;
            ++track_stats(t.kind).frames_encoded;
            pb.deadline = ef.captured_at + frame_budget(params_.fps);
            pending_.push_back(std::move(pb));
        }
    }

    void StreamOrchestrator::drop_block(PendingBlock &pb, DropReason reason) {
        const fec::FecBlock &b = pb.block;
        DropRecord rec;
        rec.kind = b.kind;
        rec.frame_seq = b.frame_seq;
        rec.shards = b.packets.size();
        rec.reason = reason;
        drop_log_.push_back(rec);
        while (drop_log_.size() > cfg_.drop_log_capacity) drop_log_.pop_front();

        ++track_stats(b.kind).blocks_dropped;
        LOG_PIPE_INFO("session {:016x}: dropped {} block seq={} ({} shards, {})", token_,
                      media_kind_name(b.kind), b.frame_seq, (uint64_t)rec.shards, drop_reason_name(reason));
        force_keyframe(b.kind);
    }

    void StreamOrchestrator::transport_stage(TimePoint now) {
        const size_t capacity = sink_.media_queue_capacity();
        while (!pending_.empty()) {
            PendingBlock &pb = pending_.front();
            const size_t shards = pb.block.packets.size();
            if (shards > capacity) {
                drop_block(pb, DropReason::OVERSIZED_BLOCK);
                pending_.pop_front();
                continue;
            }
            size_t depth = sink_.media_queue_depth();
            size_t room = capacity > depth ? capacity - depth : 0;
            if (room < shards) break;

            for (const fec::ShardPacket &pkt : pb.block.packets) sink_.send_media(pkt);
            TrackStats &ts = track_stats(pb.block.kind);
            ++ts.blocks_sent;
            ts.shards_sent += shards;
            if (now > pb.deadline) {
                ++ts.deadline_misses;
                LOG_PIPE_TRACE("session {:016x}: {} seq={} handed off {} us late", token_,
                               media_kind_name(pb.block.kind), pb.block.frame_seq,
                               (int64_t)std::chrono::duration_cast<std::chrono::microseconds>(now - pb.deadline).count());
            }
            pending_.pop_front();
        }

        while (pending_.size() > cfg_.max_pending_blocks) {
            drop_block(pending_.front(), DropReason::TRANSPORT_BACKLOG);
            pending_.pop_front();
        }
    }

    void StreamOrchestrator::step(TimePoint now) {
        if (!running_ || fatal_) return;
        for (Track &t : tracks_) {
            if (!t.encoder) continue;
            // synchronous encoders finish inside submit(), so keep going while they keep up
            do {
                encode_stage(t);
                if (fatal_) return;
                fec_stage(t);
            } while (!t.input.empty() && t.encoder->pending() == 0);
        }
        transport_stage(now);
    }

    void StreamOrchestrator::drain(TimePoint now, DropReason reason) {
        for (Track &t : tracks_) {
            t.input.clear();
            if (t.encoder) fec_stage(t);
        }
        transport_stage(now);
        while (!pending_.empty()) {
            drop_block(pending_.front(), reason);
            pending_.pop_front();
        }
    }

    void StreamOrchestrator::pause(TimePoint now) {
        if (!running_ || paused_) return;
        paused_ = true;
        drain(now, DropReason::PAUSED);
        LOG_PIPE_INFO("session {:016x}: pipeline paused", token_);
    }

    void StreamOrchestrator::resume() {
        if (!running_ || !paused_) return;
        paused_ = false;
        force_keyframe(MediaKind::VIDEO);
        LOG_PIPE_INFO("session {:016x}: pipeline resumed", token_);
    }

    bool StreamOrchestrator::reconfigure(const media::StreamParams &params, TimePoint now) {
        if (fatal_) return false;
        drain(now, DropReason::RECONFIGURE);

        params_ = params;
        packetizer_.set_config(session_fec_config(fec_base_, params));
        for (Track &t : tracks_) {
            if (!t.encoder) continue;
            t.encoder->flush();
            if (!configure_encoder(t)) {
                set_fatal(std::string(media_kind_name(t.kind)) + " encoder rejected new parameters");
                return false;
            }
        }
        force_keyframe(MediaKind::VIDEO);
        LOG_PIPE_INFO("session {:016x}: pipeline reconfigured {}", token_, params_.describe());
        return true;
    }

    void StreamOrchestrator::cancel() {
        size_t dropped = pending_.size();
        for (Track &t : tracks_) {
            t.input.clear();
            if (t.encoder) t.encoder->flush();
        }
        while (!pending_.empty()) {
            drop_block(pending_.front(), DropReason::CANCELLED);
            pending_.pop_front();
        }
        sink_.clear_media();
        running_ = false;
        LOG_PIPE_INFO("session {:016x}: pipeline cancelled ({} blocks discarded)", token_, (uint64_t)dropped);
    }

} // namespace gamecast::pipeline
