/*
* @license
* (C) zachbabanov
*
*/

#include <encoder.hpp>
#include <annexb.hpp>
#include <logger.hpp>

#include <algorithm>
#include <utility>

using namespace gamecast::common;

namespace gamecast::media {

namespace {

    constexpr size_t MIN_SLICE_BYTES = 16;
    constexpr size_t KEYFRAME_SIZE_FACTOR = 4;

    void put_start_code(std::vector<uint8_t> &out) {
        static const uint8_t sc[4] = {0x00, 0x00, 0x00, 0x01};
        out.insert(out.end(), sc, sc + 4);
    }

    void put_nal_header(std::vector<uint8_t> &out, Codec codec, uint8_t type) {
        put_start_code(out);
        if (codec == Codec::HEVC) {
            out.push_back((uint8_t)(type << 1));
            out.push_back(0x01);    // nuh_temporal_id_plus1
        } else {
            // nal_ref_idc = 3 for parameter sets and IDR, 2 for the rest
            uint8_t ref = (type == annexb::H264_NAL_SLICE) ? 0x40 : 0x60;
            out.push_back((uint8_t)(ref | type));
        }
    }

    /// Never returns 0, so a payload built from it cannot contain a start code.
    inline uint8_t pattern_byte(uint64_t frame, size_t i) {
        return (uint8_t)(((frame * 31u) + (i * 7u)) % 254u + 1u);
    }

    inline uint8_t nonzero(uint32_t v) {
        return (uint8_t)((v & 0x7F) | 0x80);
    }

} // namespace

    EncoderSettings video_settings(const StreamParams &p, uint32_t gop_frames) {
        EncoderSettings s;
        s.kind = MediaKind::VIDEO;
        s.codec = p.codec;
        s.width = p.width;
        s.height = p.height;
        s.fps = p.fps;
        s.bitrate_kbps = p.bitrate_kbps;
        s.gop_frames = gop_frames;
        return s;
    }

    EncoderSettings audio_settings(const StreamParams &p) {
        EncoderSettings s;
        s.kind = MediaKind::AUDIO;
        s.sample_rate = p.audio_sample_rate;
        s.channels = p.audio_channels;
        s.fps = p.fps;
        return s;
    }

    bool TestPatternEncoder::configure(const EncoderSettings &settings) {
        if (settings.kind != MediaKind::VIDEO) {
            LOG_VIDEO_ERROR("test-pattern encoder: not a video configuration");
            return false;
        }
        if (settings.codec != Codec::H264 && settings.codec != Codec::HEVC) {
            LOG_VIDEO_ERROR("test-pattern encoder: codec {} not supported", codec_name(settings.codec));
            return false;
        }
        if (settings.width == 0 || settings.height == 0 || settings.fps == 0 || settings.bitrate_kbps == 0) {
            LOG_VIDEO_ERROR("test-pattern encoder: invalid settings {}x{}@{} {}kbps",
                            settings.width, settings.height, settings.fps, settings.bitrate_kbps);
            return false;
        }
        settings_ = settings;
        configured_ = true;
        need_keyframe_ = true;
        since_keyframe_ = 0;
        out_.clear();
        LOG_VIDEO_INFO("test-pattern encoder configured: {} {}x{}@{} {}kbps gop={}",
                       codec_name(settings.codec), settings.width, settings.height, settings.fps,
                       settings.bitrate_kbps, settings.gop_frames);
        return true;
    }

    size_t TestPatternEncoder::target_frame_bytes() const {
        if (!configured_) return 0;
        uint64_t bytes = (uint64_t)settings_.bitrate_kbps * 1000 / 8 / settings_.fps;
        return std::max<size_t>(MIN_SLICE_BYTES, (size_t)bytes);
    }

    void TestPatternEncoder::build_access_unit(const RawFrame &frame, bool keyframe, std::vector<uint8_t> &out) const {
        const Codec codec = settings_.codec;
        size_t slice = target_frame_bytes();
        if (keyframe) slice *= KEYFRAME_SIZE_FACTOR;
        slice = std::min(slice, MAX_FRAME_BYTES / 2);

        out.clear();
        out.reserve(slice + 64);
        if (keyframe) {
            if (codec == Codec::HEVC) {
                put_nal_header(out, codec, annexb::HEVC_NAL_VPS);
                out.push_back(0x0C);
                out.push_back(0x01);
            }
            put_nal_header(out, codec, codec == Codec::HEVC ? annexb::HEVC_NAL_SPS : annexb::H264_NAL_SPS);
            out.push_back(0x64);    // profile_idc: high
            out.push_back(0x08);
            out.push_back(0x28);    // level 4.0
            out.push_back(nonzero(settings_.width >> 7));
            out.push_back(nonzero(settings_.width));
            out.push_back(nonzero(settings_.height >> 7));
            out.push_back(nonzero(settings_.height));
            put_nal_header(out, codec, codec == Codec::HEVC ? annexb::HEVC_NAL_PPS : annexb::H264_NAL_PPS);
            out.push_back(0xEE);
            out.push_back(0x3C);
            out.push_back(0x80);
            put_nal_header(out, codec, codec == Codec::HEVC ? annexb::HEVC_NAL_IDR_W_RADL : annexb::H264_NAL_IDR);
        } else {
            put_nal_header(out, codec, codec == Codec::HEVC ? annexb::HEVC_NAL_TRAIL_R : annexb::H264_NAL_SLICE);
        }

        for (size_t i = 0; i < slice; ++i) out.push_back(pattern_byte(frame.capture_index, i));
    }

    bool TestPatternEncoder::submit(const RawFrame &frame, bool force_keyframe) {
        if (!configured_) {
            LOG_VIDEO_ERROR("test-pattern encoder: submit before configure");
            return false;
        }
        if (frame.kind != MediaKind::VIDEO) {
            LOG_VIDEO_ERROR("test-pattern encoder: got a {} frame", media_kind_name(frame.kind));
            return false;
        }

        bool keyframe = force_keyframe || need_keyframe_ ||
                        (settings_.gop_frames > 0 && since_keyframe_ >= settings_.gop_frames);

        EncodedFrame ef;
        ef.kind = MediaKind::VIDEO;
        ef.captured_at = frame.captured_at;
        ef.capture_ts_us = to_micros(frame.captured_at);
        ef.keyframe = keyframe;
        build_access_unit(frame, keyframe, ef.payload);

        need_keyframe_ = false;
        since_keyframe_ = keyframe ? 1 : since_keyframe_ + 1;
        ++frames_;
        if (keyframe) {
            ++keyframes_;
            LOG_VIDEO_DEBUG("test-pattern encoder: keyframe for capture #{} ({} bytes, forced={})",
                            frame.capture_index, (uint64_t)ef.payload.size(), force_keyframe);
        }
        out_.push_back(std::move(ef));
        return true;
    }

    bool TestPatternEncoder::poll(EncodedFrame &out) {
        if (out_.empty()) return false;
        out = std::move(out_.front());
        out_.pop_front();
        return true;
    }

    bool PcmAudioEncoder::configure(const EncoderSettings &settings) {
        if (settings.kind != MediaKind::AUDIO || settings.sample_rate == 0 || settings.channels == 0) {
            LOG_AUDIO_ERROR("pcm encoder: invalid settings rate={} channels={}", settings.sample_rate, settings.channels);
            return false;
        }
        settings_ = settings;
        configured_ = true;
        out_.clear();
        LOG_AUDIO_INFO("pcm encoder configured: {}Hz {}ch", settings.sample_rate, settings.channels);
        return true;
    }

    bool PcmAudioEncoder::submit(const RawFrame &frame, bool /*force_keyframe*/) {
        if (!configured_) {
            LOG_AUDIO_ERROR("pcm encoder: submit before configure");
            return false;
        }
        size_t expected = (size_t)frame.sample_count * settings_.channels * 2;
        if (frame.kind != MediaKind::AUDIO || !frame.data || frame.data->size() != expected) {
            LOG_AUDIO_ERROR("pcm encoder: buffer of {} bytes does not match {} samples x {}ch",
                            frame.data ? (uint64_t)frame.data->size() : 0, frame.sample_count, settings_.channels);
            return false;
        }
        EncodedFrame ef;
        ef.kind = MediaKind::AUDIO;
        ef.captured_at = frame.captured_at;
        ef.capture_ts_us = to_micros(frame.captured_at);
        ef.keyframe = false;
        ef.payload = *frame.data;
        out_.push_back(std::move(ef));
        return true;
    }

    bool PcmAudioEncoder::poll(EncodedFrame &out) {
        if (out_.empty()) return false;
        out = std::move(out_.front());
        out_.pop_front();
        return true;
    }

    std::unique_ptr<IEncoder> make_default_encoder(MediaKind kind) {
        if (kind == MediaKind::AUDIO) return std::make_unique<PcmAudioEncoder>();
        return std::make_unique<TestPatternEncoder>();
    }

    EncoderLease::~EncoderLease() {
        release();
    }

    EncoderLease::EncoderLease(EncoderLease &&other) noexcept
        : pool_(other.pool_), kind_(other.kind_), slot_(other.slot_), encoder_(other.encoder_) {
        other.pool_ = nullptr;
        other.encoder_ = nullptr;
    }

    EncoderLease &EncoderLease::operator=(EncoderLease &&other) noexcept {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            kind_ = other.kind_;
            slot_ = other.slot_;
            encoder_ = other.encoder_;
            other.pool_ = nullptr;
            other.encoder_ = nullptr;
        }
        return *this;
    }

    void EncoderLease::release() {
        if (pool_ && encoder_) pool_->give_back(kind_, slot_);
        pool_ = nullptr;
        encoder_ = nullptr;
    }

    EncoderPool::EncoderPool(size_t video_slots, size_t audio_slots, EncoderFactory factory)
        : factory_(std::move(factory)) {
        slots_[media_index(MediaKind::VIDEO)].resize(video_slots);
        slots_[media_index(MediaKind::AUDIO)].resize(audio_slots);
    }

    EncoderLease EncoderPool::acquire(MediaKind kind, SessionToken owner) {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<Slot> &slots = slots_[media_index(kind)];
        for (size_t i = 0; i < slots.size(); ++i) {
            Slot &s = slots[i];
            if (s.leased) continue;
            if (!s.encoder) {
                s.encoder = factory_ ? factory_(kind) : nullptr;
                if (!s.encoder) {
                    LOG_PIPE_ERROR("encoder factory returned nothing for {}", media_kind_name(kind));
                    return EncoderLease();
                }
            }
            s.leased = true;
            s.owner = owner;
            LOG_PIPE_DEBUG("{} encoder slot {} leased to session {:016x}", media_kind_name(kind), (unsigned)i, owner);
            return EncoderLease(this, kind, i, s.encoder.get());
        }
        LOG_PIPE_WARN("no free {} encoder for session {:016x} ({} slots busy)",
                      media_kind_name(kind), owner, (unsigned)slots.size());
        return EncoderLease();
    }

    void EncoderPool::give_back(MediaKind kind, size_t slot) {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<Slot> &slots = slots_[media_index(kind)];
        if (slot >= slots.size()) return;
        Slot &s = slots[slot];
        if (s.encoder) s.encoder->flush();
        LOG_PIPE_DEBUG("{} encoder slot {} returned by session {:016x}", media_kind_name(kind), (unsigned)slot, s.owner);
        s.leased = false;
        s.owner = 0;
    }

    size_t EncoderPool::available(MediaKind kind) const {
        std::lock_guard<std::mutex> lk(mtx_);
        const std::vector<Slot> &slots = slots_[media_index(kind)];
        return (size_t)std::count_if(slots.begin(), slots.end(), [](const Slot &s) { return !s.leased; });
    }

    size_t EncoderPool::capacity(MediaKind kind) const {
        std::lock_guard<std::mutex> lk(mtx_);
        return slots_[media_index(kind)].size();
    }

} // namespace gamecast::media
