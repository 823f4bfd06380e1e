/*
 * @license
 * (C) zachbabanov
 *
 */

#ifndef GAMECAST_ENCODER_HPP
#define GAMECAST_ENCODER_HPP

#pragma once

#include <common.hpp>
#include <media.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace gamecast::media {

    struct EncoderSettings {
        MediaKind kind = MediaKind::VIDEO;
        Codec codec = Codec::H264;
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t fps = 60;
        uint32_t bitrate_kbps = 0;
        uint32_t gop_frames = 0;        // 0 = keyframes only on request
        uint32_t sample_rate = 48000;
        uint16_t channels = 2;
    };

    EncoderSettings video_settings(const StreamParams &p, uint32_t gop_frames);
    EncoderSettings audio_settings(const StreamParams &p);

/**
 * @brief Raw frame in, access units out.
 *
 * submit() and poll() never block: an implementation backed by hardware
 * queues work and reports it through poll() once ready. frame_seq of the
 * produced EncodedFrame is left for the caller to assign.
 */
    class IEncoder {
    public:
        virtual ~IEncoder() = default;

        /// (Re)initialize. The next access unit after a successful call is a keyframe.
        virtual bool configure(const EncoderSettings &settings) = 0;

        /// @return false on encoder failure; the caller decides whether to restart.
        virtual bool submit(const RawFrame &frame, bool force_keyframe) = 0;

        virtual bool poll(EncodedFrame &out) = 0;

        /// Submitted frames not yet returned by poll().
        virtual size_t pending() const = 0;

        /// Discard everything in flight.
        virtual void flush() = 0;

        virtual MediaKind kind() const = 0;
        virtual const char *name() const = 0;
    };

/**
 * @brief Software stand-in for a hardware video encoder.
 *
 * Emits syntactically valid Annex-B access units (parameter sets + IDR for
 * keyframes, one non-IDR slice otherwise) sized from the configured bitrate.
 * The slice bytes are a deterministic pattern without zero bytes, so no
 * emulation prevention is needed.
 */
    class TestPatternEncoder : public IEncoder {
    public:
        TestPatternEncoder() = default;

        bool configure(const EncoderSettings &settings) override;
        bool submit(const RawFrame &frame, bool force_keyframe) override;
        bool poll(EncodedFrame &out) override;
        size_t pending() const override { return out_.size(); }
        void flush() override { out_.clear(); }
        MediaKind kind() const override { return MediaKind::VIDEO; }
        const char *name() const override { return "test-pattern"; }

        uint64_t keyframes_emitted() const { return keyframes_; }
        uint64_t frames_emitted() const { return frames_; }

        /// Size of a non-keyframe access unit at the configured bitrate/fps.
        size_t target_frame_bytes() const;

    private:
        void build_access_unit(const RawFrame &frame, bool keyframe, std::vector<uint8_t> &out) const;

        EncoderSettings settings_;
        bool configured_ = false;
        bool need_keyframe_ = true;
        uint32_t since_keyframe_ = 0;
        uint64_t frames_ = 0;
        uint64_t keyframes_ = 0;
        std::deque<EncodedFrame> out_;
    };

/**
 * @brief Passes interleaved 16-bit PCM through unchanged.
 */
    class PcmAudioEncoder : public IEncoder {
    public:
        PcmAudioEncoder() = default;

        bool configure(const EncoderSettings &settings) override;
        bool submit(const RawFrame &frame, bool force_keyframe) override;
        bool poll(EncodedFrame &out) override;
        size_t pending() const override { return out_.size(); }
        void flush() override { out_.clear(); }
        MediaKind kind() const override { return MediaKind::AUDIO; }
        const char *name() const override { return "pcm"; }

    private:
        EncoderSettings settings_;
        bool configured_ = false;
        std::deque<EncodedFrame> out_;
    };

    using EncoderFactory = std::function<std::unique_ptr<IEncoder>(MediaKind)>;

    /// Factory producing TestPatternEncoder / PcmAudioEncoder.
    std::unique_ptr<IEncoder> make_default_encoder(MediaKind kind);

    class EncoderPool;

/**
 * @brief Exclusive, move-only hold on one pooled encoder.
 *
 * The slot goes back to the pool when the lease is destroyed or released.
 * The pool must outlive every lease it hands out.
 */
    class EncoderLease {
    public:
        EncoderLease() = default;
        ~EncoderLease();

        EncoderLease(EncoderLease &&other) noexcept;
        EncoderLease &operator=(EncoderLease &&other) noexcept;

        EncoderLease(const EncoderLease &) = delete;
        EncoderLease &operator=(const EncoderLease &) = delete;

        IEncoder *get() const { return encoder_; }
        IEncoder *operator->() const { return encoder_; }
        explicit operator bool() const { return encoder_ != nullptr; }

        MediaKind kind() const { return kind_; }
        void release();

    private:
        friend class EncoderPool;
        EncoderLease(EncoderPool *pool, MediaKind kind, size_t slot, IEncoder *encoder)
            : pool_(pool), kind_(kind), slot_(slot), encoder_(encoder) {}

        EncoderPool *pool_ = nullptr;
        MediaKind kind_ = MediaKind::VIDEO;
        size_t slot_ = 0;
        IEncoder *encoder_ = nullptr;
    };

/**
 * @brief Finite set of encoders shared by all sessions.
 *
 * Hardware encoders support a limited number of concurrent sessions; the
 * pool models that with a fixed slot count per media kind.
 */
    class EncoderPool {
    public:
        EncoderPool(size_t video_slots, size_t audio_slots, EncoderFactory factory = make_default_encoder);

        /// Returns an empty lease when every slot of @p kind is taken.
        EncoderLease acquire(MediaKind kind, common::SessionToken owner);

        size_t available(MediaKind kind) const;
        size_t capacity(MediaKind kind) const;

    private:
        friend class EncoderLease;
        void give_back(MediaKind kind, size_t slot);

        struct Slot {
            std::unique_ptr<IEncoder> encoder;
            common::SessionToken owner = 0;
            bool leased = false;
        };

        mutable std::mutex mtx_;
        std::vector<Slot> slots_[2];
        EncoderFactory factory_;
    };

} // namespace gamecast::media

#endif // GAMECAST_ENCODER_HPP
