/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_CAPTURE_HPP
#define GAMECAST_CAPTURE_HPP

#pragma once

#include <common.hpp>
#include <media.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace gamecast::capture {

    using common::MediaKind;
    using common::TimePoint;

    struct CaptureSettings {
        MediaKind kind = MediaKind::VIDEO;
        uint32_t width = 1920;
        uint32_t height = 1080;
        uint32_t fps = 60;
        uint32_t sample_rate = 48000;
        uint16_t channels = 2;
        uint32_t audio_chunk_ms = 10;
    };

    CaptureSettings video_capture_settings(const media::StreamParams &p);
    CaptureSettings audio_capture_settings(const media::StreamParams &p);

    /**
     * @brief Whether a subscriber wanting @p want can share a device running @p open.
     *
     * Video is scaled by the encoder, so any mode of the same kind will do.
     * PCM buffers go to the encoder as they are: sample rate, channel count and
     * chunk length must all match.
     */
    bool formats_compatible(const CaptureSettings &open, const CaptureSettings &want);

    enum class PollStatus {
        NONE,       // nothing due yet
        FRAME,      // out was filled
        FAILED      // backend lost; start() again to recover
    };

/**
 * @brief One capture backend (display grabber, audio loopback, ...).
 *
 * poll() is non-blocking and paced by @p now, so the host reactor can drive
 * any number of sources from a single thread.
 */
    class ICaptureSource {
    public:
        virtual ~ICaptureSource() = default;

        virtual bool start(const CaptureSettings &settings, TimePoint now) = 0;
        virtual PollStatus poll(TimePoint now, media::RawFrame &out) = 0;
        virtual bool reconfigure(const CaptureSettings &settings, TimePoint now) = 0;
        virtual void stop() = 0;

        virtual MediaKind kind() const = 0;
        virtual const char *name() const = 0;
    };

/**
 * @brief Receives captured frames. Implementations must only enqueue.
 */
    class ICaptureSink {
    public:
        virtual ~ICaptureSink() = default;
        virtual void on_captured(const media::RawFrame &frame) = 0;
        virtual void on_capture_failed(MediaKind kind, const std::string &reason) = 0;
    };

/**
 * @brief Gradient test card, one frame per 1/fps.
 *
 * Pixel memory (NV12) is allocated once per configuration and shared by
 * every frame; frames differ only in capture_index/captured_at.
 */
    class SyntheticVideoSource : public ICaptureSource {
    public:
        SyntheticVideoSource() = default;

        bool start(const CaptureSettings &settings, TimePoint now) override;
        PollStatus poll(TimePoint now, media::RawFrame &out) override;
        bool reconfigure(const CaptureSettings &settings, TimePoint now) override;
        void stop() override;
        MediaKind kind() const override { return MediaKind::VIDEO; }
        const char *name() const override { return "synthetic-video"; }

        /// Test hook: the next poll reports a backend failure.
        void inject_failure() { fail_next_ = true; }

    private:
        CaptureSettings settings_;
        std::shared_ptr<const std::vector<uint8_t>> pixels_;
        TimePoint next_due_{};
        uint64_t index_ = 0;
        bool running_ = false;
        bool fail_next_ = false;
    };

/**
 * @brief 440 Hz sine, interleaved s16, audio_chunk_ms per buffer.
 */
    class SyntheticAudioSource : public ICaptureSource {
    public:
        SyntheticAudioSource() = default;

        bool start(const CaptureSettings &settings, TimePoint now) override;
        PollStatus poll(TimePoint now, media::RawFrame &out) override;
        bool reconfigure(const CaptureSettings &settings, TimePoint now) override;
        void stop() override;
        MediaKind kind() const override { return MediaKind::AUDIO; }
        const char *name() const override { return "synthetic-audio"; }

    private:
        CaptureSettings settings_;
        TimePoint next_due_{};
        uint64_t index_ = 0;
        uint64_t sample_pos_ = 0;
        bool running_ = false;
    };

    using SourceFactory = std::unique_ptr<ICaptureSource> (*)(MediaKind kind);
    std::unique_ptr<ICaptureSource> make_synthetic_source(MediaKind kind);

    class CaptureHub;

/**
 * @brief RAII subscription to a shared capture device.
 */
    class CaptureSubscription {
    public:
        CaptureSubscription() = default;
        ~CaptureSubscription();

        CaptureSubscription(CaptureSubscription &&other) noexcept;
        CaptureSubscription &operator=(CaptureSubscription &&other) noexcept;

        CaptureSubscription(const CaptureSubscription &) = delete;
        CaptureSubscription &operator=(const CaptureSubscription &) = delete;

        explicit operator bool() const { return hub_ != nullptr; }
        const std::string &device() const { return device_; }
        void reset();

    private:
        friend class CaptureHub;
        CaptureSubscription(CaptureHub *hub, std::string device, ICaptureSink *sink)
            : hub_(hub), device_(std::move(device)), sink_(sink) {}

        CaptureHub *hub_ = nullptr;
        std::string device_;
        ICaptureSink *sink_ = nullptr;
    };

/**
 * @brief One capture source per device name, fanned out to every subscriber.
 *
 * The first subscriber starts the source with its settings, the last one to
 * leave stops it. Frames are delivered read-only; the raw data is shared.
 */
    class CaptureHub {
    public:
        explicit CaptureHub(SourceFactory factory = make_synthetic_source, uint32_t max_restarts = 3);
        ~CaptureHub();

        CaptureHub(const CaptureHub &) = delete;
        CaptureHub &operator=(const CaptureHub &) = delete;

        /// Returns an empty subscription when the device cannot be started or runs an incompatible format.
        CaptureSubscription subscribe(const std::string &device, const CaptureSettings &settings,
                                      ICaptureSink *sink, TimePoint now);

        /**
         * @brief Change device parameters on behalf of @p sink.
         * @return false when other subscribers share the device or the backend refuses.
         */
        bool reconfigure(const std::string &device, ICaptureSink *sink, const CaptureSettings &settings, TimePoint now);

        /// True when @p sink could get @p settings: the device already runs a compatible format or @p sink is alone on it.
        bool can_deliver(const std::string &device, ICaptureSink *sink, const CaptureSettings &settings) const;

        /// Settings the device currently runs with; default settings when it is not open.
        CaptureSettings settings(const std::string &device) const;

        /// Pull due frames from every device and deliver them. Returns frames delivered.
        size_t poll(TimePoint now);

        size_t subscriber_count(const std::string &device) const;
        size_t device_count() const;

        /// Direct access for tests and diagnostics.
        ICaptureSource *source(const std::string &device) const;

    private:
        friend class CaptureSubscription;
        void unsubscribe(const std::string &device, ICaptureSink *sink);

        struct Device {
            std::unique_ptr<ICaptureSource> source;
            CaptureSettings settings;
            std::vector<ICaptureSink *> sinks;
            uint32_t restarts = 0;
            bool failed = false;     // restarts exhausted, subscribers notified
        };

        mutable std::mutex mtx_;
        std::map<std::string, Device> devices_;
        SourceFactory factory_;
        uint32_t max_restarts_;
    };

} // namespace gamecast::capture

#endif // GAMECAST_CAPTURE_HPP
