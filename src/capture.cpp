/*
* @license
* (C) zachbabanov
*
*/

#include <capture.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cmath>

using namespace gamecast::common;

namespace gamecast::capture {

namespace {

    constexpr size_t MAX_FRAMES_PER_POLL = 8;
    constexpr double TONE_HZ = 440.0;
    constexpr double PI = 3.14159265358979323846;

    Clock::duration frame_interval(uint32_t fps) {
        return std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(1000000000LL / std::max<uint32_t>(1, fps)));
    }

    std::shared_ptr<const std::vector<uint8_t>> make_test_card(uint32_t width, uint32_t height) {
        auto buf = std::make_shared<std::vector<uint8_t>>((size_t)width * height * 3 / 2);
        uint8_t *y = buf->data();
        for (uint32_t row = 0; row < height; ++row) {
            for (uint32_t col = 0; col < width; ++col) {
                y[(size_t)row * width + col] = (uint8_t)((row + col) & 0xFF);
            }
        }
        std::fill(buf->begin() + (std::ptrdiff_t)((size_t)width * height), buf->end(), (uint8_t)0x80);
        return buf;
    }

} // namespace

    CaptureSettings video_capture_settings(const media::StreamParams &p) {
        CaptureSettings s;
        s.kind = MediaKind::VIDEO;
        s.width = p.width;
        s.height = p.height;
        s.fps = p.fps;
        return s;
    }

    CaptureSettings audio_capture_settings(const media::StreamParams &p) {
        CaptureSettings s;
        s.kind = MediaKind::AUDIO;
        s.sample_rate = p.audio_sample_rate;
        s.channels = p.audio_channels;
        return s;
    }

    bool formats_compatible(const CaptureSettings &open, const CaptureSettings &want) {
        if (open.kind != want.kind) return false;
        if (open.kind == MediaKind::VIDEO) return true;
        return open.sample_rate == want.sample_rate && open.channels == want.channels &&
               open.audio_chunk_ms == want.audio_chunk_ms;
    }

    bool SyntheticVideoSource::start(const CaptureSettings &settings, TimePoint now) {
        if (settings.width == 0 || settings.height == 0 || settings.fps == 0) {
            LOG_VIDEO_ERROR("synthetic video: invalid mode {}x{}@{}", settings.width, settings.height, settings.fps);
            return false;
        }
        settings_ = settings;
        pixels_ = make_test_card(settings.width, settings.height);
        next_due_ = now;
        running_ = true;
        fail_next_ = false;
        LOG_VIDEO_INFO("synthetic video capture started {}x{}@{}", settings.width, settings.height, settings.fps);
        return true;
    }

    PollStatus SyntheticVideoSource::poll(TimePoint now, media::RawFrame &out) {
        if (!running_) return PollStatus::NONE;
        if (fail_next_) {
            fail_next_ = false;
            running_ = false;
            LOG_VIDEO_WARN("synthetic video capture lost");
            return PollStatus::FAILED;
        }
        if (now < next_due_) return PollStatus::NONE;

        out = media::RawFrame();
        out.kind = MediaKind::VIDEO;
        out.capture_index = index_++;
        out.captured_at = now;
        out.width = settings_.width;
        out.height = settings_.height;
        out.data = pixels_;

        // native cadence: a late poll does not produce a backlog of frames
        next_due_ += frame_interval(settings_.fps);
        if (next_due_ <= now) next_due_ = now + frame_interval(settings_.fps);
        return PollStatus::FRAME;
    }

    bool SyntheticVideoSource::reconfigure(const CaptureSettings &settings, TimePoint now) {
        if (settings.width == 0 || settings.height == 0 || settings.fps == 0) return false;
        settings_ = settings;
        pixels_ = make_test_card(settings.width, settings.height);
        next_due_ = now;
        LOG_VIDEO_INFO("synthetic video capture reconfigured {}x{}@{}", settings.width, settings.height, settings.fps);
        return true;
    }

    void SyntheticVideoSource::stop() {
        running_ = false;
        pixels_.reset();
    }

    bool SyntheticAudioSource::start(const CaptureSettings &settings, TimePoint now) {
        if (settings.sample_rate == 0 || settings.channels == 0 || settings.audio_chunk_ms == 0) {
            LOG_AUDIO_ERROR("synthetic audio: invalid format {}Hz {}ch", settings.sample_rate, settings.channels);
            return false;
        }
        settings_ = settings;
        next_due_ = now;
        running_ = true;
        LOG_AUDIO_INFO("synthetic audio capture started {}Hz {}ch chunk={}ms",
                       settings.sample_rate, settings.channels, settings.audio_chunk_ms);
        return true;
    }

    PollStatus SyntheticAudioSource::poll(TimePoint now, media::RawFrame &out) {
        if (!running_ || now < next_due_) return PollStatus::NONE;

        const auto chunk = std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(settings_.audio_chunk_ms));
        // more than a few chunks behind: resync instead of bursting
        if (now - next_due_ > chunk * 10) next_due_ = now;

        const uint32_t samples = settings_.sample_rate * settings_.audio_chunk_ms / 1000;
        auto pcm = std::make_shared<std::vector<uint8_t>>((size_t)samples * settings_.channels * 2);
        uint8_t *p = pcm->data();
        for (uint32_t i = 0; i < samples; ++i) {
            double t = (double)(sample_pos_ + i) / (double)settings_.sample_rate;
            int16_t v = (int16_t)(std::sin(2.0 * PI * TONE_HZ * t) * 8000.0);
            for (uint16_t c = 0; c < settings_.channels; ++c) {
                *p++ = (uint8_t)(v & 0xFF);
                *p++ = (uint8_t)((v >> 8) & 0xFF);
            }
        }
        sample_pos_ += samples;

        out = media::RawFrame();
        out.kind = MediaKind::AUDIO;
        out.capture_index = index_++;
        out.captured_at = next_due_;
        out.sample_count = samples;
        out.data = pcm;

        next_due_ += chunk;
        return PollStatus::FRAME;
    }

    bool SyntheticAudioSource::reconfigure(const CaptureSettings &settings, TimePoint now) {
        if (settings.sample_rate == 0 || settings.channels == 0 || settings.audio_chunk_ms == 0) return false;
        settings_ = settings;
        next_due_ = now;
        return true;
    }

    void SyntheticAudioSource::stop() {
        running_ = false;
    }

    std::unique_ptr<ICaptureSource> make_synthetic_source(MediaKind kind) {
        if (kind == MediaKind::AUDIO) return std::make_unique<SyntheticAudioSource>();
        return std::make_unique<SyntheticVideoSource>();
    }

    CaptureSubscription::~CaptureSubscription() {
        reset();
    }

    CaptureSubscription::CaptureSubscription(CaptureSubscription &&other) noexcept
        : hub_(other.hub_), device_(std::move(other.device_)), sink_(other.sink_) {
        other.hub_ = nullptr;
        other.sink_ = nullptr;
    }

    CaptureSubscription &CaptureSubscription::operator=(CaptureSubscription &&other) noexcept {
        if (this != &other) {
            reset();
            hub_ = other.hub_;
            device_ = std::move(other.device_);
            sink_ = other.sink_;
            other.hub_ = nullptr;
            other.sink_ = nullptr;
        }
        return *this;
    }

    void CaptureSubscription::reset() {
        if (hub_) hub_->unsubscribe(device_, sink_);
        hub_ = nullptr;
        sink_ = nullptr;
    }

    CaptureHub::CaptureHub(SourceFactory factory, uint32_t max_restarts)
        : factory_(factory), max_restarts_(max_restarts) {}

    CaptureHub::~CaptureHub() {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &kv : devices_) {
            if (kv.second.source) kv.second.source->stop();
        }
    }

    CaptureSubscription CaptureHub::subscribe(const std::string &device, const CaptureSettings &settings,
                                              ICaptureSink *sink, TimePoint now) {
        if (!sink) return CaptureSubscription();
        std::lock_guard<std::mutex> lk(mtx_);

        auto it = devices_.find(device);
        if (it == devices_.end()) {
            Device d;
            d.source = factory_ ? factory_(settings.kind) : nullptr;
            if (!d.source) {
                LOG_PIPE_ERROR("no capture backend for device '{}'", device);
                return CaptureSubscription();
            }
            if (!d.source->start(settings, now)) {
                LOG_PIPE_ERROR("capture device '{}' failed to start", device);
                return CaptureSubscription();
            }
            d.settings = settings;
            it = devices_.emplace(device, std::move(d)).first;
            LOG_PIPE_INFO("capture device '{}' opened ({})", device, it->second.source->name());
        } else if (it->second.settings.kind != settings.kind) {
            LOG_PIPE_ERROR("capture device '{}' is {}, requested {}", device,
                           media_kind_name(it->second.settings.kind), media_kind_name(settings.kind));
            return CaptureSubscription();
        } else if (it->second.failed) {
            LOG_PIPE_WARN("capture device '{}' is in failed state", device);
            return CaptureSubscription();
        } else if (!formats_compatible(it->second.settings, settings)) {
            const CaptureSettings &open = it->second.settings;
            LOG_PIPE_WARN("capture device '{}' runs {}Hz {}ch {}ms, requested {}Hz {}ch {}ms", device,
                          open.sample_rate, open.channels, open.audio_chunk_ms,
                          settings.sample_rate, settings.channels, settings.audio_chunk_ms);
            return CaptureSubscription();
        }

        it->second.sinks.push_back(sink);
        LOG_PIPE_DEBUG("capture device '{}' now has {} subscriber(s)", device, (unsigned)it->second.sinks.size());
        return CaptureSubscription(this, device, sink);
    }

    void CaptureHub::unsubscribe(const std::string &device, ICaptureSink *sink) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        if (it == devices_.end()) return;
        auto &sinks = it->second.sinks;
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
        if (sinks.empty()) {
            if (it->second.source) it->second.source->stop();
            LOG_PIPE_INFO("capture device '{}' closed (no subscribers)", device);
            devices_.erase(it);
        }
    }

    bool CaptureHub::reconfigure(const std::string &device, ICaptureSink *sink, const CaptureSettings &settings,
                                 TimePoint now) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        if (it == devices_.end()) return false;
        Device &d = it->second;
        if (d.sinks.size() != 1 || d.sinks.front() != sink) {
            LOG_PIPE_INFO("capture device '{}' shared by {} sessions, keeping its mode", device, (unsigned)d.sinks.size());
            return false;
        }
        if (!d.source->reconfigure(settings, now)) {
            LOG_PIPE_WARN("capture device '{}' refused reconfiguration", device);
            return false;
        }
        d.settings = settings;
        return true;
    }

    bool CaptureHub::can_deliver(const std::string &device, ICaptureSink *sink, const CaptureSettings &settings) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        if (it == devices_.end()) return true;
        const Device &d = it->second;
        if (formats_compatible(d.settings, settings)) return true;
        return d.sinks.size() == 1 && d.sinks.front() == sink;
    }

    CaptureSettings CaptureHub::settings(const std::string &device) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        return it == devices_.end() ? CaptureSettings() : it->second.settings;
    }

    size_t CaptureHub::poll(TimePoint now) {
        std::lock_guard<std::mutex> lk(mtx_);
        size_t delivered = 0;
        for (auto &kv : devices_) {
            Device &d = kv.second;
            if (d.failed) continue;

            for (size_t n = 0; n < MAX_FRAMES_PER_POLL; ++n) {
                media::RawFrame frame;
                PollStatus st = d.source->poll(now, frame);
                if (st == PollStatus::NONE) break;
                if (st == PollStatus::FRAME) {
                    d.restarts = 0;
                    for (ICaptureSink *sink : d.sinks) sink->on_captured(frame);
                    ++delivered;
                    continue;
                }

                // FAILED: bounded restart, then give up and tell the subscribers
                if (d.restarts < max_restarts_ && d.source->start(d.settings, now)) {
                    ++d.restarts;
                    LOG_PIPE_WARN("capture device '{}' restarted (attempt {}/{})", kv.first, d.restarts, max_restarts_);
                    break;
                }
                d.failed = true;
                d.source->stop();
                LOG_PIPE_ERROR("capture device '{}' failed after {} restart(s)", kv.first, d.restarts);
                std::string reason = "capture device '" + kv.first + "' failed";
                for (ICaptureSink *sink : d.sinks) sink->on_capture_failed(d.settings.kind, reason);
                break;
            }
        }
        return delivered;
    }

    size_t CaptureHub::subscriber_count(const std::string &device) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        return it == devices_.end() ? 0 : it->second.sinks.size();
    }

    size_t CaptureHub::device_count() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return devices_.size();
    }

    ICaptureSource *CaptureHub::source(const std::string &device) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = devices_.find(device);
        return it == devices_.end() ? nullptr : it->second.source.get();
    }

} // namespace gamecast::capture
