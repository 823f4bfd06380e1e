/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_MEDIA_HPP
#define GAMECAST_MEDIA_HPP

#pragma once

#include <common.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gamecast::media {

    using common::Codec;
    using common::MediaKind;

/**
 * @brief Parameters negotiated for one session.
 *
 * shard_size and min_fec_shards are negotiated alongside the media
 * parameters so the client can size its receive buffers.
 */
    struct StreamParams {
        uint32_t width = 1920;
        uint32_t height = 1080;
        uint32_t fps = 60;
        uint32_t bitrate_kbps = 20000;
        Codec codec = Codec::H264;
        uint32_t audio_sample_rate = 48000;
        uint16_t audio_channels = 2;
        uint16_t shard_size = 1280;
        uint16_t min_fec_shards = 1;

        bool operator==(const StreamParams &o) const {
            return width == o.width && height == o.height && fps == o.fps &&
                   bitrate_kbps == o.bitrate_kbps && codec == o.codec &&
                   audio_sample_rate == o.audio_sample_rate && audio_channels == o.audio_channels &&
                   shard_size == o.shard_size && min_fec_shards == o.min_fec_shards;
        }
        bool operator!=(const StreamParams &o) const { return !(*this == o); }

        std::string describe() const;
    };

/**
 * @brief What this host can deliver. Offers are checked against it.
 */
    struct HostCapabilities {
        uint32_t max_width = 3840;
        uint32_t max_height = 2160;
        uint32_t max_fps = 144;
        uint32_t max_bitrate_kbps = 150000;
        uint32_t min_bitrate_kbps = 500;
        std::vector<Codec> codecs{Codec::H264, Codec::HEVC};
        std::vector<uint32_t> audio_sample_rates{48000};
        uint16_t max_audio_channels = 8;
        uint16_t min_shard_size = 256;
        uint16_t max_shard_size = 1400;
        uint16_t max_min_fec_shards = 16;
    };

    enum class OfferVerdict {
        ACCEPTED,
        UNSUPPORTED_CODEC,
        RESOLUTION_OUT_OF_RANGE,
        FPS_OUT_OF_RANGE,
        BITRATE_OUT_OF_RANGE,
        AUDIO_UNSUPPORTED,
        SHARD_SIZE_OUT_OF_RANGE
    };

    const char *verdict_name(OfferVerdict v);

    /**
     * @brief Check @p offered against @p caps.
     *
     * Bitrate above the ceiling is clamped rather than rejected, and a
     * min_fec_shards above the host limit is clamped too; everything else
     * outside the capability set is a rejection. @p accepted receives the
     * parameter set the host will actually use.
     */
    OfferVerdict evaluate_offer(const StreamParams &offered, const HostCapabilities &caps, StreamParams &accepted);

/**
 * @brief One raw captured unit: a video frame or an audio buffer.
 *
 * Pixel/sample memory is shared read-only, so one capture can be fanned out
 * to several sessions without copying.
 */
    struct RawFrame {
        MediaKind kind = MediaKind::VIDEO;
        uint64_t capture_index = 0;      // per-source counter
        common::TimePoint captured_at{};
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t sample_count = 0;       // audio samples per channel
        std::shared_ptr<const std::vector<uint8_t>> data;
    };

/**
 * @brief One access unit produced by an encoder.
 */
    struct EncodedFrame {
        uint64_t frame_seq = 0;
        MediaKind kind = MediaKind::VIDEO;
        uint64_t capture_ts_us = 0;
        common::TimePoint captured_at{};
        bool keyframe = false;
        std::vector<uint8_t> payload;
    };

} // namespace gamecast::media

#endif // GAMECAST_MEDIA_HPP
