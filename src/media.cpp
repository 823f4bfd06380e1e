/*
* @license
* (C) zachbabanov
*
*/

#include <media.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace gamecast::media {

    std::string StreamParams::describe() const {
        return fmt::format("{}x{}@{} {} {}kbps audio={}Hz/{}ch shard={} min_fec={}",
                           width, height, fps, common::codec_name(codec), bitrate_kbps,
                           audio_sample_rate, audio_channels, shard_size, min_fec_shards);
    }

    const char *verdict_name(OfferVerdict v) {
        switch (v) {
            case OfferVerdict::ACCEPTED: return "accepted";
            case OfferVerdict::UNSUPPORTED_CODEC: return "unsupported codec";
            case OfferVerdict::RESOLUTION_OUT_OF_RANGE: return "resolution out of range";
            case OfferVerdict::FPS_OUT_OF_RANGE: return "frame rate out of range";
            case OfferVerdict::BITRATE_OUT_OF_RANGE: return "bitrate out of range";
            case OfferVerdict::AUDIO_UNSUPPORTED: return "audio format unsupported";
            case OfferVerdict::SHARD_SIZE_OUT_OF_RANGE: return "shard size out of range";
        }
        return "unknown";
    }

    OfferVerdict evaluate_offer(const StreamParams &offered, const HostCapabilities &caps, StreamParams &accepted) {
        if (std::find(caps.codecs.begin(), caps.codecs.end(), offered.codec) == caps.codecs.end())
            return OfferVerdict::UNSUPPORTED_CODEC;
        // Even dimensions: 4:2:0 chroma subsampling needs them.
        if (offered.width == 0 || offered.height == 0 ||
            offered.width > caps.max_width || offered.height > caps.max_height ||
            (offered.width % 2) != 0 || (offered.height % 2) != 0)
            return OfferVerdict::RESOLUTION_OUT_OF_RANGE;
        if (offered.fps == 0 || offered.fps > caps.max_fps)
            return OfferVerdict::FPS_OUT_OF_RANGE;
        if (offered.bitrate_kbps < caps.min_bitrate_kbps)
            return OfferVerdict::BITRATE_OUT_OF_RANGE;
        if (offered.audio_channels == 0 || offered.audio_channels > caps.max_audio_channels ||
            std::find(caps.audio_sample_rates.begin(), caps.audio_sample_rates.end(), offered.audio_sample_rate) == caps.audio_sample_rates.end())
            return OfferVerdict::AUDIO_UNSUPPORTED;
        if (offered.shard_size < caps.min_shard_size || offered.shard_size > caps.max_shard_size)
            return OfferVerdict::SHARD_SIZE_OUT_OF_RANGE;

        accepted = offered;
        accepted.bitrate_kbps = std::min(offered.bitrate_kbps, caps.max_bitrate_kbps);
        accepted.min_fec_shards = std::max<uint16_t>(1, std::min(offered.min_fec_shards, caps.max_min_fec_shards));
        return OfferVerdict::ACCEPTED;
    }

} // namespace gamecast::media
