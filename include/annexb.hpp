/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_ANNEXB_HPP
#define GAMECAST_ANNEXB_HPP

#pragma once

#include <common.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gamecast::media::annexb {

    struct NalUnit {
        size_t offset = 0;       // start code position
        size_t size = 0;         // start code included
        size_t header = 0;       // first byte after the start code
        uint8_t type = 0;        // codec-specific nal_unit_type
    };

    struct NalSummary {
        bool has_parameter_sets = false;   // SPS+PPS (H.264) or VPS/SPS/PPS (HEVC)
        bool has_idr = false;
        size_t nal_count = 0;
    };

    /// Bytes before the first NAL header: 3 or 4 for a start code at @p p, else 0.
    size_t start_code_length(const uint8_t *data, size_t len, size_t p);

    /**
     * @brief Split an Annex-B byte stream into NAL units.
     * Bytes before the first start code are ignored.
     */
    std::vector<NalUnit> split(const uint8_t *data, size_t len, common::Codec codec);

    /// Scans all NALs and reports parameter sets and IDR slices.
    NalSummary analyze(const uint8_t *data, size_t len, common::Codec codec);

    inline bool is_keyframe(const std::vector<uint8_t> &au, common::Codec codec) {
        return analyze(au.data(), au.size(), codec).has_idr;
    }

    // nal_unit_type values used by the test pattern encoder and the client.
    constexpr uint8_t H264_NAL_SLICE = 1;
    constexpr uint8_t H264_NAL_IDR = 5;
    constexpr uint8_t H264_NAL_SPS = 7;
    constexpr uint8_t H264_NAL_PPS = 8;

    constexpr uint8_t HEVC_NAL_TRAIL_R = 1;
    constexpr uint8_t HEVC_NAL_IDR_W_RADL = 19;
    constexpr uint8_t HEVC_NAL_VPS = 32;
    constexpr uint8_t HEVC_NAL_SPS = 33;
    constexpr uint8_t HEVC_NAL_PPS = 34;

} // namespace gamecast::media::annexb

#endif // GAMECAST_ANNEXB_HPP
