/*
* @license
* (C) zachbabanov
*
*/

#include <annexb.hpp>

#include <utility>

namespace gamecast::media::annexb {

    size_t start_code_length(const uint8_t *data, size_t len, size_t p) {
        if (p + 3 < len && data[p] == 0x00 && data[p+1] == 0x00 && data[p+2] == 0x00 && data[p+3] == 0x01)
            return 4;
        if (p + 2 < len && data[p] == 0x00 && data[p+1] == 0x00 && data[p+2] == 0x01)
            return 3;
        return 0;
    }

    std::vector<NalUnit> split(const uint8_t *data, size_t len, common::Codec codec) {
        std::vector<NalUnit> nals;
        if (!data || len < 4) return nals;

        // collect start positions first, a NAL ends where the next start code begins
        std::vector<std::pair<size_t, size_t>> starts;   // (offset, start code length)
        for (size_t p = 0; p + 2 < len; ++p) {
            size_t sc = start_code_length(data, len, p);
            if (sc == 0) continue;
            starts.emplace_back(p, sc);
            p += sc - 1;
        }

        for (size_t i = 0; i < starts.size(); ++i) {
            size_t begin = starts[i].first;
            size_t header = begin + starts[i].second;
            size_t end = (i + 1 < starts.size()) ? starts[i + 1].first : len;
            if (header >= end) continue;

            NalUnit nal;
            nal.offset = begin;
            nal.size = end - begin;
            nal.header = header;
            if (codec == common::Codec::HEVC) {
                nal.type = (uint8_t)((data[header] >> 1) & 0x3F);
            } else {
                nal.type = (uint8_t)(data[header] & 0x1F);
            }
            nals.push_back(nal);
        }
        return nals;
    }

    NalSummary analyze(const uint8_t *data, size_t len, common::Codec codec) {
        NalSummary s;
        bool sps = false, pps = false, vps = false;
        for (const NalUnit &nal : split(data, len, codec)) {
            ++s.nal_count;
            if (codec == common::Codec::HEVC) {
                if (nal.type == HEVC_NAL_VPS) vps = true;
                if (nal.type == HEVC_NAL_SPS) sps = true;
                if (nal.type == HEVC_NAL_PPS) pps = true;
                // IDR_W_RADL (19) and IDR_N_LP (20)
                if (nal.type == HEVC_NAL_IDR_W_RADL || nal.type == HEVC_NAL_IDR_W_RADL + 1) s.has_idr = true;
            } else {
                if (nal.type == H264_NAL_SPS) sps = true;
                if (nal.type == H264_NAL_PPS) pps = true;
                if (nal.type == H264_NAL_IDR) s.has_idr = true;
            }
        }
        s.has_parameter_sets = sps && pps && (codec != common::Codec::HEVC || vps);
        return s;
    }

} // namespace gamecast::media::annexb
