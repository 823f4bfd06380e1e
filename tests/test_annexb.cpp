/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <annexb.hpp>

#include <vector>

using namespace gamecast::common;
using namespace gamecast::media::annexb;

namespace {

    void put_nal(std::vector<uint8_t> &out, uint8_t header, size_t body, bool long_start = true) {
        if (long_start) out.push_back(0);
        out.push_back(0);
        out.push_back(0);
        out.push_back(1);
        out.push_back(header);
        for (size_t i = 0; i < body; ++i) out.push_back(0xAB);
    }

} // namespace

TEST_CASE("split finds 3- and 4-byte start codes", "[annexb]") {
    std::vector<uint8_t> au;
    put_nal(au, 0x67, 5);          // SPS
    put_nal(au, 0x68, 3, false);   // PPS, short start code
    put_nal(au, 0x65, 20);         // IDR

    std::vector<NalUnit> nals = split(au.data(), au.size(), Codec::H264);
    REQUIRE(nals.size() == 3);
    REQUIRE(nals[0].type == H264_NAL_SPS);
    REQUIRE(nals[1].type == H264_NAL_PPS);
    REQUIRE(nals[2].type == H264_NAL_IDR);
    REQUIRE(nals[0].offset == 0);
    REQUIRE(nals[0].header == 4);
    REQUIRE(nals[1].header == nals[1].offset + 3);
}

TEST_CASE("split ignores leading garbage", "[annexb]") {
    std::vector<uint8_t> au = {0x11, 0x22, 0x33};
    put_nal(au, 0x41, 8);
    std::vector<NalUnit> nals = split(au.data(), au.size(), Codec::H264);
    REQUIRE(nals.size() == 1);
    REQUIRE(nals[0].type == H264_NAL_SLICE);
    REQUIRE(nals[0].offset == 3);
}

TEST_CASE("analyze reports an H.264 keyframe with parameter sets", "[annexb]") {
    std::vector<uint8_t> key;
    put_nal(key, 0x67, 5);
    put_nal(key, 0x68, 3);
    put_nal(key, 0x65, 20);
    NalSummary s = analyze(key.data(), key.size(), Codec::H264);
    REQUIRE(s.has_parameter_sets);
    REQUIRE(s.has_idr);
    REQUIRE(s.nal_count == 3);
    REQUIRE(is_keyframe(key, Codec::H264));

    std::vector<uint8_t> delta;
    put_nal(delta, 0x41, 20);
    REQUIRE_FALSE(is_keyframe(delta, Codec::H264));
    REQUIRE_FALSE(analyze(delta.data(), delta.size(), Codec::H264).has_parameter_sets);
}

TEST_CASE("analyze needs VPS for HEVC parameter sets", "[annexb]") {
    std::vector<uint8_t> au;
    put_nal(au, (uint8_t)(HEVC_NAL_SPS << 1), 4);
    put_nal(au, (uint8_t)(HEVC_NAL_PPS << 1), 4);
    put_nal(au, (uint8_t)(HEVC_NAL_IDR_W_RADL << 1), 10);
    NalSummary s = analyze(au.data(), au.size(), Codec::HEVC);
    REQUIRE(s.has_idr);
    REQUIRE_FALSE(s.has_parameter_sets);

    std::vector<uint8_t> full;
    put_nal(full, (uint8_t)(HEVC_NAL_VPS << 1), 4);
    full.insert(full.end(), au.begin(), au.end());
    REQUIRE(analyze(full.data(), full.size(), Codec::HEVC).has_parameter_sets);
}
