/*
* @license
* (C) zachbabanov
*
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <common.hpp>
#include <logger.hpp>
#include <media.hpp>

#include <string>
#include <vector>

using namespace gamecast::common;
using namespace gamecast::media;

TEST_CASE("hton/ntoh roundtrip uint32", "[common]") {
    uint32_t v = 0x12345678;
    REQUIRE(ntoh_u32(hton_u32(v)) == v);
}

TEST_CASE("hton/ntoh roundtrip uint16", "[common]") {
    uint16_t v = 0xABCD;
    REQUIRE(ntoh_u16(hton_u16(v)) == v);
}

TEST_CASE("hton_u64 puts the most significant byte first", "[common]") {
    uint64_t net = hton_u64(0x0102030405060708ULL);
    const uint8_t *b = (const uint8_t *)&net;
    REQUIRE(b[0] == 0x01);
    REQUIRE(b[7] == 0x08);
    REQUIRE(ntoh_u64(net) == 0x0102030405060708ULL);
}

TEST_CASE("ByteWriter writes network order and ByteReader reads it back", "[common]") {
    std::vector<uint8_t> buf;
    ByteWriter w(buf);
    w.u8(0x7F);
    w.u16(0x1234);
    w.u32(0xDEADBEEF);
    w.u64(42);
    w.str("gamecast");
    REQUIRE(buf.size() == 1 + 2 + 4 + 8 + 2 + 8);
    REQUIRE(buf[1] == 0x12);
    REQUIRE(buf[2] == 0x34);

    ByteReader r(buf.data(), buf.size());
    REQUIRE(r.u8() == 0x7F);
    REQUIRE(r.u16() == 0x1234);
    REQUIRE(r.u32() == 0xDEADBEEF);
    REQUIRE(r.u64() == 42);
    REQUIRE(r.str() == "gamecast");
    REQUIRE(r.ok());
    REQUIRE(r.remaining() == 0);
}

TEST_CASE("ByteReader latches failure on short input", "[common]") {
    uint8_t buf[3] = {1, 2, 3};
    ByteReader r(buf, sizeof(buf));
    r.u32();
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.u8() == 0);
    REQUIRE(r.remaining() == 0);
}

TEST_CASE("parse_codec accepts common spellings", "[common]") {
    Codec c;
    REQUIRE(parse_codec("h264", c));
    REQUIRE(c == Codec::H264);
    REQUIRE(parse_codec("h265", c));
    REQUIRE(c == Codec::HEVC);
    REQUIRE_FALSE(parse_codec("vp9", c));
    REQUIRE(std::string(codec_name(Codec::HEVC)).size() > 0);
}

TEST_CASE("parse_level ignores case and falls back on unknown names", "[common][log]") {
    using gamecast::log::Level;
    using gamecast::log::parse_level;
    REQUIRE(parse_level("DEBUG", Level::INFO) == Level::DEBUG);
    REQUIRE(parse_level("Warning", Level::INFO) == Level::WARN);
    REQUIRE(parse_level("err", Level::INFO) == Level::ERROR);
    REQUIRE(parse_level("verbose", Level::WARN) == Level::WARN);
    // bytes above 0x7F must not reach tolower as negative values
    REQUIRE(parse_level("\xC3\x89rror", Level::INFO) == Level::INFO);
    REQUIRE(parse_level("", Level::ERROR) == Level::ERROR);
}

TEST_CASE("evaluate_offer accepts offers within capabilities", "[media]") {
    HostCapabilities caps;
    StreamParams offer;
    offer.width = 1280;
    offer.height = 720;
    offer.fps = 60;
    offer.bitrate_kbps = 10000;
    StreamParams accepted;
    REQUIRE(evaluate_offer(offer, caps, accepted) == OfferVerdict::ACCEPTED);
    REQUIRE(accepted == offer);
}

TEST_CASE("evaluate_offer clamps bitrate and min_fec_shards", "[media]") {
    HostCapabilities caps;
    StreamParams offer;
    offer.bitrate_kbps = caps.max_bitrate_kbps * 2;
    offer.min_fec_shards = (uint16_t)(caps.max_min_fec_shards + 10);
    StreamParams accepted;
    REQUIRE(evaluate_offer(offer, caps, accepted) == OfferVerdict::ACCEPTED);
    REQUIRE(accepted.bitrate_kbps == caps.max_bitrate_kbps);
    REQUIRE(accepted.min_fec_shards == caps.max_min_fec_shards);
}

TEST_CASE("evaluate_offer rejects what the host cannot deliver", "[media]") {
    HostCapabilities caps;
    StreamParams accepted;

    StreamParams codec;
    codec.codec = Codec::AV1;
    REQUIRE(evaluate_offer(codec, caps, accepted) == OfferVerdict::UNSUPPORTED_CODEC);

    StreamParams res;
    res.width = caps.max_width + 2;
    REQUIRE(evaluate_offer(res, caps, accepted) == OfferVerdict::RESOLUTION_OUT_OF_RANGE);

    StreamParams odd;
    odd.width = 1281;
    REQUIRE(evaluate_offer(odd, caps, accepted) == OfferVerdict::RESOLUTION_OUT_OF_RANGE);

    StreamParams fps;
    fps.fps = caps.max_fps + 1;
    REQUIRE(evaluate_offer(fps, caps, accepted) == OfferVerdict::FPS_OUT_OF_RANGE);

    StreamParams low;
    low.bitrate_kbps = caps.min_bitrate_kbps - 1;
    REQUIRE(evaluate_offer(low, caps, accepted) == OfferVerdict::BITRATE_OUT_OF_RANGE);

    StreamParams audio;
    audio.audio_sample_rate = 11025;
    REQUIRE(evaluate_offer(audio, caps, accepted) == OfferVerdict::AUDIO_UNSUPPORTED);

    StreamParams shard;
    shard.shard_size = 64;
    REQUIRE(evaluate_offer(shard, caps, accepted) == OfferVerdict::SHARD_SIZE_OUT_OF_RANGE);
}
