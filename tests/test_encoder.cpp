/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <annexb.hpp>
#include <encoder.hpp>

#include <memory>
#include <vector>

using namespace gamecast::common;
using namespace gamecast::media;

namespace {

    RawFrame video_frame(uint64_t index) {
        RawFrame f;
        f.kind = MediaKind::VIDEO;
        f.capture_index = index;
        f.captured_at = Clock::now();
        f.width = 64;
        f.height = 32;
        f.data = std::make_shared<const std::vector<uint8_t>>(64 * 32 * 3 / 2, 0x10);
        return f;
    }

    StreamParams small_params() {
        StreamParams p;
        p.width = 64;
        p.height = 32;
        p.fps = 30;
        p.bitrate_kbps = 600;
        return p;
    }

} // namespace

TEST_CASE("TestPatternEncoder starts with a decodable keyframe", "[encoder]") {
    TestPatternEncoder enc;
    REQUIRE(enc.configure(video_settings(small_params(), 0)));

    REQUIRE(enc.submit(video_frame(0), false));
    REQUIRE(enc.pending() == 1);
    EncodedFrame out;
    REQUIRE(enc.poll(out));
    REQUIRE(out.keyframe);
    annexb::NalSummary s = annexb::analyze(out.payload.data(), out.payload.size(), Codec::H264);
    REQUIRE(s.has_parameter_sets);
    REQUIRE(s.has_idr);

    REQUIRE(enc.submit(video_frame(1), false));
    REQUIRE(enc.poll(out));
    REQUIRE_FALSE(out.keyframe);
    REQUIRE_FALSE(annexb::is_keyframe(out.payload, Codec::H264));
    REQUIRE(out.payload.size() >= enc.target_frame_bytes());
}

TEST_CASE("TestPatternEncoder honours forced keyframes and GOP length", "[encoder]") {
    TestPatternEncoder enc;
    REQUIRE(enc.configure(video_settings(small_params(), 3)));

    std::vector<bool> keys;
    EncodedFrame out;
    for (uint64_t i = 0; i < 7; ++i) {
        REQUIRE(enc.submit(video_frame(i), i == 5));
        REQUIRE(enc.poll(out));
        keys.push_back(out.keyframe);
    }
    // 0: first frame, 3: GOP, 5: forced
    REQUIRE(keys == std::vector<bool>{true, false, false, true, false, true, false});
    REQUIRE(enc.keyframes_emitted() == 3);
}

TEST_CASE("TestPatternEncoder HEVC output carries VPS/SPS/PPS", "[encoder]") {
    StreamParams p = small_params();
    p.codec = Codec::HEVC;
    TestPatternEncoder enc;
    REQUIRE(enc.configure(video_settings(p, 0)));
    REQUIRE(enc.submit(video_frame(0), false));
    EncodedFrame out;
    REQUIRE(enc.poll(out));
    annexb::NalSummary s = annexb::analyze(out.payload.data(), out.payload.size(), Codec::HEVC);
    REQUIRE(s.has_parameter_sets);
    REQUIRE(s.has_idr);
}

TEST_CASE("TestPatternEncoder refuses bad configurations and unconfigured submits", "[encoder]") {
    TestPatternEncoder enc;
    REQUIRE_FALSE(enc.submit(video_frame(0), false));

    StreamParams p = small_params();
    p.codec = Codec::AV1;
    REQUIRE_FALSE(enc.configure(video_settings(p, 0)));

    p = small_params();
    p.bitrate_kbps = 0;
    REQUIRE_FALSE(enc.configure(video_settings(p, 0)));
}

TEST_CASE("PcmAudioEncoder passes PCM through and checks buffer size", "[encoder]") {
    StreamParams p;
    PcmAudioEncoder enc;
    REQUIRE(enc.configure(audio_settings(p)));

    RawFrame f;
    f.kind = MediaKind::AUDIO;
    f.sample_count = 480;
    f.data = std::make_shared<const std::vector<uint8_t>>(480 * p.audio_channels * 2, 0x01);
    REQUIRE(enc.submit(f, false));
    EncodedFrame out;
    REQUIRE(enc.poll(out));
    REQUIRE(out.kind == MediaKind::AUDIO);
    REQUIRE(out.payload == *f.data);

    f.sample_count = 100;
    REQUIRE_FALSE(enc.submit(f, false));
}

TEST_CASE("EncoderPool hands out each slot once and takes it back", "[encoder]") {
    EncoderPool pool(1, 2);
    REQUIRE(pool.capacity(MediaKind::VIDEO) == 1);
    REQUIRE(pool.available(MediaKind::AUDIO) == 2);

    EncoderLease a = pool.acquire(MediaKind::VIDEO, 1);
    REQUIRE(a);
    REQUIRE(a->kind() == MediaKind::VIDEO);
    REQUIRE(pool.available(MediaKind::VIDEO) == 0);

    EncoderLease b = pool.acquire(MediaKind::VIDEO, 2);
    REQUIRE_FALSE(b);

    {
        EncoderLease moved = std::move(a);
        REQUIRE_FALSE(a);
        REQUIRE(moved);
        REQUIRE(pool.available(MediaKind::VIDEO) == 0);
    }
    REQUIRE(pool.available(MediaKind::VIDEO) == 1);

    EncoderLease c = pool.acquire(MediaKind::VIDEO, 3);
    REQUIRE(c);
    c.release();
    REQUIRE_FALSE(c);
    REQUIRE(pool.available(MediaKind::VIDEO) == 1);
}

TEST_CASE("EncoderPool flushes an encoder when it is returned", "[encoder]") {
    EncoderPool pool(1, 1);
    {
        EncoderLease lease = pool.acquire(MediaKind::VIDEO, 7);
        REQUIRE(lease->configure(video_settings(small_params(), 0)));
        REQUIRE(lease->submit(video_frame(0), false));
        REQUIRE(lease->pending() == 1);
    }
    EncoderLease again = pool.acquire(MediaKind::VIDEO, 8);
    REQUIRE(again);
    REQUIRE(again->pending() == 0);
}
