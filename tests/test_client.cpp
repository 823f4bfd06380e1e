/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <annexb.hpp>
#include <client.hpp>
#include <encoder.hpp>
#include <host.hpp>
#include <player.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace gamecast::common;
using namespace gamecast::client;
using gamecast::media::EncodedFrame;
using gamecast::media::RawFrame;
using gamecast::media::StreamParams;
using gamecast::media::TestPatternEncoder;

namespace {

    std::vector<EncodedFrame> encode_frames(size_t count, Codec codec) {
        TestPatternEncoder enc;
        StreamParams p;
        p.width = 64;
        p.height = 32;
        p.fps = 30;
        p.bitrate_kbps = 500;
        p.codec = codec;
        REQUIRE(enc.configure(gamecast::media::video_settings(p, 0)));
        std::vector<EncodedFrame> out;
        for (size_t i = 0; i < count; ++i) {
            RawFrame f;
            f.kind = MediaKind::VIDEO;
            f.capture_index = i;
            f.captured_at = Clock::now();
            REQUIRE(enc.submit(f, false));
            EncodedFrame ef;
            REQUIRE(enc.poll(ef));
            out.push_back(ef);
        }
        return out;
    }

    std::vector<uint8_t> read_file(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string temp_path(const char *name) {
        return std::string("/tmp/gamecast_") + name + "_" + std::to_string((long)getpid());
    }

    // Host running its reactor on a thread of its own for the duration of a test.
    class HostRunner {
    public:
        explicit HostRunner(const gamecast::config::HostConfig &cfg) : host_(cfg) {
            REQUIRE(host_.start());
            thread_ = std::thread([this]() { host_.runLoop(); });
        }
        ~HostRunner() { stop(); }

        void stop() {
            if (!thread_.joinable()) return;
            host_.stop();
            thread_.join();
        }

        gamecast::host::StreamHost &host() { return host_; }

    private:
        gamecast::host::StreamHost host_;
        std::thread thread_;
    };

    gamecast::config::HostConfig test_host_config() {
        gamecast::config::HostConfig cfg;
        cfg.network.bind_address = "127.0.0.1";
        cfg.network.control_port = 0;
        cfg.network.media_port = 0;
        cfg.network.media_tos = -1;
        cfg.encoders.video_slots = 1;
        cfg.encoders.audio_slots = 1;
        return cfg;
    }

    gamecast::config::ClientConfig test_client_config(uint16_t port) {
        gamecast::config::ClientConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.control_port = port;
        cfg.name = "test-client";
        cfg.params.width = 320;
        cfg.params.height = 240;
        cfg.params.fps = 30;
        cfg.params.bitrate_kbps = 2000;
        cfg.heartbeat_ms = 100;
        cfg.loss_report_ms = 100;
        return cfg;
    }

} // namespace

TEST_CASE("VideoOutput starts at the first keyframe", "[client][output]") {
    std::vector<EncodedFrame> frames = encode_frames(4, Codec::H264);
    REQUIRE(frames[0].keyframe);
    REQUIRE_FALSE(frames[1].keyframe);

    std::string path = temp_path("output");
    {
        VideoOutput out(Codec::H264, path, "");
        REQUIRE(out.ok());
        REQUIRE(out.waiting_for_keyframe());

        // a delta frame alone is not decodable
        REQUIRE(out.write_frame(frames[1].payload));
        REQUIRE(out.frames_skipped() == 1);
        REQUIRE(out.frames_written() == 0);

        REQUIRE_FALSE(out.write_frame(frames[0].payload));
        REQUIRE_FALSE(out.write_frame(frames[2].payload));
        REQUIRE_FALSE(out.waiting_for_keyframe());
        REQUIRE(out.frames_written() == 2);
    }

    std::vector<uint8_t> expected = frames[0].payload;
    expected.insert(expected.end(), frames[2].payload.begin(), frames[2].payload.end());
    REQUIRE(read_file(path) == expected);
    std::remove(path.c_str());
}

TEST_CASE("VideoOutput reports an unopenable file", "[client][output]") {
    VideoOutput out(Codec::HEVC, "/nonexistent-dir/out.h265", "");
    REQUIRE_FALSE(out.ok());
}

TEST_CASE("PlayerProcess feeds a child process through a pipe", "[client][player]") {
    auto p = PlayerProcess::launch("sh", Codec::H264, {"-c", "cat > /dev/null"});
    REQUIRE(p);
    REQUIRE(p->get_write_fd() >= 0);

    const uint8_t data[] = {0x00, 0x00, 0x00, 0x01, 0x67};
    REQUIRE(p->write_data(data, sizeof(data)) == (ssize_t)sizeof(data));
    p->stop();
    REQUIRE(p->get_write_fd() < 0);
    REQUIRE(p->write_data(data, sizeof(data)) < 0);
}

TEST_CASE("StreamClient negotiates, streams and tears down", "[client][host]") {
    HostRunner runner(test_host_config());
    std::string path = temp_path("session");

    gamecast::config::ClientConfig cfg = test_client_config(runner.host().control_port());
    cfg.output_file = path;
    StreamClient client(cfg);

    size_t callbacks = 0;
    client.set_frame_callback([&](const gamecast::fec::ReassembledFrame &) { ++callbacks; });

    REQUIRE(client.connect());
    REQUIRE(client.local_media_port() != 0);
    REQUIRE(client.secure());
    REQUIRE(gamecast::tls::fingerprint_matches(runner.host().tls_fingerprint(), client.host_fingerprint()));
    REQUIRE(client.negotiate());
    REQUIRE(client.token() != 0);
    REQUIRE(client.host_media_port() == runner.host().media_port());
    REQUIRE(client.params().width == 320);
    REQUIRE(client.playing());

    client.run_for(std::chrono::milliseconds(600));
    REQUIRE(client.alive());
    REQUIRE(client.stats().video_frames > 0);
    REQUIRE(client.stats().audio_frames > 0);
    REQUIRE(client.stats().datagrams_invalid == 0);
    REQUIRE(client.stats().heartbeats_sent > 0);
    REQUIRE(client.stats().loss_reports_sent > 0);
    REQUIRE(callbacks == client.stats().video_frames + client.stats().audio_frames);
    REQUIRE(client.output() != nullptr);
    REQUIRE(client.output()->frames_written() > 0);

    REQUIRE(client.pause());
    REQUIRE_FALSE(client.playing());
    REQUIRE(client.play());

    StreamParams p = client.params();
    p.width = 640;
    p.height = 480;
    REQUIRE(client.reconfigure(p));
    REQUIRE(client.params().width == 640);

    // sealed with the key from the ANSWER
    REQUIRE(client.send_input(gamecast::input::InputDevice::KEYBOARD, 30, 1));
    REQUIRE(client.send_input(gamecast::input::InputDevice::KEYBOARD, 30, 0));
    REQUIRE(client.send_feedback());
    client.run_for(std::chrono::milliseconds(200));

    REQUIRE(client.teardown("test done"));
    REQUIRE_FALSE(client.alive());

    runner.stop();
    REQUIRE(runner.host().input().received() == 2);
    REQUIRE(runner.host().session_count() == 0);
    REQUIRE(runner.host().encoders().available(MediaKind::VIDEO) == 1);

    std::vector<uint8_t> dump = read_file(path);
    REQUIRE_FALSE(dump.empty());
    gamecast::media::annexb::NalSummary s = gamecast::media::annexb::analyze(dump.data(), dump.size(), Codec::H264);
    REQUIRE(s.has_parameter_sets);
    REQUIRE(s.has_idr);
    std::remove(path.c_str());
}

TEST_CASE("StreamClient reports an offer the host cannot serve", "[client][host]") {
    HostRunner runner(test_host_config());
    gamecast::config::ClientConfig cfg = test_client_config(runner.host().control_port());
    cfg.params.codec = Codec::AV1;
    StreamClient client(cfg);

    REQUIRE(client.connect());
    REQUIRE_FALSE(client.negotiate());
    REQUIRE(client.last_reject() == gamecast::proto::RejectReason::INCOMPATIBLE_PARAMS);
    REQUIRE_FALSE(client.alive());
}

TEST_CASE("StreamClient sees a full host", "[client][host]") {
    gamecast::config::HostConfig hcfg = test_host_config();
    hcfg.network.max_sessions = 1;
    HostRunner runner(hcfg);

    StreamClient first(test_client_config(runner.host().control_port()));
    REQUIRE(first.connect());
    REQUIRE(first.negotiate());

    StreamClient second(test_client_config(runner.host().control_port()));
    REQUIRE(second.connect());
    REQUIRE_FALSE(second.negotiate());
    REQUIRE(second.last_reject() == gamecast::proto::RejectReason::HOST_FULL);
    REQUIRE_FALSE(second.alive());

    REQUIRE(first.teardown("done"));
}

TEST_CASE("StreamClient pins the host certificate", "[client][host][tls]") {
    HostRunner runner(test_host_config());
    const std::string fp = runner.host().tls_fingerprint();
    REQUIRE_FALSE(fp.empty());

    gamecast::config::ClientConfig cfg = test_client_config(runner.host().control_port());
    cfg.tls.pinned_fingerprint = fp;
    StreamClient pinned(cfg);
    REQUIRE(pinned.connect());
    REQUIRE(pinned.negotiate());
    REQUIRE(pinned.teardown("done"));

    // any other certificate is refused before a single control message
    std::string wrong = fp;
    wrong[0] = wrong[0] == 'A' ? 'B' : 'A';
    cfg.tls.pinned_fingerprint = wrong;
    StreamClient mismatched(cfg);
    REQUIRE_FALSE(mismatched.connect());
    REQUIRE_FALSE(mismatched.alive());
}

TEST_CASE("StreamClient and host agree on a plain control channel", "[client][host][tls]") {
    gamecast::config::HostConfig hcfg = test_host_config();
    hcfg.tls.enabled = false;
    HostRunner runner(hcfg);
    REQUIRE(runner.host().tls_fingerprint().empty());

    gamecast::config::ClientConfig cfg = test_client_config(runner.host().control_port());
    cfg.tls.enabled = false;
    StreamClient client(cfg);
    REQUIRE(client.connect());
    REQUIRE_FALSE(client.secure());
    REQUIRE(client.negotiate());
    REQUIRE(client.send_input(gamecast::input::InputDevice::MOUSE_BUTTON, 1, 1));
    client.run_for(std::chrono::milliseconds(200));
    REQUIRE(client.teardown("done"));

    runner.stop();
    REQUIRE(runner.host().input().received() == 1);
}

TEST_CASE("a plain client gets nowhere with a TLS host", "[client][host][tls]") {
    HostRunner runner(test_host_config());
    gamecast::config::ClientConfig cfg = test_client_config(runner.host().control_port());
    cfg.tls.enabled = false;
    StreamClient client(cfg);
    REQUIRE(client.connect());
    REQUIRE_FALSE(client.negotiate());
    REQUIRE(client.token() == 0);
}

TEST_CASE("StreamClient fails to connect to a closed port", "[client]") {
    gamecast::config::ClientConfig cfg = test_client_config(1);
    cfg.connect_timeout_ms = 500;
    StreamClient client(cfg);
    REQUIRE_FALSE(client.connect());
    REQUIRE_FALSE(client.alive());
}
