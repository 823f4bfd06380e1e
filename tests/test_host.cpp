/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <fec.hpp>
#include <host.hpp>
#include <protocol.hpp>
#include <transport.hpp>

#include <chrono>
#include <cmath>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace gamecast::common;
using namespace gamecast::proto;
using gamecast::config::HostConfig;
using gamecast::fec::FecReassembler;
using gamecast::fec::ReassembledFrame;
using gamecast::fec::ShardPacket;
using gamecast::host::StreamHost;
using gamecast::media::StreamParams;
using gamecast::transport::DatagramType;

namespace {

    sockaddr_in loopback(uint16_t port) {
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_port = htons(port);
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return a;
    }

    HostConfig test_host_config() {
        HostConfig cfg;
        cfg.network.bind_address = "127.0.0.1";
        cfg.network.control_port = 0;
        cfg.network.media_port = 0;
        cfg.network.media_tos = -1;
        cfg.network.max_sessions = 4;
        cfg.encoders.video_slots = 1;
        cfg.encoders.audio_slots = 1;
        cfg.tls.enabled = false;    // RawClient speaks plain TCP
        return cfg;
    }

    StreamParams small_stream() {
        StreamParams p;
        p.width = 320;
        p.height = 240;
        p.fps = 30;
        p.bitrate_kbps = 2000;
        return p;
    }

    // Speaks the control protocol over raw sockets; the host is pumped in between.
    class RawClient {
    public:
        explicit RawClient(uint16_t control_port) {
            tcp_ = ::socket(AF_INET, SOCK_STREAM, 0);
            REQUIRE(tcp_ >= 0);
            sockaddr_in a = loopback(control_port);
            REQUIRE(::connect(tcp_, (sockaddr *)&a, sizeof(a)) == 0);
            setSocketNonBlocking(tcp_);

            udp_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            REQUIRE(udp_ >= 0);
            sockaddr_in u = loopback(0);
            REQUIRE(::bind(udp_, (sockaddr *)&u, sizeof(u)) == 0);
            int rcvbuf = 4 * 1024 * 1024;
            setsockopt(udp_, SOL_SOCKET, SO_RCVBUF, (char *)&rcvbuf, sizeof(rcvbuf));
            setSocketNonBlocking(udp_);
        }

        ~RawClient() {
            if (tcp_ != INVALID_SOCK) closeSocket(tcp_);
            closeSocket(udp_);
        }

        uint32_t send(ControlMessage msg) {
            msg.seq = next_seq_++;
            std::vector<uint8_t> wire = encode_message(msg);
            REQUIRE(::send(tcp_, wire.data(), wire.size(), MSG_NOSIGNAL) == (ssize_t)wire.size());
            return msg.seq;
        }

        void hello(uint16_t host_media_port) {
            std::vector<uint8_t> d = gamecast::transport::encode_datagram(DatagramType::MEDIA_HELLO, token, {});
            sockaddr_in to = loopback(host_media_port);
            REQUIRE(::sendto(udp_, d.data(), d.size(), 0, (sockaddr *)&to, sizeof(to)) == (ssize_t)d.size());
        }

        void hang_up() {
            closeSocket(tcp_);
            tcp_ = INVALID_SOCK;
        }

        /// Pump host and client until @p done holds or @p ms elapse.
        bool pump(StreamHost &host, const std::function<bool()> &done, int ms = 3000) {
            auto deadline = Clock::now() + std::chrono::milliseconds(ms);
            while (Clock::now() < deadline) {
                host.poll_once(2);
                read_control();
                read_media();
                if (done()) return true;
            }
            return false;
        }

        /// The reply to the message with @p seq (ANSWER or REJECT for an OFFER).
        bool reply(StreamHost &host, MessageType type, uint32_t seq, ControlMessage &out) {
            return pump(host, [&]() {
                for (auto it = inbox.begin(); it != inbox.end(); ++it) {
                    bool match = type == MessageType::OFFER
                                 ? (it->type == MessageType::ANSWER ||
                                    (it->type == MessageType::REJECT && it->ref_type == MessageType::OFFER))
                                 : ((it->type == MessageType::ACK || it->type == MessageType::REJECT) && it->ref_seq == seq);
                    if (match) {
                        out = *it;
                        inbox.erase(it);
                        return true;
                    }
                }
                return false;
            });
        }

        bool request(StreamHost &host, const ControlMessage &msg, ControlMessage &out) {
            uint32_t seq = send(msg);
            return reply(host, msg.type, seq, out);
        }

        /// OFFER, MEDIA_HELLO, SETUP, PLAY.
        void start_streaming(StreamHost &host, const StreamParams &params) {
            ControlMessage r;
            REQUIRE(request(host, make_offer(params, "raw"), r));
            REQUIRE(r.type == MessageType::ANSWER);
            token = r.token;
            REQUIRE(token != 0);
            REQUIRE(r.media_port == host.media_port());
            hello(host.media_port());
            REQUIRE(request(host, make_setup(token, 0), r));
            REQUIRE(r.type == MessageType::ACK);
            REQUIRE(request(host, make_simple(MessageType::PLAY), r));
            REQUIRE(r.type == MessageType::ACK);
        }

        bool has(MessageType type) const {
            for (const ControlMessage &m : inbox)
                if (m.type == type) return true;
            return false;
        }

        SessionToken token = 0;
        bool closed = false;
        std::deque<ControlMessage> inbox;
        std::vector<ReassembledFrame> frames;
        std::vector<ShardPacket> shards;
        uint64_t foreign_tag = 0;

    private:
        void read_control() {
            if (closed || tcp_ == INVALID_SOCK) return;
            uint8_t buf[BUFFER_SIZE];
            while (true) {
                ssize_t n = ::recv(tcp_, buf, sizeof(buf), 0);
                if (n > 0) {
                    framer_.feed(buf, (size_t)n);
                    ControlMessage m;
                    while (framer_.next(m) == ControlFramer::Status::MESSAGE) inbox.push_back(m);
                    continue;
                }
                if (n == 0) closed = true;
                break;
            }
        }

        void read_media() {
            uint8_t buf[MAX_UDP_PACKET_SIZE + 512];
            while (true) {
                ssize_t n = ::recv(udp_, buf, sizeof(buf), 0);
                if (n <= 0) break;
                ShardPacket p;
                if (!ShardPacket::parse(buf, (size_t)n, p)) continue;
                if (p.session_tag != (uint16_t)(token & 0xFFFF)) {
                    ++foreign_tag;
                    continue;
                }
                shards.push_back(p);
                ReassembledFrame f;
                if (reassembler_.add(p, Clock::now(), f) == FecReassembler::Result::COMPLETE) frames.push_back(f);
            }
        }

        sock_t tcp_ = INVALID_SOCK;
        sock_t udp_ = INVALID_SOCK;
        ControlFramer framer_;
        FecReassembler reassembler_;
        uint32_t next_seq_ = 1;
    };

    size_t video_frames(const std::vector<ReassembledFrame> &frames) {
        size_t n = 0;
        for (const ReassembledFrame &f : frames)
            if (f.kind == MediaKind::VIDEO) ++n;
        return n;
    }

} // namespace

TEST_CASE("host binds ephemeral ports and announces them", "[host]") {
    StreamHost host(test_host_config());
    uint16_t announced_control = 0, announced_media = 0;
    host.set_discovery_hook([&](uint16_t c, uint16_t m) {
        announced_control = c;
        announced_media = m;
    });
    REQUIRE(host.start());
    REQUIRE(host.control_port() != 0);
    REQUIRE(host.media_port() != 0);
    REQUIRE(announced_control == host.control_port());
    REQUIRE(announced_media == host.media_port());
}

TEST_CASE("a client session streams FEC-protected media and tears down", "[host]") {
    StreamHost host(test_host_config());
    REQUIRE(host.start());
    RawClient client(host.control_port());

    ControlMessage r;
    // nothing but OFFER is legal on a fresh connection
    REQUIRE(client.request(host, make_simple(MessageType::PLAY), r));
    REQUIRE(r.type == MessageType::REJECT);
    REQUIRE(r.reason == RejectReason::ILLEGAL_STATE);

    client.start_streaming(host, small_stream());
    REQUIRE(host.session_count() == 1);
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 0);

    REQUIRE(client.pump(host, [&]() { return video_frames(client.frames) >= 5; }));
    REQUIRE(client.foreign_tag == 0);

    const ReassembledFrame *first_video = nullptr;
    for (const ReassembledFrame &f : client.frames) {
        if (f.kind == MediaKind::VIDEO) {
            first_video = &f;
            break;
        }
    }
    REQUIRE(first_video != nullptr);
    REQUIRE(first_video->frame_seq == 0);
    REQUIRE(first_video->keyframe);

    const gamecast::host::SessionController *sc = host.find_session(client.token);
    REQUIRE(sc != nullptr);
    REQUIRE(sc->state_machine().state() == gamecast::session::SessionState::STREAMING);

    REQUIRE(client.request(host, make_teardown("done"), r));
    REQUIRE(r.type == MessageType::ACK);
    REQUIRE(client.pump(host, [&]() { return client.closed; }));
    REQUIRE(host.session_count() == 0);
    REQUIRE(host.find_session(client.token) == nullptr);
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 1);
    REQUIRE(host.encoders().available(MediaKind::AUDIO) == 1);
}

TEST_CASE("loss reports raise parity on the next frames", "[host]") {
    HostConfig cfg = test_host_config();
    cfg.fec.loss_alpha = 1.0;       // the estimate follows the last report
    StreamHost host(cfg);
    REQUIRE(host.start());
    RawClient client(host.control_port());
    client.start_streaming(host, small_stream());
    REQUIRE(client.pump(host, [&]() { return video_frames(client.frames) >= 2; }));

    LossReport lr;
    lr.shards_expected = 100;
    lr.shards_received = 50;
    ControlMessage r;
    REQUIRE(client.request(host, make_loss_report(lr), r));
    REQUIRE(r.type == MessageType::ACK);

    const gamecast::host::SessionController *sc = host.find_session(client.token);
    REQUIRE(sc != nullptr);
    REQUIRE(sc->state_machine().session().loss.value() == Approx(0.5));
    REQUIRE(sc->orchestrator() != nullptr);
    REQUIRE(sc->orchestrator()->loss_estimate() == Approx(0.5));

    // blocks packetized after the report carry parity for half their data shards
    size_t before = client.shards.size();
    REQUIRE(client.pump(host, [&]() {
        for (size_t i = before; i < client.shards.size(); ++i) {
            const ShardPacket &p = client.shards[i];
            if (p.kind == MediaKind::VIDEO && p.k > 2 && p.m >= (uint16_t)std::ceil(p.k * 0.5)) return true;
        }
        return false;
    }));
}

TEST_CASE("reconfigure switches the stream without a new session", "[host]") {
    StreamHost host(test_host_config());
    REQUIRE(host.start());
    RawClient client(host.control_port());
    client.start_streaming(host, small_stream());
    REQUIRE(client.pump(host, [&]() { return video_frames(client.frames) >= 2; }));

    StreamParams p = small_stream();
    p.width = 640;
    p.height = 480;
    ControlMessage r;
    REQUIRE(client.request(host, make_reconfigure(p), r));
    REQUIRE(r.type == MessageType::ACK);

    const gamecast::host::SessionController *sc = host.find_session(client.token);
    REQUIRE(sc != nullptr);
    REQUIRE(sc->state_machine().state() == gamecast::session::SessionState::STREAMING);
    REQUIRE(sc->orchestrator()->params().width == 640);

    // the stream restarts on a keyframe
    size_t before = client.frames.size();
    REQUIRE(client.pump(host, [&]() {
        for (size_t i = before; i < client.frames.size(); ++i)
            if (client.frames[i].kind == MediaKind::VIDEO && client.frames[i].keyframe) return true;
        return false;
    }));
    REQUIRE(sc->orchestrator()->stats().video().keyframes_forced >= 2);

    StreamParams bad = p;
    bad.width = 7680;
    REQUIRE(client.request(host, make_reconfigure(bad), r));
    REQUIRE(r.type == MessageType::REJECT);
    REQUIRE(r.reason == RejectReason::INCOMPATIBLE_PARAMS);
    REQUIRE(sc->orchestrator()->params().width == 640);
}

TEST_CASE("a silent client is torn down and its encoders freed", "[host]") {
    HostConfig cfg = test_host_config();
    cfg.network.liveness_timeout_ms = 300;
    StreamHost host(cfg);
    REQUIRE(host.start());
    RawClient client(host.control_port());
    client.start_streaming(host, small_stream());
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 0);

    REQUIRE(client.pump(host, [&]() { return client.closed; }));
    REQUIRE(client.has(MessageType::TEARDOWN));
    REQUIRE(host.session_count() == 0);
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 1);

    // the freed encoder serves the next client right away
    RawClient next(host.control_port());
    next.start_streaming(host, small_stream());
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 0);
}

TEST_CASE("a full host refuses new connections", "[host]") {
    HostConfig cfg = test_host_config();
    cfg.network.max_sessions = 1;
    StreamHost host(cfg);
    REQUIRE(host.start());

    RawClient first(host.control_port());
    REQUIRE(first.pump(host, [&]() { return host.session_count() == 1; }));

    RawClient second(host.control_port());
    REQUIRE(second.pump(host, [&]() { return second.closed; }));
    REQUIRE(second.inbox.size() == 1);
    REQUIRE(second.inbox.front().type == MessageType::REJECT);
    REQUIRE(second.inbox.front().reason == RejectReason::HOST_FULL);
    REQUIRE(host.session_count() == 1);
}

TEST_CASE("play is refused while every encoder is taken", "[host]") {
    StreamHost host(test_host_config());
    REQUIRE(host.start());
    RawClient first(host.control_port());
    first.start_streaming(host, small_stream());

    RawClient second(host.control_port());
    ControlMessage r;
    REQUIRE(second.request(host, make_offer(small_stream(), "late"), r));
    REQUIRE(r.type == MessageType::ANSWER);
    second.token = r.token;
    REQUIRE(second.request(host, make_setup(second.token, 0), r));
    REQUIRE(second.request(host, make_simple(MessageType::PLAY), r));
    REQUIRE(r.type == MessageType::REJECT);
    REQUIRE(r.reason == RejectReason::RESOURCE_UNAVAILABLE);
    REQUIRE(host.session_count() == 2);
}

TEST_CASE("a closed control channel ends the session", "[host]") {
    StreamHost host(test_host_config());
    REQUIRE(host.start());
    RawClient client(host.control_port());
    client.start_streaming(host, small_stream());
    REQUIRE(host.session_count() == 1);

    client.hang_up();
    REQUIRE(client.pump(host, [&]() { return host.session_count() == 0; }));
    REQUIRE(host.encoders().available(MediaKind::VIDEO) == 1);
}

TEST_CASE("sessions sharing an audio device must agree on its format", "[host]") {
    HostConfig cfg = test_host_config();
    cfg.encoders.video_slots = 2;
    cfg.encoders.audio_slots = 2;
    StreamHost host(cfg);
    REQUIRE(host.start());

    RawClient first(host.control_port());
    first.start_streaming(host, small_stream());
    REQUIRE(host.capture().settings(cfg.capture.audio_device).channels == 2);

    // mono on the stereo device: refused at PLAY, nothing leaks
    StreamParams mono = small_stream();
    mono.audio_channels = 1;
    RawClient second(host.control_port());
    ControlMessage r;
    REQUIRE(second.request(host, make_offer(mono, "mono"), r));
    REQUIRE(r.type == MessageType::ANSWER);
    second.token = r.token;
    REQUIRE(second.request(host, make_setup(second.token, 0), r));
    REQUIRE(second.request(host, make_simple(MessageType::PLAY), r));
    REQUIRE(r.type == MessageType::REJECT);
    REQUIRE(r.reason == RejectReason::RESOURCE_UNAVAILABLE);
    REQUIRE(host.capture().subscriber_count(cfg.capture.audio_device) == 1);
    REQUIRE(host.encoders().available(MediaKind::AUDIO) == 1);

    // the same format shares the device
    RawClient third(host.control_port());
    third.start_streaming(host, small_stream());
    REQUIRE(host.capture().subscriber_count(cfg.capture.audio_device) == 2);

    // and neither can switch it away from under the other
    REQUIRE(first.request(host, make_reconfigure(mono), r));
    REQUIRE(r.type == MessageType::REJECT);
    REQUIRE(r.reason == RejectReason::RESOURCE_UNAVAILABLE);
    const gamecast::host::SessionController *sc = host.find_session(first.token);
    REQUIRE(sc != nullptr);
    REQUIRE(sc->state_machine().state() == gamecast::session::SessionState::STREAMING);
    REQUIRE(sc->orchestrator()->params().audio_channels == 2);

    // both keep receiving audio the encoder accepts
    size_t before = first.frames.size();
    REQUIRE(first.pump(host, [&]() {
        for (size_t i = before; i < first.frames.size(); ++i)
            if (first.frames[i].kind == MediaKind::AUDIO) return true;
        return false;
    }));
    REQUIRE_FALSE(sc->orchestrator()->fatal());

    // once alone, the last session may change the format
    third.hang_up();
    REQUIRE(first.pump(host, [&]() { return host.session_count() == 2; }));
    REQUIRE(first.request(host, make_reconfigure(mono), r));
    REQUIRE(r.type == MessageType::ACK);
    REQUIRE(host.capture().settings(cfg.capture.audio_device).channels == 1);
}

TEST_CASE("final counters are reported before the pipeline is released", "[host]") {
    StreamHost host(test_host_config());
    REQUIRE(host.start());
    RawClient client(host.control_port());
    client.start_streaming(host, small_stream());
    REQUIRE(client.pump(host, [&]() { return video_frames(client.frames) >= 3; }));

    const gamecast::host::SessionController *sc = host.find_session(client.token);
    REQUIRE(sc != nullptr);
    const uint64_t encoded = sc->orchestrator()->stats().video().frames_encoded;
    REQUIRE(encoded >= 3);

    ControlMessage r;
    REQUIRE(client.request(host, make_teardown("done"), r));
    REQUIRE(client.pump(host, [&]() { return host.session_count() == 0; }));
    REQUIRE(host.telemetry().last(client.token, "video_frames_encoded") >= encoded);
    REQUIRE(host.telemetry().last_transition().find("TERMINATED") != std::string::npos);
}
