/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <fec.hpp>
#include <transport.hpp>

#include <chrono>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace gamecast::common;
using namespace gamecast::transport;
using gamecast::fec::FecBlock;
using gamecast::fec::FecConfig;
using gamecast::fec::FecPacketizer;
using gamecast::fec::ShardPacket;
using gamecast::proto::ControlFramer;
using gamecast::proto::ControlMessage;
using gamecast::proto::MessageType;

namespace {

    sockaddr_in loopback(uint16_t port) {
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_port = htons(port);
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return a;
    }

    sockaddr_in foreign_addr() {
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_port = htons(5000);
        inet_pton(AF_INET, "10.1.2.3", &a.sin_addr);
        return a;
    }

    sock_t bound_udp(sockaddr_in &addr) {
        sock_t fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in a = loopback(0);
        REQUIRE(::bind(fd, (sockaddr *)&a, sizeof(a)) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd, (sockaddr *)&addr, &len) == 0);
        setSocketNonBlocking(fd);
        return fd;
    }

    // A connected control channel: [0] belongs to the session, [1] plays the client.
    struct ControlPair {
        int fds[2] = {INVALID_SOCK, INVALID_SOCK};

        ControlPair() {
            REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
            setSocketNonBlocking(fds[0]);
            setSocketNonBlocking(fds[1]);
        }
        ~ControlPair() {
            if (fds[1] != INVALID_SOCK) ::close(fds[1]);
        }

        void write_client(const std::vector<uint8_t> &bytes, size_t from, size_t to) {
            REQUIRE(::send(fds[1], bytes.data() + from, to - from, 0) == (ssize_t)(to - from));
        }
    };

    std::vector<ShardPacket> make_packets(size_t payload) {
        FecConfig cfg;
        cfg.shard_size = 100;
        FecPacketizer pz(cfg);
        gamecast::media::EncodedFrame f;
        f.frame_seq = 1;
        f.payload.assign(payload, 0x3C);
        FecBlock block;
        REQUIRE(pz.packetize(f, 0.0, 7, block));
        return block.packets;
    }

    std::vector<uint8_t> input_body(uint32_t seq, int32_t value) {
        gamecast::input::InputEvent ev;
        ev.seq = seq;
        ev.device = gamecast::input::InputDevice::MOUSE_MOVE;
        ev.code = 1;
        ev.value = value;
        std::vector<uint8_t> body;
        gamecast::input::encode_input(ev, body);
        return body;
    }

} // namespace

TEST_CASE("client datagram header validation", "[transport]") {
    std::vector<uint8_t> body{1, 2, 3};
    std::vector<uint8_t> dgram = encode_datagram(DatagramType::FEEDBACK, 0x0102030405060708ULL, body);
    REQUIRE(dgram.size() == CLIENT_DATAGRAM_HEADER_SIZE + 3);

    DatagramType type;
    SessionToken token = 0;
    const uint8_t *b = nullptr;
    size_t blen = 0;
    REQUIRE(parse_datagram(dgram.data(), dgram.size(), type, token, b, blen));
    REQUIRE(type == DatagramType::FEEDBACK);
    REQUIRE(token == 0x0102030405060708ULL);
    REQUIRE(blen == 3);
    REQUIRE(b[2] == 3);

    REQUIRE_FALSE(parse_datagram(dgram.data(), CLIENT_DATAGRAM_HEADER_SIZE - 1, type, token, b, blen));
    std::vector<uint8_t> bad = dgram;
    bad[0] ^= 0x01;
    REQUIRE_FALSE(parse_datagram(bad.data(), bad.size(), type, token, b, blen));
    bad = dgram;
    bad[2] = 9;
    REQUIRE_FALSE(parse_datagram(bad.data(), bad.size(), type, token, b, blen));

    FeedbackPacket fb;
    std::vector<uint8_t> short_body{0, 0, 0};
    REQUIRE_FALSE(decode_feedback(short_body.data(), short_body.size(), fb));
}

TEST_CASE("control messages are framed across partial reads", "[transport]") {
    ControlPair cp;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);

    ControlMessage offer = gamecast::proto::make_offer(gamecast::media::StreamParams(), "pad");
    offer.seq = 1;
    std::vector<uint8_t> wire = gamecast::proto::encode_message(offer);

    cp.write_client(wire, 0, 5);
    REQUIRE(ts.on_readable(now));
    TransportEvent ev;
    REQUIRE_FALSE(ts.next_event(ev));

    cp.write_client(wire, 5, wire.size());
    REQUIRE(ts.on_readable(now));
    REQUIRE(ts.next_event(ev));
    REQUIRE(ev.type == EventType::CONTROL);
    REQUIRE(ev.control.type == MessageType::OFFER);
    REQUIRE(ev.control.text == "pad");
    REQUIRE(ts.counters().control_received == 1);
}

TEST_CASE("send_control numbers messages in order", "[transport]") {
    ControlPair cp;
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), Clock::now());
    REQUIRE(ts.send_control(gamecast::proto::make_simple(MessageType::HEARTBEAT)));
    REQUIRE(ts.send_control(gamecast::proto::make_teardown("bye")));

    uint8_t buf[BUFFER_SIZE];
    ssize_t n = ::recv(cp.fds[1], buf, sizeof(buf), 0);
    REQUIRE(n > 0);
    ControlFramer f;
    f.feed(buf, (size_t)n);
    ControlMessage a, b;
    REQUIRE(f.next(a) == ControlFramer::Status::MESSAGE);
    REQUIRE(f.next(b) == ControlFramer::Status::MESSAGE);
    REQUIRE(a.seq == 1);
    REQUIRE(b.seq == 2);
    REQUIRE(b.text == "bye");
    REQUIRE(ts.counters().control_sent == 2);
}

TEST_CASE("peer close and corrupt streams end with CLOSED", "[transport]") {
    TimePoint now = Clock::now();
    TransportEvent ev;

    SECTION("orderly close") {
        ControlPair cp;
        TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);
        ::close(cp.fds[1]);
        cp.fds[1] = INVALID_SOCK;
        REQUIRE_FALSE(ts.on_readable(now));
        REQUIRE(ts.closed());
        REQUIRE(ts.next_event(ev));
        REQUIRE(ev.type == EventType::CLOSED);
        REQUIRE_FALSE(ev.reason.empty());

        // nothing after CLOSED
        REQUIRE_FALSE(ts.check_liveness(now + std::chrono::hours(1)));
        REQUIRE_FALSE(ts.next_event(ev));
        REQUIRE_FALSE(ts.send_control(gamecast::proto::make_simple(MessageType::HEARTBEAT)));
    }

    SECTION("garbage on the control channel") {
        ControlPair cp;
        TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);
        std::vector<uint8_t> junk(gamecast::proto::CONTROL_HEADER_SIZE, 0xFF);
        cp.write_client(junk, 0, junk.size());
        REQUIRE_FALSE(ts.on_readable(now));
        REQUIRE(ts.next_event(ev));
        REQUIRE(ev.type == EventType::CLOSED);
        REQUIRE(ev.reason.find("malformed") != std::string::npos);
    }
}

TEST_CASE("datagrams are accepted only from the control peer", "[transport]") {
    ControlPair cp;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);
    TransportEvent ev;

    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, foreign_addr(), now);
    REQUIRE_FALSE(ts.media_ready());
    REQUIRE_FALSE(ts.next_event(ev));

    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, loopback(6000), now);
    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, loopback(6001), now);
    REQUIRE(ts.media_ready());
    REQUIRE(ntohs(ts.media_addr().sin_port) == 6001);
    REQUIRE(ts.next_event(ev));
    REQUIRE(ev.type == EventType::MEDIA_READY);
    REQUIRE_FALSE(ts.next_event(ev));
}

TEST_CASE("input keeps client order and drops stale events", "[transport]") {
    ControlPair cp;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);

    for (uint32_t seq : {1u, 3u, 2u, 3u, 4u}) {
        std::vector<uint8_t> body = input_body(seq, (int32_t)seq * 10);
        ts.on_datagram(DatagramType::INPUT, body.data(), body.size(), loopback(6000), now);
    }
    std::vector<uint8_t> truncated = input_body(9, 0);
    truncated.resize(4);
    ts.on_datagram(DatagramType::INPUT, truncated.data(), truncated.size(), loopback(6000), now);

    std::vector<uint32_t> seqs;
    TransportEvent ev;
    while (ts.next_event(ev)) {
        REQUIRE(ev.type == EventType::INPUT);
        seqs.push_back(ev.input.seq);
    }
    REQUIRE(seqs == std::vector<uint32_t>{1, 3, 4});
    REQUIRE(ts.counters().input_out_of_order == 2);
    REQUIRE(ts.counters().input_received == 3);
}

TEST_CASE("with keys bound only sealed input gets through", "[transport]") {
    ControlPair cp;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);
    REQUIRE_FALSE(ts.secure());
    gamecast::crypto::SessionKeys keys;
    REQUIRE(gamecast::crypto::generate_session_keys(keys));
    ts.bind_keys(keys);

    std::vector<uint8_t> plain = input_body(1, 10);
    ts.on_datagram(DatagramType::INPUT, plain.data(), plain.size(), loopback(6000), now);

    std::vector<uint8_t> sealed;
    REQUIRE(gamecast::crypto::seal(keys, plain.data(), plain.size(), sealed));
    ts.on_datagram(DatagramType::INPUT, sealed.data(), sealed.size(), loopback(6000), now);

    gamecast::crypto::SessionKeys stale = keys;
    stale.key_id += 1;
    std::vector<uint8_t> body2 = input_body(2, 20);
    std::vector<uint8_t> wrong;
    REQUIRE(gamecast::crypto::seal(stale, body2.data(), body2.size(), wrong));
    ts.on_datagram(DatagramType::INPUT, wrong.data(), wrong.size(), loopback(6000), now);

    TransportEvent ev;
    REQUIRE(ts.next_event(ev));
    REQUIRE(ev.type == EventType::INPUT);
    REQUIRE(ev.input.seq == 1);
    REQUIRE(ev.input.value == 10);
    REQUIRE_FALSE(ts.next_event(ev));
    REQUIRE(ts.counters().input_rejected == 2);
    REQUIRE(ts.counters().input_received == 1);
}

TEST_CASE("feedback datagrams become events", "[transport]") {
    ControlPair cp;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), TransportConfig(), now);

    FeedbackPacket fb;
    fb.highest_frame_seq = 812;
    fb.frames_completed = 60;
    fb.frames_lost = 2;
    std::vector<uint8_t> body;
    encode_feedback(fb, body);
    ts.on_datagram(DatagramType::FEEDBACK, body.data(), body.size(), loopback(6000), now);

    TransportEvent ev;
    REQUIRE(ts.next_event(ev));
    REQUIRE(ev.type == EventType::FEEDBACK);
    REQUIRE(ev.feedback.highest_frame_seq == 812);
    REQUIRE(ev.feedback.frames_lost == 2);
}

TEST_CASE("the media queue is bounded and flushed to the client address", "[transport]") {
    ControlPair cp;
    sockaddr_in host_addr{}, client_addr{};
    sock_t host_udp = bound_udp(host_addr);
    sock_t client_udp = bound_udp(client_addr);

    TransportConfig cfg;
    cfg.media_queue_capacity = 4;
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], host_udp, loopback(1), cfg, now);

    std::vector<ShardPacket> pkts = make_packets(450);
    REQUIRE(pkts.size() > 4);
    size_t accepted = 0;
    for (const ShardPacket &p : pkts)
        if (ts.send_media(p)) ++accepted;
    REQUIRE(accepted == 4);
    REQUIRE(ts.media_queue_depth() == 4);
    REQUIRE(ts.counters().datagrams_dropped == pkts.size() - 4);

    // nowhere to send yet
    REQUIRE(ts.flush_media(now) == 0);

    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, client_addr, now);
    REQUIRE(ts.flush_media(now) == 4);
    REQUIRE(ts.media_queue_depth() == 0);

    uint8_t buf[MAX_UDP_PACKET_SIZE];
    size_t received = 0;
    for (int attempt = 0; attempt < 200 && received < 4; ++attempt) {
        ssize_t n = ::recv(client_udp, buf, sizeof(buf), 0);
        if (n <= 0) {
            ::usleep(1000);
            continue;
        }
        ShardPacket p;
        REQUIRE(ShardPacket::parse(buf, (size_t)n, p));
        REQUIRE(p.shard_index == received);
        REQUIRE(p.session_tag == 7);
        ++received;
    }
    REQUIRE(received == 4);

    ts.send_media(pkts[0]);
    ts.clear_media();
    REQUIRE(ts.media_queue_depth() == 0);

    closeSocket(host_udp);
    closeSocket(client_udp);
}

TEST_CASE("pacing spreads datagrams over time", "[transport]") {
    ControlPair cp;
    sockaddr_in host_addr{}, client_addr{};
    sock_t host_udp = bound_udp(host_addr);
    sock_t client_udp = bound_udp(client_addr);

    TransportConfig cfg;
    cfg.pacing_kbps = 100;      // 12500 bytes per second
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], host_udp, loopback(1), cfg, now);
    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, client_addr, now);

    std::vector<ShardPacket> pkts = make_packets(1500);
    for (const ShardPacket &p : pkts) REQUIRE(ts.send_media(p));

    REQUIRE(ts.flush_media(now) == 0);
    size_t sent = ts.flush_media(now + std::chrono::milliseconds(40));
    REQUIRE(sent > 0);
    REQUIRE(sent < pkts.size());
    REQUIRE(ts.media_queue_depth() == pkts.size() - sent);

    closeSocket(host_udp);
    closeSocket(client_udp);
}

TEST_CASE("liveness is reported once after the timeout", "[transport]") {
    ControlPair cp;
    TransportConfig cfg;
    cfg.liveness_timeout = std::chrono::milliseconds(500);
    TimePoint now = Clock::now();
    TransportSession ts(cp.fds[0], INVALID_SOCK, loopback(1), cfg, now);

    REQUIRE_FALSE(ts.check_liveness(now + std::chrono::milliseconds(400)));
    // any datagram from the peer counts as activity
    ts.on_datagram(DatagramType::MEDIA_HELLO, nullptr, 0, loopback(6000), now + std::chrono::milliseconds(400));
    REQUIRE_FALSE(ts.check_liveness(now + std::chrono::milliseconds(800)));
    REQUIRE(ts.check_liveness(now + std::chrono::milliseconds(1000)));
    REQUIRE_FALSE(ts.check_liveness(now + std::chrono::milliseconds(2000)));

    TransportEvent ev;
    bool lost = false;
    while (ts.next_event(ev)) lost = lost || ev.type == EventType::LIVENESS_LOST;
    REQUIRE(lost);

    ts.close("test over");
    REQUIRE(ts.closed());
}
