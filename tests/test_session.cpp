/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <session.hpp>

#include <set>
#include <string>
#include <vector>

using namespace gamecast::common;
using namespace gamecast::proto;
using namespace gamecast::session;
using gamecast::media::HostCapabilities;
using gamecast::media::StreamParams;

namespace {

    constexpr SessionToken TOKEN = 0x1122334455667788ULL;

    struct Harness {
        TimePoint now = Clock::now();
        SessionStateMachine sm{TOKEN, HostCapabilities(), 47998, 0.25, now};
        std::vector<TransitionEvent> events;
        uint32_t seq = 1;

        Harness() {
            sm.subscribe([this](const TransitionEvent &ev) { events.push_back(ev); });
        }

        HandleResult send(ControlMessage msg) {
            msg.seq = seq++;
            return sm.handle(msg, now);
        }

        void to_streaming() {
            REQUIRE(send(make_offer(StreamParams(), "test")).accepted);
            REQUIRE(send(make_setup(TOKEN, 5000)).accepted);
            REQUIRE(send(make_simple(MessageType::PLAY)).accepted);
            REQUIRE(sm.state() == SessionState::STREAMING);
        }
    };

    void require_illegal(const HandleResult &r) {
        REQUIRE_FALSE(r.accepted);
        REQUIRE(r.has_reply);
        REQUIRE(r.reply.type == MessageType::REJECT);
        REQUIRE(r.reply.reason == RejectReason::ILLEGAL_STATE);
    }

} // namespace

TEST_CASE("offer, setup and play lead to STREAMING", "[session]") {
    Harness h;
    HandleResult r = h.send(make_offer(StreamParams(), "pc"));
    REQUIRE(r.accepted);
    REQUIRE(r.reply.type == MessageType::ANSWER);
    REQUIRE(r.reply.token == TOKEN);
    REQUIRE(r.reply.media_port == 47998);
    REQUIRE(h.sm.state() == SessionState::NEGOTIATING);
    REQUIRE(h.sm.session().client_name == "pc");

    r = h.send(make_setup(TOKEN, 6000));
    REQUIRE(r.accepted);
    REQUIRE(r.reply.type == MessageType::ACK);
    REQUIRE(r.reply.ref_type == MessageType::SETUP);
    REQUIRE(r.reply.ref_seq == 2);
    REQUIRE(h.sm.session().client_media_port == 6000);

    r = h.send(make_simple(MessageType::PLAY));
    REQUIRE(r.accepted);
    REQUIRE(h.sm.state() == SessionState::STREAMING);

    REQUIRE(h.events.size() == 2);
    REQUIRE(h.events[0].to == SessionState::NEGOTIATING);
    REQUIRE(h.events[0].cause == TransitionCause::OFFER_ACCEPTED);
    REQUIRE(h.events[1].from == SessionState::NEGOTIATING);
    REQUIRE(h.events[1].cause == TransitionCause::PLAY);
}

TEST_CASE("an incompatible offer is rejected and terminates", "[session]") {
    Harness h;
    StreamParams p;
    p.codec = Codec::AV1;
    HandleResult r = h.send(make_offer(p, "pc"));
    REQUIRE_FALSE(r.accepted);
    REQUIRE(r.reply.reason == RejectReason::INCOMPATIBLE_PARAMS);
    REQUIRE(r.reply.ref_type == MessageType::OFFER);
    REQUIRE(h.sm.terminated());
    REQUIRE(h.events.back().cause == TransitionCause::OFFER_REJECTED);
}

TEST_CASE("PLAY before SETUP is illegal and changes nothing", "[session]") {
    Harness h;
    REQUIRE(h.send(make_offer(StreamParams(), "pc")).accepted);
    require_illegal(h.send(make_simple(MessageType::PLAY)));
    REQUIRE(h.sm.state() == SessionState::NEGOTIATING);
    REQUIRE(h.sm.session().stats.rejected_messages == 1);
}

TEST_CASE("SETUP with a foreign token is refused", "[session]") {
    Harness h;
    REQUIRE(h.send(make_offer(StreamParams(), "pc")).accepted);
    HandleResult r = h.send(make_setup(TOKEN + 1, 6000));
    REQUIRE_FALSE(r.accepted);
    REQUIRE(r.reply.reason == RejectReason::UNKNOWN_SESSION);
    REQUIRE_FALSE(h.sm.session().setup_seen);
}

TEST_CASE("messages illegal in IDLE", "[session]") {
    Harness h;
    require_illegal(h.send(make_simple(MessageType::PLAY)));
    require_illegal(h.send(make_simple(MessageType::PAUSE)));
    require_illegal(h.send(make_simple(MessageType::HEARTBEAT)));
    require_illegal(h.send(make_setup(TOKEN, 1)));
    require_illegal(h.send(make_reconfigure(StreamParams())));
    require_illegal(h.send(make_ack(MessageType::OFFER, 1)));
    REQUIRE(h.sm.state() == SessionState::IDLE);
    REQUIRE(h.events.empty());
}

TEST_CASE("pause and resume", "[session]") {
    Harness h;
    h.to_streaming();
    REQUIRE(h.send(make_simple(MessageType::PAUSE)).accepted);
    REQUIRE(h.sm.state() == SessionState::PAUSED);
    require_illegal(h.send(make_simple(MessageType::PAUSE)));
    require_illegal(h.send(make_simple(MessageType::REQUEST_KEYFRAME)));
    REQUIRE(h.send(make_simple(MessageType::HEARTBEAT)).accepted);

    REQUIRE(h.send(make_simple(MessageType::PLAY)).accepted);
    REQUIRE(h.sm.state() == SessionState::STREAMING);
    REQUIRE(h.events.back().cause == TransitionCause::RESUME);
}

TEST_CASE("reconfigure goes through RECONFIGURING", "[session]") {
    Harness h;
    h.to_streaming();
    StreamParams p;
    p.width = 1280;
    p.height = 720;
    HandleResult r = h.send(make_reconfigure(p));
    REQUIRE(r.accepted);
    REQUIRE(h.sm.state() == SessionState::RECONFIGURING);
    REQUIRE(h.sm.session().params.width == 1280);
    require_illegal(h.send(make_simple(MessageType::PAUSE)));
    REQUIRE(h.send(make_simple(MessageType::HEARTBEAT)).accepted);

    REQUIRE(h.sm.complete_reconfigure(h.now));
    REQUIRE(h.sm.state() == SessionState::STREAMING);
    REQUIRE(h.events.back().cause == TransitionCause::RECONFIGURED);
    REQUIRE_FALSE(h.sm.complete_reconfigure(h.now));
}

TEST_CASE("an invalid reconfigure keeps the old parameters", "[session]") {
    Harness h;
    h.to_streaming();
    StreamParams bad;
    bad.fps = 1000;
    HandleResult r = h.send(make_reconfigure(bad));
    REQUIRE_FALSE(r.accepted);
    REQUIRE(r.reply.reason == RejectReason::INCOMPATIBLE_PARAMS);
    REQUIRE(h.sm.state() == SessionState::STREAMING);
    REQUIRE(h.sm.session().params.fps == StreamParams().fps);
}

TEST_CASE("loss reports feed the EWMA estimate", "[session]") {
    Harness h;
    h.to_streaming();
    LossReport lr;
    lr.shards_expected = 100;
    lr.shards_received = 60;
    REQUIRE(h.send(make_loss_report(lr)).accepted);
    REQUIRE(h.sm.session().loss.value() == Approx(0.1));

    // empty interval: counted, but no sample
    REQUIRE(h.send(make_loss_report(LossReport())).accepted);
    REQUIRE(h.sm.session().loss.value() == Approx(0.1));
    REQUIRE(h.sm.session().stats.loss_reports == 2);
    REQUIRE(h.sm.session().stats.shards_expected == 100);
}

TEST_CASE("teardown is acknowledged and final", "[session]") {
    Harness h;
    h.to_streaming();
    HandleResult r = h.send(make_teardown("done"));
    REQUIRE(r.accepted);
    REQUIRE(r.reply.type == MessageType::ACK);
    REQUIRE(h.sm.terminated());
    REQUIRE(h.sm.terminate_reason() == "done");
    REQUIRE(h.events.back().cause == TransitionCause::TEARDOWN);

    require_illegal(h.send(make_simple(MessageType::PLAY)));
    require_illegal(h.send(make_teardown("again")));
}

TEST_CASE("liveness loss and fatal errors terminate once", "[session]") {
    Harness h;
    h.to_streaming();
    h.sm.on_liveness_lost(h.now);
    REQUIRE(h.sm.terminated());
    size_t n = h.events.size();
    h.sm.on_fatal_error("late", h.now);
    h.sm.on_transport_closed(h.now);
    REQUIRE(h.events.size() == n);
    REQUIRE(h.events.back().cause == TransitionCause::LIVENESS_LOST);
}

TEST_CASE("SessionRegistry issues unique non-zero tokens", "[session]") {
    SessionRegistry reg(1234);
    std::set<SessionToken> tokens;
    for (sock_t fd = 10; fd < 60; ++fd) {
        SessionToken t = reg.register_session(fd);
        REQUIRE(t != 0);
        tokens.insert(t);
    }
    REQUIRE(tokens.size() == 50);
    REQUIRE(reg.size() == 50);

    REQUIRE(reg.register_session(10) == 0);

    SessionToken t = *reg.find_token(20);
    REQUIRE(*reg.find_fd(t) == 20);
    REQUIRE(reg.remove(t));
    REQUIRE_FALSE(reg.find_fd(t).has_value());
    REQUIRE_FALSE(reg.find_token(20).has_value());
    REQUIRE_FALSE(reg.remove(t));
}
