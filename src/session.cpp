/*
* @license
* (C) zachbabanov
*
*/

#include <session.hpp>
#include <logger.hpp>

#include <mutex>

using namespace gamecast::common;
using gamecast::proto::MessageType;
using gamecast::proto::RejectReason;

namespace gamecast::session {

    const char *state_name(SessionState s) {
        switch (s) {
            case SessionState::IDLE: return "IDLE";
            case SessionState::NEGOTIATING: return "NEGOTIATING";
            case SessionState::STREAMING: return "STREAMING";
            case SessionState::PAUSED: return "PAUSED";
            case SessionState::RECONFIGURING: return "RECONFIGURING";
            case SessionState::TERMINATED: return "TERMINATED";
        }
        return "UNKNOWN";
    }

    const char *cause_name(TransitionCause c) {
        switch (c) {
            case TransitionCause::OFFER_ACCEPTED: return "offer-accepted";
            case TransitionCause::OFFER_REJECTED: return "offer-rejected";
            case TransitionCause::PLAY: return "play";
            case TransitionCause::PAUSE: return "pause";
            case TransitionCause::RESUME: return "resume";
            case TransitionCause::RECONFIGURE: return "reconfigure";
            case TransitionCause::RECONFIGURED: return "reconfigured";
            case TransitionCause::TEARDOWN: return "teardown";
            case TransitionCause::LIVENESS_LOST: return "liveness-lost";
            case TransitionCause::FATAL_ERROR: return "fatal-error";
            case TransitionCause::TRANSPORT_CLOSED: return "transport-closed";
        }
        return "unknown";
    }

    SessionStateMachine::SessionStateMachine(SessionToken token, const media::HostCapabilities &caps,
                                             uint16_t host_media_port, double loss_alpha, TimePoint now)
        : caps_(caps), host_media_port_(host_media_port) {
        session_.token = token;
        session_.last_activity = now;
        session_.loss = fec::LossEstimator(loss_alpha);
    }

    void SessionStateMachine::subscribe(TransitionListener listener) {
        if (listener) listeners_.push_back(std::move(listener));
    }

    HandleResult SessionStateMachine::accept(const proto::ControlMessage &msg) {
        HandleResult r;
        r.accepted = true;
        r.has_reply = true;
        r.reply = proto::make_ack(msg.type, msg.seq);
        return r;
    }

    HandleResult SessionStateMachine::reject(const proto::ControlMessage &msg, RejectReason reason, const std::string &text) {
        ++session_.stats.rejected_messages;
        LOG_SESSION_WARN("session {:016x}: {} rejected in {}: {} ({})", session_.token,
                         proto::message_type_name(msg.type), state_name(session_.state),
                         proto::reject_reason_name(reason), text);
        HandleResult r;
        r.accepted = false;
        r.has_reply = true;
        r.reply = proto::make_reject(reason, text, msg.type, msg.seq);
        return r;
    }

    HandleResult SessionStateMachine::illegal(const proto::ControlMessage &msg) {
        return reject(msg, RejectReason::ILLEGAL_STATE,
                      std::string(proto::message_type_name(msg.type)) + " not allowed in " + state_name(session_.state));
    }

    void SessionStateMachine::transition(SessionState to, TransitionCause cause) {
        TransitionEvent ev;
        ev.token = session_.token;
        ev.from = session_.state;
        ev.to = to;
        ev.cause = cause;
        session_.state = to;
        LOG_SESSION_INFO("session {:016x}: {} -> {} ({})", session_.token, state_name(ev.from), state_name(to), cause_name(cause));
        for (auto &l : listeners_) l(ev);
    }

    void SessionStateMachine::terminate(TransitionCause cause, const std::string &reason) {
        if (session_.state == SessionState::TERMINATED) return;
        terminate_reason_ = reason;
        transition(SessionState::TERMINATED, cause);
    }

    HandleResult SessionStateMachine::handle(const proto::ControlMessage &msg, TimePoint now) {
        session_.last_activity = now;
        const SessionState st = session_.state;

        if (st == SessionState::TERMINATED) return illegal(msg);

        switch (msg.type) {
            case MessageType::OFFER: {
                if (st != SessionState::IDLE) return illegal(msg);
                media::StreamParams accepted;
                media::OfferVerdict v = media::evaluate_offer(msg.params, caps_, accepted);
                session_.client_name = msg.text;
                if (v != media::OfferVerdict::ACCEPTED) {
                    HandleResult r = reject(msg, RejectReason::INCOMPATIBLE_PARAMS, media::verdict_name(v));
                    terminate(TransitionCause::OFFER_REJECTED, std::string("offer rejected: ") + media::verdict_name(v));
                    return r;
                }
                session_.params = accepted;
                LOG_SESSION_INFO("session {:016x}: offer from '{}' accepted: {}", session_.token, msg.text, accepted.describe());
                transition(SessionState::NEGOTIATING, TransitionCause::OFFER_ACCEPTED);
                HandleResult r;
                r.accepted = true;
                r.has_reply = true;
                r.reply = proto::make_answer(session_.token, accepted, host_media_port_, session_.keys);
                return r;
            }

            case MessageType::SETUP: {
                if (st != SessionState::NEGOTIATING) return illegal(msg);
                if (msg.token != session_.token) {
                    return reject(msg, RejectReason::UNKNOWN_SESSION, "token does not match this connection");
                }
                session_.setup_seen = true;
                session_.client_media_port = msg.media_port;
                return accept(msg);
            }

            case MessageType::PLAY: {
                if (st == SessionState::NEGOTIATING) {
                    if (!session_.setup_seen) return illegal(msg);
                    HandleResult r = accept(msg);
                    transition(SessionState::STREAMING, TransitionCause::PLAY);
                    return r;
                }
                if (st == SessionState::PAUSED) {
                    HandleResult r = accept(msg);
                    transition(SessionState::STREAMING, TransitionCause::RESUME);
                    return r;
                }
                return illegal(msg);
            }

            case MessageType::PAUSE: {
                if (st != SessionState::STREAMING) return illegal(msg);
                HandleResult r = accept(msg);
                transition(SessionState::PAUSED, TransitionCause::PAUSE);
                return r;
            }

            case MessageType::RECONFIGURE: {
                if (st != SessionState::STREAMING && st != SessionState::PAUSED) return illegal(msg);
                media::StreamParams accepted;
                media::OfferVerdict v = media::evaluate_offer(msg.params, caps_, accepted);
                if (v != media::OfferVerdict::ACCEPTED) {
                    // stays where it is, the stream keeps running on the old parameters
                    return reject(msg, RejectReason::INCOMPATIBLE_PARAMS, media::verdict_name(v));
                }
                session_.params = accepted;
                HandleResult r = accept(msg);
                transition(SessionState::RECONFIGURING, TransitionCause::RECONFIGURE);
                return r;
            }

            case MessageType::HEARTBEAT: {
                if (st != SessionState::STREAMING && st != SessionState::PAUSED && st != SessionState::RECONFIGURING)
                    return illegal(msg);
                ++session_.stats.heartbeats;
                return accept(msg);
            }

            case MessageType::LOSS_REPORT: {
                if (st != SessionState::STREAMING && st != SessionState::PAUSED && st != SessionState::RECONFIGURING)
                    return illegal(msg);
                SessionStats &s = session_.stats;
                ++s.loss_reports;
                s.shards_expected += msg.loss.shards_expected;
                s.shards_received += msg.loss.shards_received;
                s.frames_recovered += msg.loss.frames_recovered;
                s.frames_unrecoverable += msg.loss.frames_unrecoverable;
                // an empty interval carries no information about the channel
                if (msg.loss.shards_expected > 0) {
                    double est = session_.loss.update(msg.loss.loss_ratio());
                    LOG_FEC_DEBUG("session {:016x}: loss sample {:.4f} -> estimate {:.4f}",
                                  session_.token, msg.loss.loss_ratio(), est);
                }
                return accept(msg);
            }

            case MessageType::REQUEST_KEYFRAME: {
                if (st != SessionState::STREAMING) return illegal(msg);
                ++session_.stats.keyframe_requests;
                return accept(msg);
            }

            case MessageType::TEARDOWN: {
                HandleResult r = accept(msg);
                terminate(TransitionCause::TEARDOWN, msg.text.empty() ? "client teardown" : msg.text);
                return r;
            }

            case MessageType::ANSWER:
            case MessageType::REJECT:
            case MessageType::ACK:
                return illegal(msg);
        }
        return reject(msg, RejectReason::MALFORMED, "unknown message type");
    }

    bool SessionStateMachine::complete_reconfigure(TimePoint now) {
        if (session_.state != SessionState::RECONFIGURING) return false;
        session_.last_activity = now;
        transition(SessionState::STREAMING, TransitionCause::RECONFIGURED);
        return true;
    }

    void SessionStateMachine::on_liveness_lost(TimePoint /*now*/) {
        terminate(TransitionCause::LIVENESS_LOST, "client stopped responding");
    }

    void SessionStateMachine::on_fatal_error(const std::string &reason, TimePoint /*now*/) {
        LOG_SESSION_ERROR("session {:016x}: fatal: {}", session_.token, reason);
        terminate(TransitionCause::FATAL_ERROR, reason);
    }

    void SessionStateMachine::on_transport_closed(TimePoint /*now*/) {
        terminate(TransitionCause::TRANSPORT_CLOSED, "control channel closed");
    }

    SessionRegistry::SessionRegistry(uint64_t seed) : rng_(seed) {}

    SessionToken SessionRegistry::register_session(sock_t control_fd) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (by_fd_.count(control_fd)) return 0;
        SessionToken token = 0;
        // tokens must be unique and never 0; their low 16 bits tag media packets
        while (token == 0 || by_token_.count(token)) token = rng_();
        by_token_[token] = control_fd;
        by_fd_[control_fd] = token;
        return token;
    }

    std::optional<sock_t> SessionRegistry::find_fd(SessionToken token) const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        auto it = by_token_.find(token);
        if (it == by_token_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<SessionToken> SessionRegistry::find_token(sock_t fd) const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        auto it = by_fd_.find(fd);
        if (it == by_fd_.end()) return std::nullopt;
        return it->second;
    }

    bool SessionRegistry::remove(SessionToken token) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        auto it = by_token_.find(token);
        if (it == by_token_.end()) return false;
        by_fd_.erase(it->second);
        by_token_.erase(it);
        return true;
    }

    size_t SessionRegistry::size() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return by_token_.size();
    }

} // namespace gamecast::session
