/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_SESSION_HPP
#define GAMECAST_SESSION_HPP

#pragma once

#include <common.hpp>
#include <crypto.hpp>
#include <fec.hpp>
#include <media.hpp>
#include <protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gamecast::session {

    using common::SessionToken;
    using common::TimePoint;

    enum class SessionState {
        IDLE,
        NEGOTIATING,
        STREAMING,
        PAUSED,
        RECONFIGURING,
        TERMINATED
    };

    const char *state_name(SessionState s);

    enum class TransitionCause {
        OFFER_ACCEPTED,
        OFFER_REJECTED,
        PLAY,
        PAUSE,
        RESUME,
        RECONFIGURE,
        RECONFIGURED,
        TEARDOWN,
        LIVENESS_LOST,
        FATAL_ERROR,
        TRANSPORT_CLOSED
    };

    const char *cause_name(TransitionCause c);

    struct SessionStats {
        uint64_t loss_reports = 0;
        uint64_t shards_expected = 0;
        uint64_t shards_received = 0;
        uint64_t frames_recovered = 0;
        uint64_t frames_unrecoverable = 0;
        uint64_t heartbeats = 0;
        uint64_t keyframe_requests = 0;
        uint64_t rejected_messages = 0;
    };

/**
 * @brief Everything the host knows about one client session.
 *
 * Owned by SessionStateMachine. Other components refer to it by token.
 */
    struct Session {
        SessionToken token = 0;
        media::StreamParams params;
        SessionState state = SessionState::IDLE;
        TimePoint last_activity{};
        fec::LossEstimator loss;
        bool setup_seen = false;
        uint16_t client_media_port = 0;
        std::string client_name;
        crypto::SessionKeys keys;        // handed to the client in the ANSWER
        SessionStats stats;
    };

    struct TransitionEvent {
        SessionToken token = 0;
        SessionState from = SessionState::IDLE;
        SessionState to = SessionState::IDLE;
        TransitionCause cause = TransitionCause::TEARDOWN;
    };

    using TransitionListener = std::function<void(const TransitionEvent &)>;

    struct HandleResult {
        bool accepted = false;
        bool has_reply = false;
        proto::ControlMessage reply;
    };

/**
 * @brief Negotiation and lifecycle of a single session.
 *
 *   IDLE --offer ok--> NEGOTIATING --setup, play--> STREAMING <--> PAUSED
 *   STREAMING/PAUSED --reconfigure--> RECONFIGURING --done--> STREAMING
 *   any --teardown / liveness / fatal--> TERMINATED
 *
 * Pure logic: no sockets, no clocks of its own. Replies are returned to the
 * caller, transitions are published to listeners. An illegal message never
 * changes state and is answered with Reject(ILLEGAL_STATE).
 */
    class SessionStateMachine {
    public:
        SessionStateMachine(SessionToken token, const media::HostCapabilities &caps, uint16_t host_media_port,
                            double loss_alpha, TimePoint now);

        HandleResult handle(const proto::ControlMessage &msg, TimePoint now);

        /// RECONFIGURING -> STREAMING once the pipeline runs on the new parameters.
        bool complete_reconfigure(TimePoint now);

        void on_liveness_lost(TimePoint now);
        void on_fatal_error(const std::string &reason, TimePoint now);
        void on_transport_closed(TimePoint now);

        void subscribe(TransitionListener listener);

        /// Key material for the ANSWER; set before the OFFER is handled.
        void set_keys(const crypto::SessionKeys &keys) { session_.keys = keys; }

        const Session &session() const { return session_; }
        SessionState state() const { return session_.state; }
        bool terminated() const { return session_.state == SessionState::TERMINATED; }
        const std::string &terminate_reason() const { return terminate_reason_; }

    private:
        HandleResult accept(const proto::ControlMessage &msg);
        HandleResult reject(const proto::ControlMessage &msg, proto::RejectReason reason, const std::string &text);
        HandleResult illegal(const proto::ControlMessage &msg);
        void transition(SessionState to, TransitionCause cause);
        void terminate(TransitionCause cause, const std::string &reason);

        Session session_;
        media::HostCapabilities caps_;
        uint16_t host_media_port_;
        std::string terminate_reason_;
        std::vector<TransitionListener> listeners_;
    };

/**
 * @brief Token <-> control socket map shared by the reactor and observers.
 *
 * Lookups take a shared lock, registration and removal an exclusive one.
 */
    class SessionRegistry {
    public:
        explicit SessionRegistry(uint64_t seed = std::random_device{}());

        /// Issue a fresh, never-zero token bound to @p control_fd. 0 if the fd is already bound.
        SessionToken register_session(common::sock_t control_fd);

        std::optional<common::sock_t> find_fd(SessionToken token) const;
        std::optional<SessionToken> find_token(common::sock_t fd) const;

        bool remove(SessionToken token);
        size_t size() const;

    private:
        mutable std::shared_mutex mtx_;
        std::unordered_map<SessionToken, common::sock_t> by_token_;
        std::unordered_map<common::sock_t, SessionToken> by_fd_;
        std::mt19937_64 rng_;
    };

} // namespace gamecast::session

#endif // GAMECAST_SESSION_HPP
