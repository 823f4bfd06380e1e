/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_HOST_HPP
#define GAMECAST_HOST_HPP

#pragma once

#include <capture.hpp>
#include <common.hpp>
#include <config.hpp>
#include <encoder.hpp>
#include <input.hpp>
#include <session.hpp>
#include <session_controller.hpp>
#include <telemetry.hpp>
#include <tls.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace gamecast::host {

    using common::sock_t;

/**
 * @brief The streaming host: one epoll reactor driving every session.
 *
 * Listens for control connections on TCP and owns the single UDP media
 * socket. Each loop iteration services socket events, pulls due frames from
 * the capture hub and steps every session's pipeline. Nothing here blocks
 * except epoll_wait itself.
 */
    class StreamHost {
    public:
        /// Called once the sockets are bound, e.g. to publish an mDNS record.
        using DiscoveryHook = std::function<void(uint16_t control_port, uint16_t media_port)>;

        explicit StreamHost(const config::HostConfig &cfg);
        ~StreamHost();

        StreamHost(const StreamHost &) = delete;
        StreamHost &operator=(const StreamHost &) = delete;

        bool start();
        /// Runs until stop() is called.
        void runLoop();
        /// One reactor iteration, waiting at most @p timeout_ms for events.
        void poll_once(int timeout_ms);
        /// Safe to call from a signal handler.
        void stop() { running_.store(false); }

        void set_discovery_hook(DiscoveryHook hook) { discovery_ = std::move(hook); }

        uint16_t control_port() const { return controlPort_; }
        uint16_t media_port() const { return mediaPort_; }
        size_t session_count() const { return sessions_.size(); }
        /// SHA-256 of the control channel certificate; empty when TLS is off or before start().
        std::string tls_fingerprint() const { return tls_ ? tls_->fingerprint() : std::string(); }

        /// Null when no live session has @p token.
        const SessionController *find_session(common::SessionToken token) const;

        media::EncoderPool &encoders() { return encoders_; }
        capture::CaptureHub &capture() { return capture_; }
        telemetry::LoggingTelemetry &telemetry() { return telemetry_; }
        input::LoggingInputSink &input() { return input_; }
        session::SessionRegistry &registry() { return registry_; }

    private:
        bool setupListenSocket();
        bool setupMediaSocket();
        void acceptNewConnections(common::TimePoint now);
        void rejectConnection(sock_t fd, proto::RejectReason reason, const char *text);
        void handleTcpEvent(sock_t fd, uint32_t events, common::TimePoint now);
        void handleMediaEvent(common::TimePoint now);
        void driveSessions(common::TimePoint now);
        void closeConnection(sock_t fd);

        config::HostConfig cfg_;
        ControllerConfig controllerCfg_;
        transport::TransportConfig transportCfg_;

        sock_t tcpListenSocket_;
        sock_t mediaSocket_;
        int epollFd_;
        uint16_t controlPort_;
        uint16_t mediaPort_;
        std::atomic<bool> running_;
        DiscoveryHook discovery_;
        std::shared_ptr<tls::TlsContext> tls_;

        media::EncoderPool encoders_;
        capture::CaptureHub capture_;
        telemetry::LoggingTelemetry telemetry_;
        input::LoggingInputSink input_;
        session::SessionRegistry registry_;

        // declared last: sessions hold leases on encoders_ and subscriptions on capture_
        std::unordered_map<sock_t, std::unique_ptr<SessionController>> sessions_;
    };

} // namespace gamecast::host

#endif // GAMECAST_HOST_HPP
