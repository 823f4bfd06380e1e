/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_SESSION_CONTROLLER_HPP
#define GAMECAST_SESSION_CONTROLLER_HPP

#pragma once

#include <capture.hpp>
#include <common.hpp>
#include <crypto.hpp>
#include <encoder.hpp>
#include <fec.hpp>
#include <input.hpp>
#include <orchestrator.hpp>
#include <session.hpp>
#include <telemetry.hpp>
#include <transport.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace gamecast::host {

    using common::SessionToken;
    using common::TimePoint;

    struct ControllerConfig {
        media::HostCapabilities capabilities;
        pipeline::PipelineConfig pipeline;
        fec::FecConfig fec;
        std::string video_device = "display:0";
        std::string audio_device = "audio:default";
        uint32_t audio_chunk_ms = 10;
        uint16_t host_media_port = 0;
        std::chrono::milliseconds telemetry_interval{1000};
    };

    /// Host-wide services a controller borrows; they outlive every session.
    struct ControllerDeps {
        media::EncoderPool &encoders;
        capture::CaptureHub &capture;
        input::IInputSink &input;
        telemetry::ITelemetry &telemetry;
    };

/**
 * @brief Applies one session's state machine to its pipeline and channels.
 *
 * Transport events go into the state machine; the transitions it publishes
 * come back here and start, pause, reconfigure or tear down the pipeline.
 * Encoders and capture subscriptions are held only while the session is
 * alive and are given back the moment it terminates.
 */
    class SessionController {
    public:
        SessionController(SessionToken token, std::unique_ptr<transport::TransportSession> transport,
                          const ControllerConfig &cfg, ControllerDeps deps, TimePoint now);
        ~SessionController();

        SessionController(const SessionController &) = delete;
        SessionController &operator=(const SessionController &) = delete;

        /// Consume every queued transport event.
        void process_events(TimePoint now);

        /// Advance the pipeline, push media out, check liveness.
        void step(TimePoint now);

        /// Terminated and cleaned up; the host may destroy it.
        bool finished() const { return machine_.terminated(); }

        SessionToken token() const { return token_; }
        transport::TransportSession &transport() { return *transport_; }
        const session::SessionStateMachine &state_machine() const { return machine_; }
        /// Null unless the session is past PLAY and not terminated.
        const pipeline::StreamOrchestrator *orchestrator() const { return orchestrator_.get(); }

    private:
        void handle_control(const proto::ControlMessage &msg, TimePoint now);
        void send(const proto::ControlMessage &msg, TimePoint now);
        bool acquire_resources(TimePoint now);
        void release_resources();
        void apply_transitions(TimePoint now);
        void apply(const session::TransitionEvent &ev, TimePoint now);
        void report_telemetry(TimePoint now);

        SessionToken token_;
        ControllerConfig cfg_;
        ControllerDeps deps_;
        std::unique_ptr<transport::TransportSession> transport_;
        session::SessionStateMachine machine_;
        std::deque<session::TransitionEvent> transitions_;

        // destroyed before transport_: the orchestrator holds a reference to it
        std::unique_ptr<pipeline::StreamOrchestrator> orchestrator_;
        capture::CaptureSubscription video_sub_;
        capture::CaptureSubscription audio_sub_;

        crypto::SessionKeys keys_;
        TimePoint last_telemetry_;
        bool control_broken_ = false;
    };

} // namespace gamecast::host

#endif // GAMECAST_SESSION_CONTROLLER_HPP
