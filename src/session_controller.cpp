/*
* @license
* (C) zachbabanov
*
*/

#include <session_controller.hpp>
#include <logger.hpp>

#include <utility>

using namespace gamecast::common;
using gamecast::proto::MessageType;
using gamecast::session::SessionState;
using gamecast::session::TransitionCause;

namespace gamecast::host {

    SessionController::SessionController(SessionToken token, std::unique_ptr<transport::TransportSession> transport,
                                         const ControllerConfig &cfg, ControllerDeps deps, TimePoint now)
        : token_(token), cfg_(cfg), deps_(deps), transport_(std::move(transport)),
          machine_(token, cfg.capabilities, cfg.host_media_port, cfg.fec.loss_alpha, now),
          last_telemetry_(now) {
        transport_->bind_token(token);
        if (crypto::generate_session_keys(keys_)) {
            machine_.set_keys(keys_);
            // on a plain channel the key travels in the clear, input stays unsealed
            if (transport_->secure()) transport_->bind_keys(keys_);
        } else {
            LOG_SESSION_ERROR("session {:016x}: no key material, offers will be refused", token_);
        }
        machine_.subscribe([this](const session::TransitionEvent &ev) { transitions_.push_back(ev); });
    }

    SessionController::~SessionController() {
        release_resources();
    }

    void SessionController::process_events(TimePoint now) {
        transport::TransportEvent ev;
        while (!machine_.terminated() && transport_->next_event(ev)) {
            switch (ev.type) {
                case transport::EventType::CONTROL:
                    handle_control(ev.control, now);
                    break;
                case transport::EventType::INPUT: {
                    SessionState st = machine_.state();
                    if (st == SessionState::STREAMING || st == SessionState::PAUSED || st == SessionState::RECONFIGURING) {
                        deps_.input.on_input(token_, ev.input);
                    }
                    break;
                }
                case transport::EventType::FEEDBACK:
                    deps_.telemetry.counter(token_, "client_highest_frame_seq", ev.feedback.highest_frame_seq);
                    deps_.telemetry.counter(token_, "client_frames_completed", ev.feedback.frames_completed);
                    deps_.telemetry.counter(token_, "client_frames_lost", ev.feedback.frames_lost);
                    break;
                case transport::EventType::MEDIA_READY:
                    LOG_SESSION_INFO("session {:016x}: client media channel ready", token_);
                    break;
                case transport::EventType::LIVENESS_LOST:
                    machine_.on_liveness_lost(now);
                    break;
                case transport::EventType::CLOSED:
                    LOG_SESSION_INFO("session {:016x}: transport closed: {}", token_, ev.reason);
                    machine_.on_transport_closed(now);
                    break;
            }
            apply_transitions(now);
        }
        apply_transitions(now);
    }

    void SessionController::handle_control(const proto::ControlMessage &msg, TimePoint now) {
        LOG_SESSION_DEBUG("session {:016x}: <- {} seq={} in {}", token_, proto::message_type_name(msg.type),
                          msg.seq, session::state_name(machine_.state()));

        if (msg.type == MessageType::OFFER && machine_.state() == SessionState::IDLE && !keys_.valid()) {
            send(proto::make_reject(proto::RejectReason::INTERNAL_ERROR, "no session keys", msg.type, msg.seq), now);
            machine_.on_fatal_error("session key generation failed", now);
            return;
        }

        // a shared capture device keeps its format; the encoder must match it
        if (msg.type == MessageType::RECONFIGURE && orchestrator_ && audio_sub_ &&
            (machine_.state() == SessionState::STREAMING || machine_.state() == SessionState::PAUSED)) {
            capture::CaptureSettings as = capture::audio_capture_settings(msg.params);
            as.audio_chunk_ms = cfg_.audio_chunk_ms;
            if (!deps_.capture.can_deliver(cfg_.audio_device, orchestrator_.get(), as)) {
                LOG_SESSION_WARN("session {:016x}: audio device '{}' is shared, {}Hz {}ch refused", token_,
                                 cfg_.audio_device, as.sample_rate, as.channels);
                send(proto::make_reject(proto::RejectReason::RESOURCE_UNAVAILABLE,
                                        "audio capture is shared in another format", msg.type, msg.seq), now);
                return;
            }
        }

        // PLAY only becomes legal once encoders and capture are ours
        if (msg.type == MessageType::PLAY && machine_.state() == SessionState::NEGOTIATING &&
            machine_.session().setup_seen && !orchestrator_) {
            if (!acquire_resources(now)) {
                LOG_SESSION_WARN("session {:016x}: no encoder or capture available, PLAY refused", token_);
                send(proto::make_reject(proto::RejectReason::RESOURCE_UNAVAILABLE,
                                        "no encoder or capture device available", msg.type, msg.seq), now);
                return;
            }
        }

        session::HandleResult r = machine_.handle(msg, now);
        if (r.has_reply) send(r.reply, now);
        if (!r.accepted || !orchestrator_) return;

        if (msg.type == MessageType::LOSS_REPORT) {
            orchestrator_->update_loss_estimate(machine_.session().loss.value());
        } else if (msg.type == MessageType::REQUEST_KEYFRAME) {
            orchestrator_->request_keyframe();
        }
    }

    void SessionController::send(const proto::ControlMessage &msg, TimePoint now) {
        if (control_broken_ || transport_->closed()) return;
        if (!transport_->send_control(msg)) {
            control_broken_ = true;
            machine_.on_fatal_error("control channel send failed", now);
        }
    }

    bool SessionController::acquire_resources(TimePoint now) {
        const media::StreamParams &params = machine_.session().params;

        media::EncoderLease video = deps_.encoders.acquire(MediaKind::VIDEO, token_);
        if (!video) return false;
        media::EncoderLease audio = deps_.encoders.acquire(MediaKind::AUDIO, token_);
        if (!audio) return false;

        auto orch = std::make_unique<pipeline::StreamOrchestrator>(token_, params, cfg_.pipeline, cfg_.fec,
                                                                   std::move(video), std::move(audio), *transport_);
        if (!orch->start()) return false;

        capture::CaptureSettings vs = capture::video_capture_settings(params);
        capture::CaptureSubscription vsub = deps_.capture.subscribe(cfg_.video_device, vs, orch.get(), now);
        if (!vsub) return false;

        capture::CaptureSettings as = capture::audio_capture_settings(params);
        as.audio_chunk_ms = cfg_.audio_chunk_ms;
        capture::CaptureSubscription asub = deps_.capture.subscribe(cfg_.audio_device, as, orch.get(), now);
        if (!asub) return false;    // vsub unsubscribes before orch goes away

        orchestrator_ = std::move(orch);
        video_sub_ = std::move(vsub);
        audio_sub_ = std::move(asub);
        return true;
    }

    void SessionController::release_resources() {
        audio_sub_.reset();
        video_sub_.reset();
        if (orchestrator_) {
            if (orchestrator_->running()) orchestrator_->cancel();
            orchestrator_.reset();      // encoder leases go back to the pool here
        }
    }

    void SessionController::apply_transitions(TimePoint now) {
        while (!transitions_.empty()) {
            session::TransitionEvent ev = transitions_.front();
            transitions_.pop_front();
            apply(ev, now);
        }
    }

    void SessionController::apply(const session::TransitionEvent &ev, TimePoint now) {
        deps_.telemetry.transition(token_, session::state_name(ev.from), session::state_name(ev.to),
                                   session::cause_name(ev.cause));

        switch (ev.to) {
            case SessionState::STREAMING:
                if (ev.cause == TransitionCause::RESUME && orchestrator_) orchestrator_->resume();
                break;

            case SessionState::PAUSED:
                if (orchestrator_) orchestrator_->pause(now);
                break;

            case SessionState::RECONFIGURING: {
                if (!orchestrator_) {
                    machine_.on_fatal_error("reconfigure without a running pipeline", now);
                    break;
                }
                const media::StreamParams &params = machine_.session().params;
                bool was_paused = orchestrator_->paused();
                if (!orchestrator_->reconfigure(params, now)) {
                    machine_.on_fatal_error(orchestrator_->fatal_reason(), now);
                    break;
                }
                if (video_sub_ && !deps_.capture.reconfigure(cfg_.video_device, orchestrator_.get(),
                                                             capture::video_capture_settings(params), now)) {
                    LOG_SESSION_INFO("session {:016x}: capture keeps its mode, encoder scales", token_);
                }
                capture::CaptureSettings as = capture::audio_capture_settings(params);
                as.audio_chunk_ms = cfg_.audio_chunk_ms;
                if (audio_sub_ && !capture::formats_compatible(deps_.capture.settings(cfg_.audio_device), as) &&
                    !deps_.capture.reconfigure(cfg_.audio_device, orchestrator_.get(), as, now)) {
                    machine_.on_fatal_error("audio capture cannot switch to " + std::to_string(as.sample_rate) + "Hz " +
                                            std::to_string(as.channels) + "ch", now);
                    break;
                }
                if (was_paused) orchestrator_->resume();
                machine_.complete_reconfigure(now);
                break;
            }

            case SessionState::TERMINATED: {
                // final counters first, the orchestrator goes away with the resources
                report_telemetry(now);
                release_resources();
                transport_->clear_media();
                // the client already knows when it asked, was rejected, or hung up
                if (ev.cause != TransitionCause::TEARDOWN && ev.cause != TransitionCause::TRANSPORT_CLOSED &&
                    ev.cause != TransitionCause::OFFER_REJECTED) {
                    send(proto::make_teardown(machine_.terminate_reason()), now);
                }
                break;
            }

            default:
                break;
        }
    }

    void SessionController::report_telemetry(TimePoint now) {
        last_telemetry_ = now;
        const transport::TransportCounters &tc = transport_->counters();
        deps_.telemetry.counter(token_, "datagrams_sent", tc.datagrams_sent);
        deps_.telemetry.counter(token_, "datagrams_dropped", tc.datagrams_dropped);
        deps_.telemetry.counter(token_, "send_errors", tc.send_errors);
        deps_.telemetry.counter(token_, "loss_estimate_ppm", (uint64_t)(machine_.session().loss.value() * 1e6));
        if (orchestrator_) {
            const pipeline::TrackStats &v = orchestrator_->stats().video();
            deps_.telemetry.counter(token_, "video_frames_encoded", v.frames_encoded);
            deps_.telemetry.counter(token_, "video_input_dropped", v.input_dropped);
            deps_.telemetry.counter(token_, "video_blocks_dropped", v.blocks_dropped);
            deps_.telemetry.counter(token_, "video_deadline_misses", v.deadline_misses);
            deps_.telemetry.counter(token_, "video_keyframes_forced", v.keyframes_forced);
            deps_.telemetry.counter(token_, "audio_frames_encoded", orchestrator_->stats().audio().frames_encoded);
        }
    }

    void SessionController::step(TimePoint now) {
        if (machine_.terminated()) return;

        if (orchestrator_) {
            orchestrator_->step(now);
            if (orchestrator_->fatal()) machine_.on_fatal_error(orchestrator_->fatal_reason(), now);
        }
        apply_transitions(now);
        if (machine_.terminated()) return;

        transport_->flush_media(now);
        transport_->check_liveness(now);
        if (now - last_telemetry_ >= cfg_.telemetry_interval) report_telemetry(now);
    }

} // namespace gamecast::host
