/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_CLIENT_HPP
#define GAMECAST_CLIENT_HPP

#pragma once

#include <common.hpp>
#include <config.hpp>
#include <crypto.hpp>
#include <fec.hpp>
#include <input.hpp>
#include <media.hpp>
#include <player.hpp>
#include <protocol.hpp>
#include <tls.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <netinet/in.h>

namespace gamecast::client {

    struct ClientStats {
        uint64_t datagrams_received = 0;
        uint64_t datagrams_invalid = 0;
        uint64_t bytes_received = 0;
        uint64_t video_frames = 0;
        uint64_t audio_frames = 0;
        uint64_t frames_recovered = 0;
        uint64_t frames_lost = 0;
        uint64_t highest_video_seq = 0;
        uint64_t heartbeats_sent = 0;
        uint64_t loss_reports_sent = 0;
        uint64_t keyframe_requests = 0;
        double last_loss_ratio = 0.0;
    };

/**
 * @brief Reference client: negotiates a session and plays it back.
 *
 * Single-threaded. Every public call that waits for the host keeps pumping
 * media while it waits, so nothing stalls during a PAUSE/RECONFIGURE round
 * trip. Control requests are answered by ACK or REJECT carrying our seq.
 */
    class StreamClient {
    public:
        using FrameCallback = std::function<void(const fec::ReassembledFrame &)>;

        explicit StreamClient(const config::ClientConfig &cfg);
        ~StreamClient();

        StreamClient(const StreamClient &) = delete;
        StreamClient &operator=(const StreamClient &) = delete;

        /// Connect, negotiate, stream for duration_s (or until stop()), tear down.
        bool run();

        /// TCP connect with timeout, TLS handshake (with fingerprint pin) and UDP bind.
        bool connect();
        /// OFFER -> ANSWER, MEDIA_HELLO, SETUP -> ACK, PLAY -> ACK.
        bool negotiate();

        /// Wait at most @p timeout_ms for traffic, then handle timers.
        void poll_once(int timeout_ms);
        void run_for(std::chrono::milliseconds d);

        bool pause();
        bool play();
        bool reconfigure(const media::StreamParams &params);
        bool request_keyframe();
        bool teardown(const std::string &reason);

        /// Best-effort, assigns the next input seq.
        bool send_input(input::InputDevice device, uint16_t code, int32_t value);
        bool send_feedback();

        void set_frame_callback(FrameCallback cb) { on_frame_ = std::move(cb); }
        /// Safe to call from a signal handler.
        void stop() { stop_.store(true); }

        common::SessionToken token() const { return token_; }
        const media::StreamParams &params() const { return params_; }
        uint16_t host_media_port() const { return host_media_port_; }
        uint16_t local_media_port() const { return local_media_port_; }
        bool playing() const { return playing_; }
        bool secure() const { return stream_ && stream_->secure(); }
        /// Host certificate fingerprint seen during the handshake.
        std::string host_fingerprint() const { return stream_ ? stream_->peer_fingerprint() : std::string(); }
        /// False after TEARDOWN, a fatal REJECT or a closed control channel.
        bool alive() const { return connected_ && !ended_; }
        const std::string &end_reason() const { return end_reason_; }
        proto::RejectReason last_reject() const { return last_reject_; }
        const ClientStats &stats() const { return stats_; }
        const VideoOutput *output() const { return output_.get(); }

    private:
        bool send_control(proto::ControlMessage &msg);
        /// Send @p msg and wait for the ACK/REJECT (ANSWER for OFFER) that refers to it.
        bool request(proto::ControlMessage msg, proto::ControlMessage &reply);
        bool wait_reply(proto::MessageType type, uint32_t seq, proto::ControlMessage &reply);

        void read_control();
        void handle_host_message(const proto::ControlMessage &msg);
        void read_media(common::TimePoint now);
        void deliver(const fec::ReassembledFrame &frame, common::TimePoint now);
        void timers(common::TimePoint now);
        void send_loss_report();
        void maybe_request_keyframe(common::TimePoint now);
        bool send_datagram(const std::vector<uint8_t> &dgram);
        void send_media_hello();
        void end(const std::string &reason);
        void closeSockets();

        config::ClientConfig cfg_;
        common::sock_t tcpSock_;
        common::sock_t udpSock_;
        std::shared_ptr<tls::TlsContext> tls_;
        std::unique_ptr<tls::ControlStream> stream_;
        sockaddr_in hostMediaAddr_{};
        uint16_t local_media_port_ = 0;

        common::SessionToken token_ = 0;
        media::StreamParams params_;
        uint16_t host_media_port_ = 0;
        crypto::SessionKeys keys_;

        proto::ControlFramer framer_;
        std::deque<proto::ControlMessage> replies_;
        uint32_t next_seq_ = 1;
        uint32_t input_seq_ = 0;

        fec::FecReassembler reassembler_;
        std::unique_ptr<VideoOutput> output_;
        FrameCallback on_frame_;
        uint64_t frames_completed_interval_ = 0;
        uint64_t frames_lost_interval_ = 0;

        common::TimePoint last_heartbeat_{};
        common::TimePoint last_loss_report_{};
        common::TimePoint last_keyframe_request_{};
        bool keyframe_wanted_ = false;

        bool connected_ = false;
        bool playing_ = false;
        bool started_ = false;
        bool ended_ = false;
        std::string end_reason_;
        proto::RejectReason last_reject_ = proto::RejectReason::NONE;
        std::atomic<bool> stop_;

        ClientStats stats_;
    };

} // namespace gamecast::client

#endif // GAMECAST_CLIENT_HPP
