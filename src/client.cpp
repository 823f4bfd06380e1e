/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <logger.hpp>
#include <transport.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace gamecast::common;
using gamecast::proto::MessageType;

namespace gamecast::client {

namespace {

    constexpr size_t MAX_KEPT_REPLIES = 32;
    constexpr std::chrono::milliseconds KEYFRAME_REQUEST_INTERVAL{250};
    constexpr std::chrono::milliseconds REPLY_TIMEOUT{3000};

} // namespace

    StreamClient::StreamClient(const config::ClientConfig &cfg)
        : cfg_(cfg), tcpSock_(INVALID_SOCK), udpSock_(INVALID_SOCK), params_(cfg.params),
          reassembler_(std::chrono::milliseconds(cfg.reassembly_max_age_ms)),
          stop_(false) {}

    StreamClient::~StreamClient() {
        output_.reset();
        closeSockets();
    }

    void StreamClient::closeSockets() {
        if (stream_) {
            stream_->shutdown();
            stream_.reset();
        }
        if (tcpSock_ != INVALID_SOCK) {
            closeSocket(tcpSock_);
            tcpSock_ = INVALID_SOCK;
        }
        if (udpSock_ != INVALID_SOCK) {
            closeSocket(udpSock_);
            udpSock_ = INVALID_SOCK;
        }
        connected_ = false;
    }

    bool StreamClient::connect() {
        addrinfo hints{};
        addrinfo *res = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        if (getaddrinfo(cfg_.host.c_str(), std::to_string(cfg_.control_port).c_str(), &hints, &res) != 0) {
            LOG_NET_ERROR("getaddrinfo failed for {}:{}", cfg_.host, cfg_.control_port);
            return false;
        }

        sock_t tcp = INVALID_SOCK;
        for (addrinfo *rp = res; rp; rp = rp->ai_next) {
            tcp = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
            if (tcp == INVALID_SOCK) continue;

            setSocketNonBlocking(tcp);
            enableSocketKeepAliveAndNoDelay(tcp);

            int r = ::connect(tcp, rp->ai_addr, rp->ai_addrlen);
            if (r == 0) {
                hostMediaAddr_ = *(const sockaddr_in *)rp->ai_addr;
                break;
            }
            if (errno == EINPROGRESS) {
                pollfd pfd{tcp, POLLOUT, 0};
                int pr = poll(&pfd, 1, (int)cfg_.connect_timeout_ms);
                int err = 0;
                socklen_t elen = sizeof(err);
                if (pr > 0 && getsockopt(tcp, SOL_SOCKET, SO_ERROR, &err, &elen) == 0 && err == 0) {
                    hostMediaAddr_ = *(const sockaddr_in *)rp->ai_addr;
                    break;
                }
                LOG_NET_WARN("connect to {}:{} failed: {}", cfg_.host, cfg_.control_port,
                             pr == 0 ? "timeout" : strerror(err ? err : errno));
            }
            closeSocket(tcp);
            tcp = INVALID_SOCK;
        }
        freeaddrinfo(res);
        if (tcp == INVALID_SOCK) {
            LOG_NET_ERROR("Failed to connect control channel to {}:{}", cfg_.host, cfg_.control_port);
            return false;
        }
        tcpSock_ = tcp;

        if (cfg_.tls.enabled) {
            if (!tls_) tls_ = tls::TlsContext::create_client(cfg_.tls);
            if (tls_) stream_ = tls_->wrap(tcp);
            if (!stream_) {
                closeSockets();
                return false;
            }
            std::string error;
            if (!tls::complete_handshake(*stream_, std::chrono::milliseconds(cfg_.connect_timeout_ms), error)) {
                LOG_NET_ERROR("TLS handshake with {}:{} failed: {}", cfg_.host, cfg_.control_port, error);
                closeSockets();
                return false;
            }
            std::string fp = stream_->peer_fingerprint();
            if (!cfg_.tls.pinned_fingerprint.empty() && !tls::fingerprint_matches(cfg_.tls.pinned_fingerprint, fp)) {
                LOG_NET_ERROR("host certificate {} does not match the pinned fingerprint", fp);
                closeSockets();
                return false;
            }
            LOG_NET_INFO("TLS established, host certificate {}", fp);
        } else {
            stream_ = std::make_unique<tls::PlainStream>(tcp);
        }

        sock_t udp = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (udp == INVALID_SOCK) {
            LOG_NET_ERROR("UDP socket creation failed: {}", strerror(errno));
            closeSockets();
            return false;
        }
        udpSock_ = udp;

        // Increase UDP buffer sizes (best-effort)
        int rcvbuf = 4 * 1024 * 1024;
        setsockopt(udp, SOL_SOCKET, SO_RCVBUF, (char *)&rcvbuf, sizeof(rcvbuf));
        setSocketNonBlocking(udp);

        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        local.sin_port = htons(cfg_.media_port);
        if (bind(udp, (sockaddr *)&local, sizeof(local)) < 0) {
            LOG_NET_ERROR("UDP bind to port {} failed: {}", cfg_.media_port, strerror(errno));
            closeSockets();
            return false;
        }
        socklen_t len = sizeof(local);
        getsockname(udp, (sockaddr *)&local, &len);
        local_media_port_ = ntohs(local.sin_port);

        connected_ = true;
        LOG_NET_INFO("Connected to {}:{}, media on local UDP port {}", cfg_.host, cfg_.control_port, local_media_port_);
        return true;
    }

    bool StreamClient::send_control(proto::ControlMessage &msg) {
        if (!connected_ || !stream_) return false;
        msg.seq = next_seq_++;
        std::vector<uint8_t> buf = proto::encode_message(msg);

        std::string error;
        if (!tls::write_all(*stream_, buf.data(), buf.size(), std::chrono::milliseconds(1000), error)) {
            LOG_NET_WARN("control send of {} failed: {}", proto::message_type_name(msg.type), error);
            end("control channel send failed");
            return false;
        }
        LOG_SESSION_DEBUG("-> {} seq={}", proto::message_type_name(msg.type), msg.seq);
        return true;
    }

    bool StreamClient::wait_reply(MessageType type, uint32_t seq, proto::ControlMessage &reply) {
        TimePoint deadline = Clock::now() + REPLY_TIMEOUT;
        while (!stop_.load()) {
            for (auto it = replies_.begin(); it != replies_.end(); ++it) {
                bool match;
                if (type == MessageType::OFFER) {
                    match = it->type == MessageType::ANSWER ||
                            (it->type == MessageType::REJECT && it->ref_type == MessageType::OFFER);
                } else {
                    match = (it->type == MessageType::ACK || it->type == MessageType::REJECT) && it->ref_seq == seq;
                }
                if (match) {
                    reply = *it;
                    replies_.erase(it);
                    return true;
                }
            }
            // a REJECT that ended the session (HOST_FULL) never refers to our request
            if (!alive()) return false;
            TimePoint now = Clock::now();
            if (now >= deadline) {
                LOG_SESSION_WARN("no reply to {} seq={}", proto::message_type_name(type), seq);
                return false;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            poll_once((int)std::min<long long>(left, 20));
        }
        return false;
    }

    bool StreamClient::request(proto::ControlMessage msg, proto::ControlMessage &reply) {
        if (!alive()) return false;
        if (!send_control(msg)) return false;
        if (!wait_reply(msg.type, msg.seq, reply)) return false;
        if (reply.type == MessageType::REJECT) {
            last_reject_ = reply.reason;
            LOG_SESSION_WARN("{} rejected: {} ({})", proto::message_type_name(msg.type),
                             proto::reject_reason_name(reply.reason), reply.text);
            return false;
        }
        return true;
    }

    bool StreamClient::negotiate() {
        proto::ControlMessage reply;
        if (!request(proto::make_offer(cfg_.params, cfg_.name), reply)) {
            if (last_reject_ != proto::RejectReason::NONE) end("offer rejected");
            return false;
        }
        token_ = reply.token;
        params_ = reply.params;
        host_media_port_ = reply.media_port;
        keys_ = reply.keys;
        hostMediaAddr_.sin_port = htons(host_media_port_);
        LOG_SESSION_INFO("session {:016x} answered: {} host media port {}", token_, params_.describe(), host_media_port_);

        send_media_hello();

        if (!request(proto::make_setup(token_, local_media_port_), reply)) return false;
        TimePoint now = Clock::now();
        last_heartbeat_ = now;
        last_loss_report_ = now;
        // media may arrive before the PLAY ack
        if (!cfg_.output_file.empty() || !cfg_.player_cmd.empty()) {
            output_ = std::make_unique<VideoOutput>(params_.codec, cfg_.output_file, cfg_.player_cmd);
            if (!output_->ok()) LOG_VIDEO_WARN("video output partially unavailable");
        }
        return play();
    }

    bool StreamClient::play() {
        proto::ControlMessage reply;
        if (!request(proto::make_simple(MessageType::PLAY), reply)) return false;
        playing_ = true;
        started_ = true;
        return true;
    }

    bool StreamClient::pause() {
        proto::ControlMessage reply;
        if (!request(proto::make_simple(MessageType::PAUSE), reply)) return false;
        playing_ = false;
        return true;
    }

    bool StreamClient::reconfigure(const media::StreamParams &params) {
        proto::ControlMessage reply;
        if (!request(proto::make_reconfigure(params), reply)) return false;
        if (params.codec != params_.codec) {
            LOG_VIDEO_WARN("codec changed from {} to {}, output keeps the old container format",
                           codec_name(params_.codec), codec_name(params.codec));
        }
        params_ = params;
        LOG_SESSION_INFO("session {:016x} reconfigured: {}", token_, params_.describe());
        return true;
    }

    bool StreamClient::request_keyframe() {
        proto::ControlMessage msg = proto::make_simple(MessageType::REQUEST_KEYFRAME);
        if (!send_control(msg)) return false;
        ++stats_.keyframe_requests;
        last_keyframe_request_ = Clock::now();
        return true;
    }

    bool StreamClient::teardown(const std::string &reason) {
        if (!alive()) return false;
        proto::ControlMessage reply;
        bool ok = request(proto::make_teardown(reason), reply);
        end("teardown: " + reason);
        return ok;
    }

    bool StreamClient::send_datagram(const std::vector<uint8_t> &dgram) {
        if (udpSock_ == INVALID_SOCK || host_media_port_ == 0) return false;
        ssize_t n = sendto(udpSock_, dgram.data(), dgram.size(), 0, (const sockaddr *)&hostMediaAddr_,
                           sizeof(hostMediaAddr_));
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_NET_DEBUG("datagram send failed: {}", strerror(errno));
            }
            return false;
        }
        return true;
    }

    void StreamClient::send_media_hello() {
        send_datagram(transport::encode_datagram(transport::DatagramType::MEDIA_HELLO, token_, {}));
    }

    bool StreamClient::send_input(input::InputDevice device, uint16_t code, int32_t value) {
        if (!alive() || token_ == 0) return false;
        input::InputEvent ev;
        ev.seq = ++input_seq_;
        ev.device = device;
        ev.code = code;
        ev.value = value;
        std::vector<uint8_t> body;
        input::encode_input(ev, body);
        // the host only expects sealed input when the key came over TLS
        if (secure() && keys_.valid()) {
            std::vector<uint8_t> sealed;
            if (!crypto::seal(keys_, body.data(), body.size(), sealed)) {
                LOG_NET_WARN("cannot seal input event {}", ev.seq);
                return false;
            }
            body.swap(sealed);
        }
        return send_datagram(transport::encode_datagram(transport::DatagramType::INPUT, token_, body));
    }

    bool StreamClient::send_feedback() {
        if (!alive() || token_ == 0) return false;
        transport::FeedbackPacket fb;
        fb.highest_frame_seq = stats_.highest_video_seq;
        fb.frames_completed = (uint32_t)frames_completed_interval_;
        fb.frames_lost = (uint32_t)frames_lost_interval_;
        frames_completed_interval_ = 0;
        frames_lost_interval_ = 0;
        std::vector<uint8_t> body;
        transport::encode_feedback(fb, body);
        return send_datagram(transport::encode_datagram(transport::DatagramType::FEEDBACK, token_, body));
    }

    void StreamClient::end(const std::string &reason) {
        if (ended_) return;
        ended_ = true;
        playing_ = false;
        end_reason_ = reason;
        LOG_SESSION_INFO("session {:016x} ended: {}", token_, reason);
    }

    void StreamClient::read_control() {
        if (!stream_) return;
        uint8_t buf[BUFFER_SIZE];
        for (;;) {
            tls::IoResult r = stream_->read(buf, sizeof(buf));
            if (r.status == tls::IoStatus::OK) {
                framer_.feed(buf, r.bytes);
                continue;
            }
            if (r.status == tls::IoStatus::CLOSED) {
                end("control channel closed by host");
            } else if (r.status == tls::IoStatus::FAILED) {
                LOG_NET_WARN("control recv failed: {}", stream_->last_error());
                end("control channel error");
            }
            // WANT_WRITE only happens mid-renegotiation; the next send flushes it
            break;
        }

        proto::ControlMessage msg;
        for (;;) {
            proto::ControlFramer::Status st = framer_.next(msg);
            if (st == proto::ControlFramer::Status::NEED_MORE) break;
            if (st == proto::ControlFramer::Status::ERROR) {
                LOG_NET_ERROR("corrupt control stream: {}", framer_.last_error());
                end("corrupt control stream");
                break;
            }
            handle_host_message(msg);
        }
    }

    void StreamClient::handle_host_message(const proto::ControlMessage &msg) {
        LOG_SESSION_DEBUG("<- {} seq={}", proto::message_type_name(msg.type), msg.seq);
        switch (msg.type) {
            case MessageType::TEARDOWN:
                end(msg.text.empty() ? std::string("host teardown") : "host teardown: " + msg.text);
                break;
            case MessageType::REJECT:
                // HOST_FULL arrives before any request of ours was read
                if (msg.reason == proto::RejectReason::HOST_FULL) {
                    last_reject_ = msg.reason;
                    end("host full");
                    break;
                }
                replies_.push_back(msg);
                break;
            case MessageType::ACK:
            case MessageType::ANSWER:
                replies_.push_back(msg);
                break;
            default:
                LOG_SESSION_WARN("unexpected {} from host", proto::message_type_name(msg.type));
                break;
        }
        // heartbeats and loss reports are acknowledged too; nobody waits for those
        while (replies_.size() > MAX_KEPT_REPLIES) replies_.pop_front();
    }

    void StreamClient::read_media(TimePoint now) {
        uint8_t buf[65536];
        uint16_t tag = (uint16_t)(token_ & 0xFFFF);
        for (;;) {
            ssize_t n = recv(udpSock_, buf, sizeof(buf), 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) LOG_NET_WARN("media recv failed: {}", strerror(errno));
                break;
            }
            ++stats_.datagrams_received;
            stats_.bytes_received += (uint64_t)n;

            fec::ShardPacket pkt;
            if (!fec::ShardPacket::parse(buf, (size_t)n, pkt) || token_ == 0 || pkt.session_tag != tag) {
                ++stats_.datagrams_invalid;
                continue;
            }
            fec::ReassembledFrame frame;
            fec::FecReassembler::Result r = reassembler_.add(pkt, now, frame);
            if (r == fec::FecReassembler::Result::COMPLETE) {
                deliver(frame, now);
            } else if (r == fec::FecReassembler::Result::INVALID) {
                ++stats_.datagrams_invalid;
                LOG_FEC_DEBUG("inconsistent shard for frame {}", pkt.frame_seq);
            }
        }
    }

    void StreamClient::deliver(const fec::ReassembledFrame &frame, TimePoint now) {
        ++frames_completed_interval_;
        if (frame.used_parity) ++stats_.frames_recovered;
        if (frame.kind == MediaKind::VIDEO) {
            ++stats_.video_frames;
            if (frame.frame_seq > stats_.highest_video_seq) stats_.highest_video_seq = frame.frame_seq;
            if (frame.keyframe) keyframe_wanted_ = false;
            if (output_ && output_->write_frame(frame.payload)) {
                keyframe_wanted_ = true;
                maybe_request_keyframe(now);
            }
        } else {
            ++stats_.audio_frames;
        }
        if (on_frame_) on_frame_(frame);
    }

    void StreamClient::maybe_request_keyframe(TimePoint now) {
        if (!keyframe_wanted_ || !playing_) return;
        if (now - last_keyframe_request_ < KEYFRAME_REQUEST_INTERVAL) return;
        LOG_VIDEO_INFO("requesting keyframe");
        request_keyframe();
    }

    void StreamClient::send_loss_report() {
        fec::ReassemblyCounters c = reassembler_.take_counters();
        proto::LossReport lr;
        lr.shards_expected = c.shards_expected;
        lr.shards_received = c.shards_received > c.shards_expected ? c.shards_expected : c.shards_received;
        lr.frames_recovered = (uint32_t)c.frames_recovered;
        lr.frames_unrecoverable = (uint32_t)c.frames_unrecoverable;
        stats_.last_loss_ratio = lr.loss_ratio();

        proto::ControlMessage msg = proto::make_loss_report(lr);
        if (send_control(msg)) {
            ++stats_.loss_reports_sent;
            LOG_FEC_DEBUG("loss report: expected={} received={} recovered={} lost={}", lr.shards_expected,
                          lr.shards_received, lr.frames_recovered, lr.frames_unrecoverable);
        }
        send_feedback();
    }

    void StreamClient::timers(TimePoint now) {
        // heartbeats and loss reports are only legal once the stream started
        if (!alive() || !started_) return;

        size_t video_lost = 0;
        size_t lost = reassembler_.expire(now, &video_lost);
        if (lost > 0) {
            stats_.frames_lost += lost;
            frames_lost_interval_ += lost;
            LOG_FEC_DEBUG("{} frame(s) unrecoverable ({} video)", (uint64_t)lost, (uint64_t)video_lost);
        }
        if (video_lost > 0) keyframe_wanted_ = true;
        maybe_request_keyframe(now);

        if (output_) output_->flush();

        if (now - last_heartbeat_ >= std::chrono::milliseconds(cfg_.heartbeat_ms)) {
            last_heartbeat_ = now;
            proto::ControlMessage hb = proto::make_simple(MessageType::HEARTBEAT);
            if (send_control(hb)) ++stats_.heartbeats_sent;
            // refresh the host's view of our media address (NAT rebinding)
            send_media_hello();
        }
        if (playing_ && now - last_loss_report_ >= std::chrono::milliseconds(cfg_.loss_report_ms)) {
            last_loss_report_ = now;
            send_loss_report();
        }
    }

    void StreamClient::poll_once(int timeout_ms) {
        if (!connected_) return;
        pollfd fds[2];
        fds[0] = pollfd{tcpSock_, POLLIN, 0};
        fds[1] = pollfd{udpSock_, POLLIN, 0};
        int r = poll(fds, 2, timeout_ms);
        if (r < 0 && errno != EINTR) {
            LOG_NET_ERROR("poll failed: {}", strerror(errno));
            end("poll failure");
            return;
        }
        TimePoint now = Clock::now();
        if (r > 0) {
            if (fds[1].revents & POLLIN) read_media(now);
            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) read_control();
        }
        timers(now);
    }

    void StreamClient::run_for(std::chrono::milliseconds d) {
        TimePoint until = Clock::now() + d;
        while (!stop_.load() && alive() && Clock::now() < until) {
            poll_once(10);
        }
    }

    bool StreamClient::run() {
        if (!connect()) return false;
        if (!negotiate()) {
            LOG_SESSION_ERROR("negotiation failed{}", last_reject_ != proto::RejectReason::NONE
                              ? std::string(": ") + proto::reject_reason_name(last_reject_) : std::string());
            closeSockets();
            return false;
        }

        TimePoint started = Clock::now();
        TimePoint last_stats = started;
        while (!stop_.load() && alive()) {
            poll_once(10);
            TimePoint now = Clock::now();
            if (now - last_stats >= std::chrono::seconds(5)) {
                last_stats = now;
                LOG_GEN_INFO("video={} audio={} recovered={} lost={} loss={:.3f} keyframe_requests={}",
                             stats_.video_frames, stats_.audio_frames, stats_.frames_recovered, stats_.frames_lost,
                             stats_.last_loss_ratio, stats_.keyframe_requests);
            }
            if (cfg_.duration_s > 0 && now - started >= std::chrono::seconds(cfg_.duration_s)) break;
        }

        bool clean = true;
        if (alive()) {
            stop_.store(false);   // let the TEARDOWN round trip complete after an interrupt
            clean = teardown("client done");
        } else {
            clean = last_reject_ == proto::RejectReason::NONE;
        }
        LOG_GEN_INFO("session {:016x} finished: {} video frames, {} audio frames, {} lost",
                     token_, stats_.video_frames, stats_.audio_frames, stats_.frames_lost);
        closeSockets();
        return clean;
    }

} // namespace gamecast::client
