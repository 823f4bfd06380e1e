/*
* @license
* (C) zachbabanov
*
*/

#include <transport.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace gamecast::common;

namespace gamecast::transport {

namespace {

    // Token bucket depth: short bursts up to this much of one second are allowed.
    constexpr double PACING_BURST_SECONDS = 0.05;

} // namespace

    const char *datagram_type_name(DatagramType t) {
        switch (t) {
            case DatagramType::MEDIA_HELLO: return "MEDIA_HELLO";
            case DatagramType::INPUT: return "INPUT";
            case DatagramType::FEEDBACK: return "FEEDBACK";
        }
        return "UNKNOWN";
    }

    const char *event_type_name(EventType t) {
        switch (t) {
            case EventType::CONTROL: return "CONTROL";
            case EventType::INPUT: return "INPUT";
            case EventType::FEEDBACK: return "FEEDBACK";
            case EventType::MEDIA_READY: return "MEDIA_READY";
            case EventType::LIVENESS_LOST: return "LIVENESS_LOST";
            case EventType::CLOSED: return "CLOSED";
        }
        return "UNKNOWN";
    }

    std::vector<uint8_t> encode_datagram(DatagramType type, SessionToken token, const std::vector<uint8_t> &body) {
        ClientDatagramHeader hdr{};
        hdr.magic = hton_u16(CLIENT_DATAGRAM_MAGIC);
        hdr.type = (uint8_t)type;
        hdr.reserved = 0;
        hdr.token = hton_u64(token);

        std::vector<uint8_t> out(CLIENT_DATAGRAM_HEADER_SIZE + body.size());
        std::memcpy(out.data(), &hdr, CLIENT_DATAGRAM_HEADER_SIZE);
        if (!body.empty()) std::memcpy(out.data() + CLIENT_DATAGRAM_HEADER_SIZE, body.data(), body.size());
        return out;
    }

    bool parse_datagram(const uint8_t *data, size_t len, DatagramType &type, SessionToken &token,
                        const uint8_t *&body, size_t &body_len) {
        if (!data || len < CLIENT_DATAGRAM_HEADER_SIZE) return false;
        ClientDatagramHeader hdr{};
        std::memcpy(&hdr, data, CLIENT_DATAGRAM_HEADER_SIZE);
        if (ntoh_u16(hdr.magic) != CLIENT_DATAGRAM_MAGIC) return false;
        if (hdr.type < (uint8_t)DatagramType::MEDIA_HELLO || hdr.type > (uint8_t)DatagramType::FEEDBACK) return false;
        type = (DatagramType)hdr.type;
        token = ntoh_u64(hdr.token);
        body = data + CLIENT_DATAGRAM_HEADER_SIZE;
        body_len = len - CLIENT_DATAGRAM_HEADER_SIZE;
        return true;
    }

    void encode_feedback(const FeedbackPacket &fb, std::vector<uint8_t> &out) {
        ByteWriter w(out);
        w.u64(fb.highest_frame_seq);
        w.u32(fb.frames_completed);
        w.u32(fb.frames_lost);
    }

    bool decode_feedback(const uint8_t *data, size_t len, FeedbackPacket &out) {
        ByteReader r(data, len);
        FeedbackPacket fb;
        fb.highest_frame_seq = r.u64();
        fb.frames_completed = r.u32();
        fb.frames_lost = r.u32();
        if (!r.ok()) return false;
        out = fb;
        return true;
    }

    TransportSession::TransportSession(sock_t control_fd, sock_t media_fd, const sockaddr_in &peer,
                                       const TransportConfig &cfg, TimePoint now,
                                       std::unique_ptr<tls::ControlStream> stream)
        : control_fd_(control_fd), stream_(std::move(stream)), media_fd_(media_fd), peer_(peer), cfg_(cfg),
          last_fill_(now), last_activity_(now) {
        if (cfg_.media_queue_capacity == 0) cfg_.media_queue_capacity = 1;
        if (!stream_) stream_ = std::make_unique<tls::PlainStream>(control_fd);
    }

    TransportSession::~TransportSession() {
        stream_.reset();
        if (control_fd_ != INVALID_SOCK) closeSocket(control_fd_);
    }

    bool TransportSession::send_media(const fec::ShardPacket &pkt) {
        if (closed_) return false;
        if (media_queue_.size() >= cfg_.media_queue_capacity) {
            ++counters_.datagrams_dropped;
            LOG_NET_TRACE("media queue full ({}), dropped shard {} of frame {}",
                          (uint64_t)media_queue_.size(), pkt.shard_index, pkt.frame_seq);
            return false;
        }
        std::vector<uint8_t> dgram;
        pkt.serialize_into(dgram);
        media_queue_.push_back(std::move(dgram));
        return true;
    }

    void TransportSession::clear_media() {
        if (!media_queue_.empty()) {
            LOG_NET_DEBUG("session {:016x}: discarding {} queued datagrams", token_, (uint64_t)media_queue_.size());
        }
        media_queue_.clear();
    }

    bool TransportSession::send_control(proto::ControlMessage msg) {
        if (closed_ || control_fd_ == INVALID_SOCK) return false;
        msg.seq = next_seq_++;
        std::vector<uint8_t> wire = proto::encode_message(msg);

        std::string error;
        if (!tls::write_all(*stream_, wire.data(), wire.size(), cfg_.control_send_timeout, error)) {
            LOG_NET_ERROR("session {:016x}: control send of {} failed: {}",
                          token_, proto::message_type_name(msg.type), error);
            return false;
        }
        ++counters_.control_sent;
        LOG_NET_DEBUG("session {:016x}: sent {} seq={}", token_, proto::message_type_name(msg.type), msg.seq);
        return true;
    }

    bool TransportSession::on_readable(TimePoint now) {
        if (closed_) return false;
        uint8_t buf[BUFFER_SIZE];
        while (true) {
            tls::IoResult r = stream_->read(buf, sizeof(buf));
            if (r.status == tls::IoStatus::OK) {
                last_activity_ = now;
                framer_.feed(buf, r.bytes);
                proto::ControlMessage msg;
                proto::ControlFramer::Status st;
                while ((st = framer_.next(msg)) == proto::ControlFramer::Status::MESSAGE) {
                    ++counters_.control_received;
                    TransportEvent ev;
                    ev.type = EventType::CONTROL;
                    ev.control = msg;
                    push_event(std::move(ev));
                }
                if (st == proto::ControlFramer::Status::ERROR) {
                    LOG_NET_WARN("session {:016x}: corrupt control stream: {}", token_, framer_.last_error());
                    close("malformed control stream: " + framer_.last_error());
                    return false;
                }
            } else if (r.status == tls::IoStatus::WANT_READ) {
                break;
            } else if (r.status == tls::IoStatus::WANT_WRITE) {
                // handshake or renegotiation output; the reactor only waits for input
                pollfd pfd{control_fd_, POLLOUT, 0};
                if (poll(&pfd, 1, (int)cfg_.control_send_timeout.count()) <= 0) {
                    LOG_NET_WARN("session {:016x}: control channel stalled on write fd={}", token_, control_fd_);
                    close("control channel stalled");
                    return false;
                }
            } else if (r.status == tls::IoStatus::CLOSED) {
                LOG_NET_INFO("session {:016x}: peer closed control channel fd={}", token_, control_fd_);
                close("peer closed connection");
                return false;
            } else {
                LOG_NET_WARN("session {:016x}: control read error fd={}: {}", token_, control_fd_, stream_->last_error());
                close("control read failed: " + stream_->last_error());
                return false;
            }
        }
        return true;
    }

    void TransportSession::on_datagram(DatagramType type, const uint8_t *body, size_t len,
                                       const sockaddr_in &from, TimePoint now) {
        if (closed_) return;
        // media address must belong to the host that opened the control channel
        if (from.sin_addr.s_addr != peer_.sin_addr.s_addr) {
            char addr[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr));
            LOG_NET_WARN("session {:016x}: {} from foreign address {} ignored", token_, datagram_type_name(type), addr);
            return;
        }
        last_activity_ = now;

        switch (type) {
            case DatagramType::MEDIA_HELLO: {
                bool first = !media_addr_set_;
                if (first || media_addr_.sin_port != from.sin_port) {
                    char addr[INET_ADDRSTRLEN];
                    inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr));
                    LOG_NET_INFO("session {:016x}: media address {}:{}", token_, addr, ntohs(from.sin_port));
                }
                media_addr_ = from;
                media_addr_set_ = true;
                if (first) {
                    TransportEvent ev;
                    ev.type = EventType::MEDIA_READY;
                    push_event(std::move(ev));
                }
                break;
            }
            case DatagramType::INPUT: {
                TransportEvent ev;
                ev.type = EventType::INPUT;
                std::vector<uint8_t> plain;
                if (keys_.valid()) {
                    if (!crypto::open(keys_, body, len, plain)) {
                        ++counters_.input_rejected;
                        LOG_NET_DEBUG("session {:016x}: input datagram failed authentication", token_);
                        return;
                    }
                    body = plain.data();
                    len = plain.size();
                }
                if (!input::decode_input(body, len, ev.input)) {
                    LOG_NET_DEBUG("session {:016x}: malformed input datagram ({} bytes)", token_, (uint64_t)len);
                    return;
                }
                // the sink sees events in client order; late ones are stale
                if (input_seen_ && ev.input.seq <= last_input_seq_) {
                    ++counters_.input_out_of_order;
                    return;
                }
                input_seen_ = true;
                last_input_seq_ = ev.input.seq;
                ++counters_.input_received;
                push_event(std::move(ev));
                break;
            }
            case DatagramType::FEEDBACK: {
                TransportEvent ev;
                ev.type = EventType::FEEDBACK;
                if (!decode_feedback(body, len, ev.feedback)) {
                    LOG_NET_DEBUG("session {:016x}: malformed feedback datagram", token_);
                    return;
                }
                ++counters_.feedback_received;
                push_event(std::move(ev));
                break;
            }
        }
    }

    bool TransportSession::next_event(TransportEvent &out) {
        if (events_.empty()) return false;
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    bool TransportSession::pace(size_t bytes, TimePoint now) {
        if (cfg_.pacing_kbps == 0) return true;
        double rate = (double)cfg_.pacing_kbps * 1000.0 / 8.0;   // bytes per second
        double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_fill_).count();
        if (elapsed > 0) {
            tokens_ += rate * elapsed;
            double max_tokens = std::max(rate * PACING_BURST_SECONDS, (double)MAX_UDP_PACKET_SIZE);
            if (tokens_ > max_tokens) tokens_ = max_tokens;
            last_fill_ = now;
        }
        if (tokens_ < (double)bytes) return false;
        tokens_ -= (double)bytes;
        return true;
    }

    size_t TransportSession::flush_media(TimePoint now) {
        if (closed_ || !media_addr_set_ || media_fd_ == INVALID_SOCK) return 0;
        size_t sent = 0;
        while (!media_queue_.empty()) {
            const std::vector<uint8_t> &dgram = media_queue_.front();
            if (!pace(dgram.size(), now)) break;
            ssize_t rc = ::sendto(media_fd_, dgram.data(), dgram.size(), 0,
                                  (const sockaddr *)&media_addr_, sizeof(media_addr_));
            if (rc < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    // give the tokens back, the datagram stays queued
                    if (cfg_.pacing_kbps != 0) tokens_ += (double)dgram.size();
                    break;
                }
                ++counters_.send_errors;
                LOG_NET_DEBUG("session {:016x}: sendto failed: {}", token_, strerror(errno));
                media_queue_.pop_front();
                continue;
            }
            ++counters_.datagrams_sent;
            counters_.bytes_sent += (uint64_t)rc;
            ++sent;
            media_queue_.pop_front();
        }
        return sent;
    }

    bool TransportSession::check_liveness(TimePoint now) {
        if (closed_ || liveness_reported_) return false;
        if (now - last_activity_ <= cfg_.liveness_timeout) return false;
        liveness_reported_ = true;
        LOG_NET_WARN("session {:016x}: no traffic for {} ms", token_,
                     (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity_).count());
        TransportEvent ev;
        ev.type = EventType::LIVENESS_LOST;
        push_event(std::move(ev));
        return true;
    }

    void TransportSession::close(const std::string &reason) {
        if (closed_) return;
        TransportEvent ev;
        ev.type = EventType::CLOSED;
        ev.reason = reason;
        push_event(std::move(ev));
        closed_ = true;
        media_queue_.clear();
        stream_->shutdown();
        if (control_fd_ != INVALID_SOCK) ::shutdown(control_fd_, SHUT_RDWR);
    }

    void TransportSession::push_event(TransportEvent ev) {
        if (closed_) return;
        events_.push_back(std::move(ev));
    }

} // namespace gamecast::transport
