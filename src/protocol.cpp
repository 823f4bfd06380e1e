/*
* @license
* (C) zachbabanov
*
*/

#include <protocol.hpp>

#include <fmt/core.h>

#include <cstring>

using namespace gamecast::common;

namespace gamecast::proto {

namespace {

    void write_params(ByteWriter &w, const media::StreamParams &p) {
        w.u32(p.width);
        w.u32(p.height);
        w.u32(p.fps);
        w.u32(p.bitrate_kbps);
        w.u16((uint16_t)p.codec);
        w.u32(p.audio_sample_rate);
        w.u16(p.audio_channels);
        w.u16(p.shard_size);
        w.u16(p.min_fec_shards);
    }

    bool read_params(ByteReader &r, media::StreamParams &p) {
        p.width = r.u32();
        p.height = r.u32();
        p.fps = r.u32();
        p.bitrate_kbps = r.u32();
        uint16_t codec = r.u16();
        p.audio_sample_rate = r.u32();
        p.audio_channels = r.u16();
        p.shard_size = r.u16();
        p.min_fec_shards = r.u16();
        if (!r.ok()) return false;
        if (codec > (uint16_t)Codec::AV1) return false;
        p.codec = (Codec)codec;
        return true;
    }

} // namespace

    const char *message_type_name(MessageType t) {
        switch (t) {
            case MessageType::OFFER: return "OFFER";
            case MessageType::ANSWER: return "ANSWER";
            case MessageType::REJECT: return "REJECT";
            case MessageType::SETUP: return "SETUP";
            case MessageType::PLAY: return "PLAY";
            case MessageType::PAUSE: return "PAUSE";
            case MessageType::TEARDOWN: return "TEARDOWN";
            case MessageType::RECONFIGURE: return "RECONFIGURE";
            case MessageType::HEARTBEAT: return "HEARTBEAT";
            case MessageType::LOSS_REPORT: return "LOSS_REPORT";
            case MessageType::REQUEST_KEYFRAME: return "REQUEST_KEYFRAME";
            case MessageType::ACK: return "ACK";
        }
        return "UNKNOWN";
    }

    bool is_known_type(uint16_t t) {
        return t >= (uint16_t)MessageType::OFFER && t <= (uint16_t)MessageType::ACK;
    }

    const char *reject_reason_name(RejectReason r) {
        switch (r) {
            case RejectReason::NONE: return "none";
            case RejectReason::INCOMPATIBLE_PARAMS: return "incompatible parameters";
            case RejectReason::ILLEGAL_STATE: return "illegal in current state";
            case RejectReason::UNKNOWN_SESSION: return "unknown session";
            case RejectReason::HOST_FULL: return "host full";
            case RejectReason::RESOURCE_UNAVAILABLE: return "resource unavailable";
            case RejectReason::MALFORMED: return "malformed message";
            case RejectReason::INTERNAL_ERROR: return "internal error";
        }
        return "unknown";
    }

    double LossReport::loss_ratio() const {
        if (shards_expected == 0) return 0.0;
        uint64_t got = shards_received > shards_expected ? shards_expected : shards_received;
        return 1.0 - (double)got / (double)shards_expected;
    }

    ControlMessage make_offer(const media::StreamParams &params, const std::string &client_name) {
        ControlMessage m;
        m.type = MessageType::OFFER;
        m.params = params;
        m.text = client_name;
        return m;
    }

    ControlMessage make_answer(SessionToken token, const media::StreamParams &params, uint16_t media_port,
                               const crypto::SessionKeys &keys) {
        ControlMessage m;
        m.type = MessageType::ANSWER;
        m.token = token;
        m.params = params;
        m.media_port = media_port;
        m.keys = keys;
        return m;
    }

    ControlMessage make_reject(RejectReason reason, const std::string &text, MessageType ref_type, uint32_t ref_seq) {
        ControlMessage m;
        m.type = MessageType::REJECT;
        m.reason = reason;
        m.text = text;
        m.ref_type = ref_type;
        m.ref_seq = ref_seq;
        return m;
    }

    ControlMessage make_setup(SessionToken token, uint16_t client_media_port) {
        ControlMessage m;
        m.type = MessageType::SETUP;
        m.token = token;
        m.media_port = client_media_port;
        return m;
    }

    ControlMessage make_reconfigure(const media::StreamParams &params) {
        ControlMessage m;
        m.type = MessageType::RECONFIGURE;
        m.params = params;
        return m;
    }

    ControlMessage make_loss_report(const LossReport &loss) {
        ControlMessage m;
        m.type = MessageType::LOSS_REPORT;
        m.loss = loss;
        return m;
    }

    ControlMessage make_ack(MessageType ref_type, uint32_t ref_seq) {
        ControlMessage m;
        m.type = MessageType::ACK;
        m.ref_type = ref_type;
        m.ref_seq = ref_seq;
        return m;
    }

    ControlMessage make_teardown(const std::string &text) {
        ControlMessage m;
        m.type = MessageType::TEARDOWN;
        m.text = text;
        return m;
    }

    ControlMessage make_simple(MessageType type) {
        ControlMessage m;
        m.type = type;
        return m;
    }

    std::vector<uint8_t> encode_message(const ControlMessage &msg) {
        std::vector<uint8_t> body;
        ByteWriter w(body);
        switch (msg.type) {
            case MessageType::OFFER:
                write_params(w, msg.params);
                w.str(msg.text);
                break;
            case MessageType::ANSWER:
                w.u64(msg.token);
                write_params(w, msg.params);
                w.u16(msg.media_port);
                w.u32(msg.keys.key_id);
                w.bytes(msg.keys.key.data(), msg.keys.key.size());
                break;
            case MessageType::REJECT:
                w.u16((uint16_t)msg.reason);
                w.u16((uint16_t)msg.ref_type);
                w.u32(msg.ref_seq);
                w.str(msg.text);
                break;
            case MessageType::SETUP:
                w.u64(msg.token);
                w.u16(msg.media_port);
                break;
            case MessageType::TEARDOWN:
                w.str(msg.text);
                break;
            case MessageType::RECONFIGURE:
                write_params(w, msg.params);
                break;
            case MessageType::LOSS_REPORT:
                w.u64(msg.loss.shards_expected);
                w.u64(msg.loss.shards_received);
                w.u32(msg.loss.frames_recovered);
                w.u32(msg.loss.frames_unrecoverable);
                break;
            case MessageType::ACK:
                w.u16((uint16_t)msg.ref_type);
                w.u32(msg.ref_seq);
                break;
            case MessageType::PLAY:
            case MessageType::PAUSE:
            case MessageType::HEARTBEAT:
            case MessageType::REQUEST_KEYFRAME:
                break;
        }

        ControlHeader hdr{};
        hdr.body_len = hton_u32((uint32_t)body.size());
        hdr.type = hton_u16((uint16_t)msg.type);
        hdr.flags = hton_u16(msg.flags);
        hdr.seq = hton_u32(msg.seq);

        std::vector<uint8_t> out(CONTROL_HEADER_SIZE + body.size());
        std::memcpy(out.data(), &hdr, CONTROL_HEADER_SIZE);
        if (!body.empty()) std::memcpy(out.data() + CONTROL_HEADER_SIZE, body.data(), body.size());
        return out;
    }

    bool decode_body(MessageType type, const uint8_t *body, size_t len, ControlMessage &out) {
        ByteReader r(body, len);
        out.type = type;
        switch (type) {
            case MessageType::OFFER:
                if (!read_params(r, out.params)) return false;
                out.text = r.str();
                break;
            case MessageType::ANSWER:
                out.token = r.u64();
                if (!read_params(r, out.params)) return false;
                out.media_port = r.u16();
                out.keys.key_id = r.u32();
                for (uint8_t &b : out.keys.key) b = r.u8();
                break;
            case MessageType::REJECT: {
                out.reason = (RejectReason)r.u16();
                uint16_t ref = r.u16();
                out.ref_seq = r.u32();
                out.text = r.str();
                if (r.ok() && !is_known_type(ref)) return false;
                out.ref_type = (MessageType)ref;
                break;
            }
            case MessageType::SETUP:
                out.token = r.u64();
                out.media_port = r.u16();
                break;
            case MessageType::TEARDOWN:
                out.text = r.str();
                break;
            case MessageType::RECONFIGURE:
                if (!read_params(r, out.params)) return false;
                break;
            case MessageType::LOSS_REPORT:
                out.loss.shards_expected = r.u64();
                out.loss.shards_received = r.u64();
                out.loss.frames_recovered = r.u32();
                out.loss.frames_unrecoverable = r.u32();
                break;
            case MessageType::ACK: {
                uint16_t ref = r.u16();
                out.ref_seq = r.u32();
                if (r.ok() && !is_known_type(ref)) return false;
                out.ref_type = (MessageType)ref;
                break;
            }
            case MessageType::PLAY:
            case MessageType::PAUSE:
            case MessageType::HEARTBEAT:
            case MessageType::REQUEST_KEYFRAME:
                break;
        }
        return r.ok();
    }

    void ControlFramer::feed(const uint8_t *data, size_t len) {
        if (failed_ || len == 0) return;
        // Compact once the consumed prefix dominates the buffer.
        if (offset_ > 0 && offset_ * 2 >= buffer_.size()) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + (std::ptrdiff_t)offset_);
            offset_ = 0;
        }
        buffer_.insert(buffer_.end(), data, data + len);
    }

    ControlFramer::Status ControlFramer::next(ControlMessage &out) {
        if (failed_) return Status::ERROR;
        size_t avail = buffer_.size() - offset_;
        if (avail < CONTROL_HEADER_SIZE) return Status::NEED_MORE;

        ControlHeader hdr;
        std::memcpy(&hdr, buffer_.data() + offset_, CONTROL_HEADER_SIZE);
        uint32_t body_len = ntoh_u32(hdr.body_len);
        uint16_t type = ntoh_u16(hdr.type);

        if (body_len > MAX_CONTROL_BODY) {
            failed_ = true;
            error_ = fmt::format("body length {} exceeds limit {}", body_len, MAX_CONTROL_BODY);
            return Status::ERROR;
        }
        if (!is_known_type(type)) {
            failed_ = true;
            error_ = fmt::format("unknown message type {}", type);
            return Status::ERROR;
        }
        if (avail < CONTROL_HEADER_SIZE + body_len) return Status::NEED_MORE;

        ControlMessage msg;
        msg.flags = ntoh_u16(hdr.flags);
        msg.seq = ntoh_u32(hdr.seq);
        const uint8_t *body = buffer_.data() + offset_ + CONTROL_HEADER_SIZE;
        if (!decode_body((MessageType)type, body, body_len, msg)) {
            failed_ = true;
            error_ = fmt::format("malformed {} body ({} bytes)", message_type_name((MessageType)type), body_len);
            return Status::ERROR;
        }

        offset_ += CONTROL_HEADER_SIZE + body_len;
        if (offset_ == buffer_.size()) {
            buffer_.clear();
            offset_ = 0;
        }
        out = std::move(msg);
        return Status::MESSAGE;
    }

    void ControlFramer::reset() {
        buffer_.clear();
        offset_ = 0;
        failed_ = false;
        error_.clear();
    }

} // namespace gamecast::proto
