/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_PROTOCOL_HPP
#define GAMECAST_PROTOCOL_HPP

#pragma once

#include <common.hpp>
#include <crypto.hpp>
#include <media.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gamecast::proto {

    using common::SessionToken;

/**
 * @brief Header of every message on the control channel.
 *
 * Fields are stored on the wire in network byte order.
 *
 * Layout (packed, 12 bytes):
 *   uint32_t body_len;   // bytes following the header, at most MAX_CONTROL_BODY
 *   uint16_t type;       // MessageType
 *   uint16_t flags;      // reserved, 0
 *   uint32_t seq;        // sender-assigned, echoed by ACK/REJECT
 */
#pragma pack(push,1)
    struct ControlHeader {
        uint32_t body_len;
        uint16_t type;
        uint16_t flags;
        uint32_t seq;
    };
#pragma pack(pop)

    constexpr size_t CONTROL_HEADER_SIZE = sizeof(ControlHeader);
    static_assert(CONTROL_HEADER_SIZE == 12, "ControlHeader must be 12 bytes");

    enum class MessageType : uint16_t {
        OFFER = 1,              // client -> host: capability offer
        ANSWER = 2,             // host -> client: accepted params + token + media port
        REJECT = 3,             // either direction
        SETUP = 4,              // client -> host: token + client media port
        PLAY = 5,
        PAUSE = 6,
        TEARDOWN = 7,
        RECONFIGURE = 8,
        HEARTBEAT = 9,
        LOSS_REPORT = 10,
        REQUEST_KEYFRAME = 11,
        ACK = 12
    };

    const char *message_type_name(MessageType t);
    bool is_known_type(uint16_t t);

    enum class RejectReason : uint16_t {
        NONE = 0,
        INCOMPATIBLE_PARAMS = 1,
        ILLEGAL_STATE = 2,
        UNKNOWN_SESSION = 3,
        HOST_FULL = 4,
        RESOURCE_UNAVAILABLE = 5,
        MALFORMED = 6,
        INTERNAL_ERROR = 7
    };

    const char *reject_reason_name(RejectReason r);

/**
 * @brief Receiver-side statistics for one reporting interval.
 */
    struct LossReport {
        uint64_t shards_expected = 0;
        uint64_t shards_received = 0;
        uint32_t frames_recovered = 0;
        uint32_t frames_unrecoverable = 0;

        /// Fraction of shards lost in the interval, 0 when nothing was expected.
        double loss_ratio() const;
    };

/**
 * @brief One decoded control message.
 *
 * Only the fields relevant to @ref type are meaningful; the rest keep their
 * defaults and are not put on the wire.
 */
    struct ControlMessage {
        MessageType type = MessageType::HEARTBEAT;
        uint16_t flags = 0;
        uint32_t seq = 0;

        SessionToken token = 0;          // ANSWER, SETUP
        media::StreamParams params;      // OFFER, ANSWER, RECONFIGURE
        uint16_t media_port = 0;         // ANSWER (host UDP), SETUP (client UDP)
        std::string text;                // OFFER (client name), REJECT, TEARDOWN (reason text)
        RejectReason reason = RejectReason::NONE;  // REJECT
        MessageType ref_type = MessageType::HEARTBEAT;  // ACK, REJECT: what is answered
        uint32_t ref_seq = 0;            // ACK, REJECT
        LossReport loss;                 // LOSS_REPORT
        crypto::SessionKeys keys;        // ANSWER (input datagram key)
    };

    // Builders for the common messages
    ControlMessage make_offer(const media::StreamParams &params, const std::string &client_name);
    ControlMessage make_answer(SessionToken token, const media::StreamParams &params, uint16_t media_port,
                               const crypto::SessionKeys &keys = crypto::SessionKeys());
    ControlMessage make_reject(RejectReason reason, const std::string &text, MessageType ref_type, uint32_t ref_seq);
    ControlMessage make_setup(SessionToken token, uint16_t client_media_port);
    ControlMessage make_reconfigure(const media::StreamParams &params);
    ControlMessage make_loss_report(const LossReport &loss);
    ControlMessage make_ack(MessageType ref_type, uint32_t ref_seq);
    ControlMessage make_teardown(const std::string &text);
    ControlMessage make_simple(MessageType type);

    /// Header + body, network byte order.
    std::vector<uint8_t> encode_message(const ControlMessage &msg);

    /**
     * @brief Decode a message body whose header was already parsed.
     * @return false when the body is truncated or carries invalid values.
     */
    bool decode_body(MessageType type, const uint8_t *body, size_t len, ControlMessage &out);

/**
 * @brief Reassembles control messages from an arbitrary byte stream.
 *
 * TCP delivers bytes, not messages: feed() whatever recv() returned and call
 * next() until it stops returning MESSAGE.
 */
    class ControlFramer {
    public:
        enum class Status {
            NEED_MORE,
            MESSAGE,
            ERROR       // stream is corrupt; the connection must be dropped
        };

        void feed(const uint8_t *data, size_t len);
        Status next(ControlMessage &out);

        size_t buffered() const { return buffer_.size() - offset_; }
        const std::string &last_error() const { return error_; }
        void reset();

    private:
        std::vector<uint8_t> buffer_;
        size_t offset_ = 0;
        bool failed_ = false;
        std::string error_;
    };

} // namespace gamecast::proto

#endif // GAMECAST_PROTOCOL_HPP
