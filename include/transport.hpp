/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_TRANSPORT_HPP
#define GAMECAST_TRANSPORT_HPP

#pragma once

#include <common.hpp>
#include <crypto.hpp>
#include <input.hpp>
#include <protocol.hpp>
#include <shard_packet.hpp>
#include <tls.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <netinet/in.h>

namespace gamecast::transport {

    using common::sock_t;
    using common::SessionToken;
    using common::TimePoint;

    constexpr uint16_t CLIENT_DATAGRAM_MAGIC = 0x4749;   // "GI"

    enum class DatagramType : uint8_t {
        MEDIA_HELLO = 1,    // announces the client's media address
        INPUT = 2,
        FEEDBACK = 3
    };

    const char *datagram_type_name(DatagramType t);

/**
 * @brief Header of every client -> host datagram.
 *
 * Layout (packed, 12 bytes, network byte order):
 *   uint16_t magic; uint8_t type; uint8_t reserved; uint64_t token;
 */
#pragma pack(push,1)
    struct ClientDatagramHeader {
        uint16_t magic;
        uint8_t type;
        uint8_t reserved;
        uint64_t token;
    };
#pragma pack(pop)

    constexpr size_t CLIENT_DATAGRAM_HEADER_SIZE = sizeof(ClientDatagramHeader);
    static_assert(CLIENT_DATAGRAM_HEADER_SIZE == 12, "ClientDatagramHeader must be 12 bytes");

    /// Receiver-side progress sent best-effort over UDP between loss reports.
    struct FeedbackPacket {
        uint64_t highest_frame_seq = 0;
        uint32_t frames_completed = 0;
        uint32_t frames_lost = 0;
    };

    std::vector<uint8_t> encode_datagram(DatagramType type, SessionToken token, const std::vector<uint8_t> &body);

    /**
     * @brief Validate a client datagram and locate its body.
     * @return false on short datagrams, bad magic or unknown type.
     */
    bool parse_datagram(const uint8_t *data, size_t len, DatagramType &type, SessionToken &token,
                        const uint8_t *&body, size_t &body_len);

    void encode_feedback(const FeedbackPacket &fb, std::vector<uint8_t> &out);
    bool decode_feedback(const uint8_t *data, size_t len, FeedbackPacket &out);

/**
 * @brief Where the orchestrator hands finished shard packets.
 */
    class IMediaSink {
    public:
        virtual ~IMediaSink() = default;

        /// Enqueue one packet. Never blocks; false when the packet was dropped.
        virtual bool send_media(const fec::ShardPacket &pkt) = 0;
        virtual size_t media_queue_depth() const = 0;
        virtual size_t media_queue_capacity() const = 0;
        /// Discard every queued packet.
        virtual void clear_media() = 0;
    };

    struct TransportConfig {
        size_t media_queue_capacity = 1024;
        uint32_t pacing_kbps = 0;                             // 0 = unpaced
        std::chrono::milliseconds control_send_timeout{1000};
        std::chrono::milliseconds liveness_timeout{10000};
    };

    enum class EventType {
        CONTROL,
        INPUT,
        FEEDBACK,
        MEDIA_READY,        // first MEDIA_HELLO seen, media can flow
        LIVENESS_LOST,
        CLOSED              // last event of the sequence
    };

    const char *event_type_name(EventType t);

    struct TransportEvent {
        EventType type = EventType::CONTROL;
        proto::ControlMessage control;
        input::InputEvent input;
        FeedbackPacket feedback;
        std::string reason;     // CLOSED
    };

    struct TransportCounters {
        uint64_t datagrams_sent = 0;
        uint64_t bytes_sent = 0;
        uint64_t datagrams_dropped = 0;     // media queue full
        uint64_t send_errors = 0;
        uint64_t control_sent = 0;
        uint64_t control_received = 0;
        uint64_t input_received = 0;
        uint64_t input_out_of_order = 0;
        uint64_t input_rejected = 0;        // failed to open under the session key
        uint64_t feedback_received = 0;
    };

/**
 * @brief One client's pair of channels.
 *
 * Owns the TCP control socket and the stream (TLS or plain) running over it.
 * The UDP media socket is shared by every session on the host and only
 * referenced here; the host demultiplexes inbound datagrams by token and
 * hands them to on_datagram().
 *
 * Once keys are bound, INPUT datagrams must be sealed with them.
 *
 * Inbound traffic becomes a queue of TransportEvent consumed with
 * next_event(). After CLOSED nothing else is queued.
 */
    class TransportSession : public IMediaSink {
    public:
        /// A null @p stream means plain TCP on @p control_fd.
        TransportSession(sock_t control_fd, sock_t media_fd, const sockaddr_in &peer,
                         const TransportConfig &cfg, TimePoint now,
                         std::unique_ptr<tls::ControlStream> stream = nullptr);
        ~TransportSession() override;

        TransportSession(const TransportSession &) = delete;
        TransportSession &operator=(const TransportSession &) = delete;

        // IMediaSink
        bool send_media(const fec::ShardPacket &pkt) override;
        size_t media_queue_depth() const override { return media_queue_.size(); }
        size_t media_queue_capacity() const override { return cfg_.media_queue_capacity; }
        void clear_media() override;

        /**
         * @brief Send one control message, in order, assigning its seq.
         *
         * Waits at most control_send_timeout for socket space.
         * @return false on timeout or socket error; the channel is then unusable.
         */
        bool send_control(proto::ControlMessage msg);

        /// Drain the control socket. Returns false once the channel is closed or corrupt.
        bool on_readable(TimePoint now);

        void on_datagram(DatagramType type, const uint8_t *body, size_t len, const sockaddr_in &from, TimePoint now);

        bool next_event(TransportEvent &out);

        /**
         * @brief Send queued datagrams without blocking.
         * @return number of datagrams written.
         */
        size_t flush_media(TimePoint now);

        /// Queues LIVENESS_LOST once when nothing arrived for liveness_timeout.
        bool check_liveness(TimePoint now);

        /// Close the control channel locally and queue CLOSED.
        void close(const std::string &reason);

        void set_pacing_kbps(uint32_t kbps) { cfg_.pacing_kbps = kbps; }

        sock_t control_fd() const { return control_fd_; }
        SessionToken token() const { return token_; }
        void bind_token(SessionToken token) { token_ = token; }
        void bind_keys(const crypto::SessionKeys &keys) { keys_ = keys; }
        bool secure() const { return stream_->secure(); }

        bool media_ready() const { return media_addr_set_; }
        const sockaddr_in &media_addr() const { return media_addr_; }
        bool closed() const { return closed_; }
        TimePoint last_activity() const { return last_activity_; }
        const TransportCounters &counters() const { return counters_; }

    private:
        void push_event(TransportEvent ev);
        bool pace(size_t bytes, TimePoint now);

        sock_t control_fd_;
        std::unique_ptr<tls::ControlStream> stream_;
        sock_t media_fd_;
        sockaddr_in peer_;
        TransportConfig cfg_;
        SessionToken token_ = 0;
        crypto::SessionKeys keys_;

        proto::ControlFramer framer_;
        uint32_t next_seq_ = 1;

        sockaddr_in media_addr_{};
        bool media_addr_set_ = false;

        std::deque<std::vector<uint8_t>> media_queue_;
        double tokens_ = 0.0;
        TimePoint last_fill_;

        std::deque<TransportEvent> events_;
        TimePoint last_activity_;
        bool liveness_reported_ = false;
        bool closed_ = false;

        bool input_seen_ = false;
        uint32_t last_input_seq_ = 0;

        TransportCounters counters_;
    };

} // namespace gamecast::transport

#endif // GAMECAST_TRANSPORT_HPP
