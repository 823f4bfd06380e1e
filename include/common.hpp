/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_COMMON_HPP
#define GAMECAST_COMMON_HPP

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#define INVALID_SOCK (-1)

namespace gamecast {
    namespace common {
        using sock_t = int;

        using Clock = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;

        /// Session token issued at negotiation; 0 is never issued.
        using SessionToken = uint64_t;

// Constants used across host/client
        constexpr size_t BUFFER_SIZE = 4096;
        constexpr size_t MAX_CLIENTS = 16;
        constexpr size_t MAX_UDP_PACKET_SIZE = 1472;       // IPv4 MTU 1500 minus IP+UDP headers
        constexpr size_t MAX_CONTROL_BODY = 64 * 1024;
        constexpr size_t MAX_FRAME_BYTES = 16 * 1024 * 1024;

        enum class MediaKind : uint8_t {
            VIDEO = 0,
            AUDIO = 1
        };

        const char *media_kind_name(MediaKind k);
        inline size_t media_index(MediaKind k) { return k == MediaKind::VIDEO ? 0 : 1; }

        enum class Codec : uint16_t {
            H264 = 0,
            HEVC = 1,
            AV1 = 2
        };

        const char *codec_name(Codec c);
        bool parse_codec(const std::string &s, Codec &out);

//
// Utility functions
//
        int setSocketNonBlocking(sock_t fd);
        void closeSocket(sock_t fd);
        int enableSocketKeepAliveAndNoDelay(sock_t fd);
        /// Best-effort IP_TOS marking (DSCP) for the media socket.
        int setSocketTos(sock_t fd, int tos);

        uint64_t ntoh_u64(uint64_t v);
        uint64_t hton_u64(uint64_t v);
        uint32_t ntoh_u32(uint32_t v);
        uint16_t ntoh_u16(uint16_t v);
        uint32_t hton_u32(uint32_t v);
        uint16_t hton_u16(uint16_t v);

        inline uint64_t to_micros(TimePoint t) {
            return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
        }

        /**
         * @brief Appends integers in network byte order to a byte vector.
         */
        class ByteWriter {
        public:
            explicit ByteWriter(std::vector<uint8_t> &out) : out_(out) {}

            void u8(uint8_t v) { out_.push_back(v); }
            void u16(uint16_t v);
            void u32(uint32_t v);
            void u64(uint64_t v);
            void bytes(const uint8_t *p, size_t n) { out_.insert(out_.end(), p, p + n); }
            /// u16 length prefix + raw bytes; strings longer than 65535 are truncated.
            void str(const std::string &s);

            size_t size() const { return out_.size(); }

        private:
            std::vector<uint8_t> &out_;
        };

        /**
         * @brief Bounds-checked reader over a byte span. Any short read latches ok() == false.
         */
        class ByteReader {
        public:
            ByteReader(const uint8_t *data, size_t len) : p_(data), len_(len), pos_(0), ok_(true) {}

            uint8_t u8();
            uint16_t u16();
            uint32_t u32();
            uint64_t u64();
            std::string str();
            bool skip(size_t n);

            size_t remaining() const { return ok_ ? len_ - pos_ : 0; }
            const uint8_t *cursor() const { return p_ + pos_; }
            bool ok() const { return ok_; }

        private:
            bool need(size_t n);

            const uint8_t *p_;
            size_t len_;
            size_t pos_;
            bool ok_;
        };

    } // namespace common
} // namespace gamecast

#endif // GAMECAST_COMMON_HPP
