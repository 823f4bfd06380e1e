/*
* @license
* (C) zachbabanov
*
*/

#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace gamecast {
    namespace common {

        const char *media_kind_name(MediaKind k) {
            switch (k) {
                case MediaKind::VIDEO: return "video";
                case MediaKind::AUDIO: return "audio";
            }
            return "unknown";
        }

        const char *codec_name(Codec c) {
            switch (c) {
                case Codec::H264: return "h264";
                case Codec::HEVC: return "hevc";
                case Codec::AV1:  return "av1";
            }
            return "unknown";
        }

        bool parse_codec(const std::string &s, Codec &out) {
            if (s == "h264" || s == "H264" || s == "H.264") { out = Codec::H264; return true; }
            if (s == "hevc" || s == "HEVC" || s == "h265" || s == "H265") { out = Codec::HEVC; return true; }
            if (s == "av1" || s == "AV1") { out = Codec::AV1; return true; }
            return false;
        }

        int setSocketNonBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_WARN("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_WARN("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        void closeSocket(sock_t fd) {
            if (fd >= 0) {
                close(fd);
                LOG_NET_DEBUG("socket closed: {}", fd);
            }
        }

        int enableSocketKeepAliveAndNoDelay(sock_t fd) {
            int on = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0) {
                LOG_NET_WARN("setsockopt(SO_KEEPALIVE) failed fd={} err={}", fd, strerror(errno));
            }
#ifdef TCP_KEEPIDLE
            int idle = 30;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
#ifdef TCP_KEEPINTVL
            int interval = 5;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
#endif
#ifdef TCP_KEEPCNT
            int cnt = 3;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) != 0) {
                LOG_NET_WARN("setsockopt(TCP_NODELAY) failed fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        int setSocketTos(sock_t fd, int tos) {
            if (setsockopt(fd, IPPROTO_IP, IP_TOS, &tos, sizeof(tos)) != 0) {
                LOG_NET_WARN("setsockopt(IP_TOS={}) failed fd={} err={}", tos, fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        uint32_t ntoh_u32(uint32_t v) { return ntohl(v); }
        uint16_t ntoh_u16(uint16_t v) { return ntohs(v); }
        uint32_t hton_u32(uint32_t v) { return htonl(v); }
        uint16_t hton_u16(uint16_t v) { return htons(v); }

        uint64_t hton_u64(uint64_t v) {
            uint32_t hi = htonl((uint32_t)(v >> 32));
            uint32_t lo = htonl((uint32_t)(v & 0xFFFFFFFFu));
            uint64_t out = 0;
            std::memcpy(&out, &hi, 4);
            std::memcpy(reinterpret_cast<char*>(&out) + 4, &lo, 4);
            return out;
        }

        uint64_t ntoh_u64(uint64_t v) {
            uint32_t hi = 0, lo = 0;
            std::memcpy(&hi, &v, 4);
            std::memcpy(&lo, reinterpret_cast<const char*>(&v) + 4, 4);
            return ((uint64_t)ntohl(hi) << 32) | (uint64_t)ntohl(lo);
        }

        void ByteWriter::u16(uint16_t v) {
            out_.push_back((uint8_t)(v >> 8));
            out_.push_back((uint8_t)(v & 0xFF));
        }

        void ByteWriter::u32(uint32_t v) {
            for (int s = 24; s >= 0; s -= 8) out_.push_back((uint8_t)((v >> s) & 0xFF));
        }

        void ByteWriter::u64(uint64_t v) {
            for (int s = 56; s >= 0; s -= 8) out_.push_back((uint8_t)((v >> s) & 0xFF));
        }

        void ByteWriter::str(const std::string &s) {
            size_t n = s.size() > 0xFFFF ? 0xFFFF : s.size();
            u16((uint16_t)n);
            bytes(reinterpret_cast<const uint8_t*>(s.data()), n);
        }

        bool ByteReader::need(size_t n) {
            if (!ok_ || len_ - pos_ < n) {
                ok_ = false;
                return false;
            }
            return true;
        }

        uint8_t ByteReader::u8() {
            if (!need(1)) return 0;
            return p_[pos_++];
        }

        uint16_t ByteReader::u16() {
            if (!need(2)) return 0;
            uint16_t v = (uint16_t)((p_[pos_] << 8) | p_[pos_ + 1]);
            pos_ += 2;
            return v;
        }

        uint32_t ByteReader::u32() {
            if (!need(4)) return 0;
            uint32_t v = 0;
            for (int i = 0; i < 4; ++i) v = (v << 8) | p_[pos_ + i];
            pos_ += 4;
            return v;
        }

        uint64_t ByteReader::u64() {
            if (!need(8)) return 0;
            uint64_t v = 0;
            for (int i = 0; i < 8; ++i) v = (v << 8) | p_[pos_ + i];
            pos_ += 8;
            return v;
        }

        std::string ByteReader::str() {
            uint16_t n = u16();
            if (!need(n)) return std::string();
            std::string s(reinterpret_cast<const char*>(p_ + pos_), n);
            pos_ += n;
            return s;
        }

        bool ByteReader::skip(size_t n) {
            if (!need(n)) return false;
            pos_ += n;
            return true;
        }

    } // namespace common
} // namespace gamecast
