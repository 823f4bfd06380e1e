/*
* @license
* (C) zachbabanov
*
*/

#include <host.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace gamecast::common;

namespace gamecast::host {

namespace {

    bool resolve_bind_address(const std::string &addr, in_addr &out) {
        if (addr.empty() || addr == "0.0.0.0" || addr == "*") {
            out.s_addr = htonl(INADDR_ANY);
            return true;
        }
        return inet_pton(AF_INET, addr.c_str(), &out) == 1;
    }

    uint16_t bound_port(sock_t fd) {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (getsockname(fd, (sockaddr *)&addr, &len) != 0) return 0;
        return ntohs(addr.sin_port);
    }

} // namespace

    StreamHost::StreamHost(const config::HostConfig &cfg)
        : cfg_(cfg),
          tcpListenSocket_(INVALID_SOCK),
          mediaSocket_(INVALID_SOCK),
          epollFd_(-1),
          controlPort_(0),
          mediaPort_(0),
          running_(false),
          encoders_(cfg.encoders.video_slots, cfg.encoders.audio_slots),
          capture_(capture::make_synthetic_source, cfg.capture.max_restarts) {
        controllerCfg_.capabilities = cfg.capabilities;
        controllerCfg_.pipeline = cfg.pipeline;
        controllerCfg_.fec = cfg.fec;
        controllerCfg_.video_device = cfg.capture.video_device;
        controllerCfg_.audio_device = cfg.capture.audio_device;
        controllerCfg_.audio_chunk_ms = cfg.capture.audio_chunk_ms;

        transportCfg_.media_queue_capacity = cfg.network.media_queue_capacity;
        transportCfg_.pacing_kbps = cfg.network.pacing_kbps;
        transportCfg_.control_send_timeout = std::chrono::milliseconds(cfg.network.control_send_timeout_ms);
        transportCfg_.liveness_timeout = std::chrono::milliseconds(cfg.network.liveness_timeout_ms);
    }

    StreamHost::~StreamHost() {
        // sessions first: they give encoders and capture devices back
        sessions_.clear();
        if (epollFd_ >= 0) close(epollFd_);
        if (tcpListenSocket_ != INVALID_SOCK) closeSocket(tcpListenSocket_);
        if (mediaSocket_ != INVALID_SOCK) closeSocket(mediaSocket_);
    }

    bool StreamHost::setupListenSocket() {
        in_addr bind_addr{};
        if (!resolve_bind_address(cfg_.network.bind_address, bind_addr)) {
            LOG_GEN_ERROR("invalid bind address '{}'", cfg_.network.bind_address);
            return false;
        }

        tcpListenSocket_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (tcpListenSocket_ == INVALID_SOCK) {
            LOG_GEN_ERROR("Failed to create listen socket: {}", strerror(errno));
            return false;
        }

        int opt = 1;
        setsockopt(tcpListenSocket_, SOL_SOCKET, SO_REUSEADDR, (char *)&opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr = bind_addr;
        addr.sin_port = htons(cfg_.network.control_port);

        if (bind(tcpListenSocket_, (sockaddr *)&addr, sizeof(addr)) < 0) {
            LOG_GEN_ERROR("bind failed on port {}: {}", cfg_.network.control_port, strerror(errno));
            closeSocket(tcpListenSocket_);
            tcpListenSocket_ = INVALID_SOCK;
            return false;
        }

        if (setSocketNonBlocking(tcpListenSocket_) < 0) {
            LOG_GEN_ERROR("set nonblocking failed for listen socket");
            closeSocket(tcpListenSocket_);
            tcpListenSocket_ = INVALID_SOCK;
            return false;
        }

        if (listen(tcpListenSocket_, 64) < 0) {
            LOG_GEN_ERROR("listen failed: {}", strerror(errno));
            closeSocket(tcpListenSocket_);
            tcpListenSocket_ = INVALID_SOCK;
            return false;
        }

        controlPort_ = bound_port(tcpListenSocket_);
        LOG_NET_INFO("Listening on TCP port {}", controlPort_);
        return true;
    }

    bool StreamHost::setupMediaSocket() {
        in_addr bind_addr{};
        resolve_bind_address(cfg_.network.bind_address, bind_addr);

        mediaSocket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (mediaSocket_ == INVALID_SOCK) {
            LOG_GEN_ERROR("udp socket: {}", strerror(errno));
            return false;
        }

        // Increase UDP buffer sizes
        int sndbuf = 4 * 1024 * 1024;
        setsockopt(mediaSocket_, SOL_SOCKET, SO_SNDBUF, (char *)&sndbuf, sizeof(sndbuf));
        int rcvbuf = 1024 * 1024;
        setsockopt(mediaSocket_, SOL_SOCKET, SO_RCVBUF, (char *)&rcvbuf, sizeof(rcvbuf));
        if (cfg_.network.media_tos >= 0) setSocketTos(mediaSocket_, cfg_.network.media_tos);

        sockaddr_in uaddr{};
        uaddr.sin_family = AF_INET;
        uaddr.sin_addr = bind_addr;
        uaddr.sin_port = htons(cfg_.network.media_port);
        if (bind(mediaSocket_, (sockaddr *)&uaddr, sizeof(uaddr)) < 0) {
            LOG_GEN_ERROR("udp bind failed on port {}: {}", cfg_.network.media_port, strerror(errno));
            closeSocket(mediaSocket_);
            mediaSocket_ = INVALID_SOCK;
            return false;
        }
        if (setSocketNonBlocking(mediaSocket_) < 0) {
            LOG_GEN_ERROR("set nonblocking failed for media socket");
            closeSocket(mediaSocket_);
            mediaSocket_ = INVALID_SOCK;
            return false;
        }
        mediaPort_ = bound_port(mediaSocket_);
        LOG_NET_INFO("UDP media socket on port {}", mediaPort_);
        return true;
    }

    bool StreamHost::start() {
        if (cfg_.tls.enabled) {
            tls_ = tls::TlsContext::create_server(cfg_.tls);
            if (!tls_) {
                LOG_GEN_ERROR("TLS setup failed, host not started");
                return false;
            }
        } else {
            LOG_GEN_WARN("TLS disabled: control channel and session keys travel in the clear");
        }
        if (!setupListenSocket()) return false;
        if (!setupMediaSocket()) return false;
        controllerCfg_.host_media_port = mediaPort_;

        epollFd_ = epoll_create1(0);
        if (epollFd_ < 0) {
            LOG_GEN_ERROR("epoll_create1: {}", strerror(errno));
            return false;
        }
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = tcpListenSocket_;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, tcpListenSocket_, &ev) < 0) {
            LOG_GEN_ERROR("epoll_ctl add listen: {}", strerror(errno));
            return false;
        }
        ev.events = EPOLLIN;
        ev.data.fd = mediaSocket_;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, mediaSocket_, &ev) < 0) {
            LOG_GEN_ERROR("epoll_ctl add udp: {}", strerror(errno));
            return false;
        }

        running_.store(true);
        LOG_GEN_INFO("Host started: control port {}, media port {}, {} video / {} audio encoders",
                     controlPort_, mediaPort_, (uint64_t)cfg_.encoders.video_slots, (uint64_t)cfg_.encoders.audio_slots);
        if (discovery_) discovery_(controlPort_, mediaPort_);
        return true;
    }

    void StreamHost::runLoop() {
        const int interval = (int)std::max<uint32_t>(1, cfg_.network.loop_interval_ms);
        while (running_.load()) {
            poll_once(interval);
        }
        LOG_GEN_INFO("Host loop stopped, closing {} session(s)", (uint64_t)sessions_.size());
        std::vector<sock_t> fds;
        for (auto &kv : sessions_) fds.push_back(kv.first);
        for (sock_t fd : fds) closeConnection(fd);
    }

    void StreamHost::poll_once(int timeout_ms) {
        if (epollFd_ < 0) return;
        epoll_event events[64];
        int n = epoll_wait(epollFd_, events, 64, timeout_ms);
        if (n < 0 && errno != EINTR) {
            LOG_GEN_ERROR("epoll_wait: {}", strerror(errno));
            running_.store(false);
            return;
        }

        auto now = Clock::now();
        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;
            if (fd == tcpListenSocket_) {
                acceptNewConnections(now);
            } else if (fd == mediaSocket_) {
                handleMediaEvent(now);
            } else if (sessions_.count(fd)) {
                handleTcpEvent(fd, ev, now);
            }
        }

        driveSessions(Clock::now());
    }

    void StreamHost::acceptNewConnections(TimePoint now) {
        while (true) {
            sockaddr_in caddr{};
            socklen_t clen = sizeof(caddr);
            sock_t cfd = accept(tcpListenSocket_, (sockaddr *)&caddr, &clen);
            if (cfd == INVALID_SOCK) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                if (errno == EINTR) continue;
                LOG_NET_WARN("accept: {}", strerror(errno));
                break;
            }
            if (setSocketNonBlocking(cfd) < 0) {
                LOG_GEN_ERROR("set nonblocking for client failed");
                closeSocket(cfd);
                continue;
            }
            // enable keepalive and TCP_NODELAY for accepted socket
            enableSocketKeepAliveAndNoDelay(cfd);

            char hostbuf[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &caddr.sin_addr, hostbuf, sizeof(hostbuf));

            if (sessions_.size() >= cfg_.network.max_sessions) {
                LOG_NET_WARN("Refusing {}:{}: {} sessions active", hostbuf, ntohs(caddr.sin_port), (uint64_t)sessions_.size());
                rejectConnection(cfd, proto::RejectReason::HOST_FULL, "host is full");
                continue;
            }

            SessionToken token = registry_.register_session(cfd);
            if (token == 0) {
                LOG_NET_ERROR("fd {} already registered", cfd);
                closeSocket(cfd);
                continue;
            }

            epoll_event cev{};
            cev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP;
            cev.data.fd = cfd;
            if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, cfd, &cev) < 0) {
                LOG_NET_ERROR("epoll_ctl add client: {}", strerror(errno));
                registry_.remove(token);
                closeSocket(cfd);
                continue;
            }

            std::unique_ptr<tls::ControlStream> stream;
            if (tls_) {
                stream = tls_->wrap(cfd);
                if (!stream) {
                    epoll_ctl(epollFd_, EPOLL_CTL_DEL, cfd, nullptr);
                    registry_.remove(token);
                    closeSocket(cfd);
                    continue;
                }
            }
            auto transport = std::make_unique<transport::TransportSession>(cfd, mediaSocket_, caddr, transportCfg_, now,
                                                                           std::move(stream));
            ControllerDeps deps{encoders_, capture_, input_, telemetry_};
            sessions_.emplace(cfd, std::make_unique<SessionController>(token, std::move(transport), controllerCfg_, deps, now));
            LOG_NET_INFO("Accepted connection from {}:{} fd={} session={:016x}", hostbuf, ntohs(caddr.sin_port), cfd, token);
        }
    }

    void StreamHost::rejectConnection(sock_t fd, proto::RejectReason reason, const char *text) {
        std::vector<uint8_t> wire = proto::encode_message(proto::make_reject(reason, text, proto::MessageType::OFFER, 0));
        std::unique_ptr<tls::ControlStream> stream;
        if (tls_) stream = tls_->wrap(fd);
        else stream = std::make_unique<tls::PlainStream>(fd);
        if (stream) {
            // over TLS the write also runs the server side of the handshake
            std::string error;
            if (!tls::write_all(*stream, wire.data(), wire.size(), transportCfg_.control_send_timeout, error)) {
                LOG_NET_DEBUG("reject to fd {} not sent: {}", fd, error);
            }
            stream->shutdown();
            stream.reset();
        }
        closeSocket(fd);
    }

    void StreamHost::handleTcpEvent(sock_t fd, uint32_t events, TimePoint now) {
        auto it = sessions_.find(fd);
        if (it == sessions_.end()) return;
        SessionController &sc = *it->second;

        // read first so a final TEARDOWN sent right before the hangup is not lost
        if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
            sc.transport().on_readable(now);
        }
        if ((events & (EPOLLERR | EPOLLHUP)) && !sc.transport().closed()) {
            sc.transport().close("socket error");
        }
        sc.process_events(now);
    }

    void StreamHost::handleMediaEvent(TimePoint now) {
        uint8_t buf[MAX_UDP_PACKET_SIZE];
        while (true) {
            sockaddr_in src{};
            socklen_t sl = sizeof(src);
            ssize_t n = recvfrom(mediaSocket_, buf, sizeof(buf), 0, (sockaddr *)&src, &sl);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) LOG_NET_DEBUG("recvfrom: {}", strerror(errno));
                break;
            }

            transport::DatagramType type;
            SessionToken token = 0;
            const uint8_t *body = nullptr;
            size_t body_len = 0;
            if (!transport::parse_datagram(buf, (size_t)n, type, token, body, body_len)) {
                LOG_NET_TRACE("ignoring {}-byte datagram with bad header", (int64_t)n);
                continue;
            }
            auto fd = registry_.find_fd(token);
            if (!fd) {
                LOG_NET_DEBUG("{} for unknown session {:016x} ignored", transport::datagram_type_name(type), token);
                continue;
            }
            auto it = sessions_.find(*fd);
            if (it == sessions_.end()) continue;
            it->second->transport().on_datagram(type, body, body_len, src, now);
        }
    }

    void StreamHost::driveSessions(TimePoint now) {
        capture_.poll(now);

        std::vector<sock_t> finished;
        for (auto &kv : sessions_) {
            SessionController &sc = *kv.second;
            sc.process_events(now);
            sc.step(now);
            sc.process_events(now);
            if (sc.finished()) finished.push_back(kv.first);
        }
        for (sock_t fd : finished) closeConnection(fd);
    }

    const SessionController *StreamHost::find_session(SessionToken token) const {
        auto fd = registry_.find_fd(token);
        if (!fd) return nullptr;
        auto it = sessions_.find(*fd);
        return it == sessions_.end() ? nullptr : it->second.get();
    }

    void StreamHost::closeConnection(sock_t fd) {
        auto it = sessions_.find(fd);
        if (it == sessions_.end()) return;
        epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
        registry_.remove(it->second->token());
        LOG_NET_INFO("Closed session {:016x} fd={}", it->second->token(), fd);
        // destroying the controller releases encoders, capture and the socket
        sessions_.erase(it);
    }

} // namespace gamecast::host
