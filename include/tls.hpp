/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_TLS_HPP
#define GAMECAST_TLS_HPP

#pragma once

#include <common.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Forward-declare OpenSSL types so consumers don't need OpenSSL headers.
typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace gamecast::tls {

    using common::sock_t;

    struct TlsConfig {
        bool enabled = true;
        std::string cert_file;              // PEM; empty = ephemeral self-signed certificate
        std::string key_file;               // PEM private key matching cert_file
        std::string pinned_fingerprint;     // client: expected host certificate SHA-256 ("AB:CD:..")
    };

    enum class IoStatus {
        OK,
        WANT_READ,      // retry once the socket is readable
        WANT_WRITE,     // retry once the socket is writable
        CLOSED,         // orderly close by the peer
        FAILED
    };

    struct IoResult {
        IoStatus status = IoStatus::OK;
        size_t bytes = 0;
    };

/**
 * @brief Byte stream carrying the control channel over a non-blocking socket.
 *
 * The socket itself stays owned by the caller; shutdown() only ends the
 * stream's own session layer.
 */
    class ControlStream {
    public:
        virtual ~ControlStream() = default;

        virtual IoResult read(uint8_t *buf, size_t len) = 0;
        virtual IoResult write(const uint8_t *data, size_t len) = 0;
        /// Drive the handshake one step. Plain streams are always established.
        virtual IoResult handshake() = 0;
        virtual void shutdown() = 0;

        virtual bool secure() const = 0;
        /// SHA-256 of the peer certificate, empty for plain streams or before the handshake.
        virtual std::string peer_fingerprint() const { return std::string(); }

        sock_t fd() const { return fd_; }
        const std::string &last_error() const { return error_; }

    protected:
        explicit ControlStream(sock_t fd) : fd_(fd) {}

        sock_t fd_;
        std::string error_;
    };

    class PlainStream : public ControlStream {
    public:
        explicit PlainStream(sock_t fd) : ControlStream(fd) {}

        IoResult read(uint8_t *buf, size_t len) override;
        IoResult write(const uint8_t *data, size_t len) override;
        IoResult handshake() override { return IoResult{}; }
        void shutdown() override {}
        bool secure() const override { return false; }
    };

    class TlsStream : public ControlStream {
    public:
        TlsStream(SSL *ssl, sock_t fd) : ControlStream(fd), ssl_(ssl) {}
        ~TlsStream() override;

        TlsStream(const TlsStream &) = delete;
        TlsStream &operator=(const TlsStream &) = delete;

        IoResult read(uint8_t *buf, size_t len) override;
        IoResult write(const uint8_t *data, size_t len) override;
        IoResult handshake() override;
        void shutdown() override;
        bool secure() const override { return true; }
        std::string peer_fingerprint() const override;

    private:
        IoResult result_of(int ret, const char *what);

        SSL *ssl_;
        bool shut_down_ = false;
    };

/**
 * @brief One SSL_CTX per role.
 *
 * The host presents the configured certificate, or a self-signed EC P-256
 * one generated at creation when none is configured. Clients do not use a CA;
 * they pin the host certificate by fingerprint when one is configured.
 */
    class TlsContext {
    public:
        static std::shared_ptr<TlsContext> create_server(const TlsConfig &cfg);
        static std::shared_ptr<TlsContext> create_client(const TlsConfig &cfg);
        ~TlsContext();

        TlsContext(const TlsContext &) = delete;
        TlsContext &operator=(const TlsContext &) = delete;

        /// Stream over @p fd in this context's role. nullptr on failure.
        std::unique_ptr<ControlStream> wrap(sock_t fd) const;

        bool server() const { return server_; }
        /// SHA-256 of our own certificate (server side).
        const std::string &fingerprint() const { return fingerprint_; }

    private:
        TlsContext(SSL_CTX *ctx, bool server) : ctx_(ctx), server_(server) {}

        SSL_CTX *ctx_;
        bool server_;
        std::string fingerprint_;
    };

    /**
     * @brief Write all of @p data, waiting at most @p timeout for socket space.
     * @return false on timeout or stream failure; @p error says which.
     */
    bool write_all(ControlStream &stream, const uint8_t *data, size_t len, std::chrono::milliseconds timeout,
                   std::string &error);

    /// Complete the handshake within @p timeout.
    bool complete_handshake(ControlStream &stream, std::chrono::milliseconds timeout, std::string &error);

    /// Case-insensitive comparison of colon-separated hex fingerprints.
    bool fingerprint_matches(const std::string &expected, const std::string &actual);

} // namespace gamecast::tls

#endif // GAMECAST_TLS_HPP
