/*
* @license
* (C) zachbabanov
*
*/

#include <tls.hpp>
#include <logger.hpp>

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>

using namespace gamecast::common;

namespace gamecast::tls {

namespace {

    void init_openssl() {
        static bool done = [] {
            OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
            return true;
        }();
        (void)done;
    }

    /// Drains the OpenSSL error queue into one line.
    std::string ssl_errors() {
        std::string out;
        unsigned long err;
        while ((err = ERR_get_error()) != 0) {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            if (!out.empty()) out += "; ";
            out += buf;
        }
        return out.empty() ? std::string("unknown TLS error") : out;
    }

    std::string hex_fingerprint(X509 *cert) {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (!cert || X509_digest(cert, EVP_sha256(), md, &md_len) != 1) return std::string();
        std::string out;
        out.reserve(md_len * 3);
        for (unsigned int i = 0; i < md_len; ++i) {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%02X", md[i]);
            if (i > 0) out += ':';
            out += hex;
        }
        return out;
    }

    EVP_PKEY *generate_key() {
        EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
        if (!pctx) return nullptr;
        EVP_PKEY *pkey = nullptr;
        bool ok = EVP_PKEY_keygen_init(pctx) == 1 &&
                  EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) == 1 &&
                  EVP_PKEY_keygen(pctx, &pkey) == 1;
        EVP_PKEY_CTX_free(pctx);
        if (!ok) {
            if (pkey) EVP_PKEY_free(pkey);
            return nullptr;
        }
        return pkey;
    }

    // self-signed, valid for 30 days from now
    X509 *generate_cert(EVP_PKEY *key) {
        X509 *x = X509_new();
        if (!x) return nullptr;

        BIGNUM *serial = BN_new();
        if (!serial || BN_rand(serial, 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
            !BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(x))) {
            BN_free(serial);
            X509_free(x);
            return nullptr;
        }
        BN_free(serial);

        X509_set_version(x, 2);
        X509_gmtime_adj(X509_getm_notBefore(x), 0);
        X509_gmtime_adj(X509_getm_notAfter(x), 30L * 86400L);
        X509_set_pubkey(x, key);

        X509_NAME *name = X509_get_subject_name(x);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char *>("gamecast-host"),
                                   -1, -1, 0);
        X509_set_issuer_name(x, name);

        if (X509_sign(x, key, EVP_sha256()) == 0) {
            X509_free(x);
            return nullptr;
        }
        return x;
    }

    IoStatus wait_for(sock_t fd, IoStatus want, int timeout_ms) {
        pollfd pfd{fd, (short)(want == IoStatus::WANT_WRITE ? POLLOUT : POLLIN), 0};
        int r = poll(&pfd, 1, timeout_ms);
        if (r < 0 && errno != EINTR) return IoStatus::FAILED;
        return IoStatus::OK;
    }

} // namespace

    IoResult PlainStream::read(uint8_t *buf, size_t len) {
        for (;;) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n > 0) return IoResult{IoStatus::OK, (size_t)n};
            if (n == 0) return IoResult{IoStatus::CLOSED, 0};
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return IoResult{IoStatus::WANT_READ, 0};
            error_ = std::string("recv failed: ") + strerror(errno);
            return IoResult{IoStatus::FAILED, 0};
        }
    }

    IoResult PlainStream::write(const uint8_t *data, size_t len) {
        for (;;) {
            ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
            if (n > 0) return IoResult{IoStatus::OK, (size_t)n};
            if (n == 0) {
                error_ = "send wrote nothing";
                return IoResult{IoStatus::FAILED, 0};
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return IoResult{IoStatus::WANT_WRITE, 0};
            error_ = std::string("send failed: ") + strerror(errno);
            return IoResult{IoStatus::FAILED, 0};
        }
    }

    TlsStream::~TlsStream() {
        if (ssl_) SSL_free(ssl_);
    }

    IoResult TlsStream::result_of(int ret, const char *what) {
        if (ret > 0) return IoResult{IoStatus::OK, (size_t)ret};
        int err = SSL_get_error(ssl_, ret);
        switch (err) {
            case SSL_ERROR_WANT_READ: return IoResult{IoStatus::WANT_READ, 0};
            case SSL_ERROR_WANT_WRITE: return IoResult{IoStatus::WANT_WRITE, 0};
            case SSL_ERROR_ZERO_RETURN: return IoResult{IoStatus::CLOSED, 0};
            case SSL_ERROR_SYSCALL:
                // EOF without close_notify: the peer went away
                if (ERR_peek_error() == 0 && (ret == 0 || errno == 0 || errno == ECONNRESET || errno == EPIPE)) {
                    return IoResult{IoStatus::CLOSED, 0};
                }
                error_ = std::string(what) + ": " + strerror(errno);
                return IoResult{IoStatus::FAILED, 0};
            default:
                error_ = std::string(what) + ": " + ssl_errors();
                return IoResult{IoStatus::FAILED, 0};
        }
    }

    IoResult TlsStream::read(uint8_t *buf, size_t len) {
        if (shut_down_) return IoResult{IoStatus::CLOSED, 0};
        ERR_clear_error();
        errno = 0;
        return result_of(SSL_read(ssl_, buf, (int)std::min<size_t>(len, 0x7FFFFFFF)), "TLS read");
    }

    IoResult TlsStream::write(const uint8_t *data, size_t len) {
        if (shut_down_) {
            error_ = "TLS stream shut down";
            return IoResult{IoStatus::FAILED, 0};
        }
        ERR_clear_error();
        errno = 0;
        return result_of(SSL_write(ssl_, data, (int)std::min<size_t>(len, 0x7FFFFFFF)), "TLS write");
    }

    IoResult TlsStream::handshake() {
        if (SSL_is_init_finished(ssl_)) return IoResult{};
        ERR_clear_error();
        errno = 0;
        int ret = SSL_do_handshake(ssl_);
        if (ret == 1) {
            LOG_NET_DEBUG("TLS handshake done on fd={} ({})", fd_, SSL_get_version(ssl_));
            return IoResult{};
        }
        IoResult r = result_of(ret, "TLS handshake");
        if (r.status == IoStatus::CLOSED) error_ = "peer closed during TLS handshake";
        return r;
    }

    void TlsStream::shutdown() {
        if (shut_down_) return;
        shut_down_ = true;
        // one close_notify, no waiting for the peer's
        if (SSL_is_init_finished(ssl_)) {
            ERR_clear_error();
            SSL_shutdown(ssl_);
        }
    }

    std::string TlsStream::peer_fingerprint() const {
        X509 *cert = SSL_get_peer_certificate(ssl_);
        if (!cert) return std::string();
        std::string fp = hex_fingerprint(cert);
        X509_free(cert);
        return fp;
    }

    std::shared_ptr<TlsContext> TlsContext::create_server(const TlsConfig &cfg) {
        init_openssl();
        SSL_CTX *ctx = SSL_CTX_new(TLS_server_method());
        if (!ctx) {
            LOG_NET_ERROR("SSL_CTX_new failed: {}", ssl_errors());
            return nullptr;
        }
        std::shared_ptr<TlsContext> out(new TlsContext(ctx, true));
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        if (!cfg.cert_file.empty() || !cfg.key_file.empty()) {
            if (SSL_CTX_use_certificate_chain_file(ctx, cfg.cert_file.c_str()) != 1 ||
                SSL_CTX_use_PrivateKey_file(ctx, cfg.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
                LOG_NET_ERROR("cannot load TLS certificate '{}' / key '{}': {}", cfg.cert_file, cfg.key_file,
                              ssl_errors());
                return nullptr;
            }
        } else {
            EVP_PKEY *key = generate_key();
            X509 *cert = key ? generate_cert(key) : nullptr;
            bool ok = cert && SSL_CTX_use_certificate(ctx, cert) == 1 && SSL_CTX_use_PrivateKey(ctx, key) == 1;
            if (cert) X509_free(cert);
            if (key) EVP_PKEY_free(key);
            if (!ok) {
                LOG_NET_ERROR("cannot create self-signed TLS certificate: {}", ssl_errors());
                return nullptr;
            }
            LOG_NET_INFO("no TLS certificate configured, using a self-signed one");
        }
        if (SSL_CTX_check_private_key(ctx) != 1) {
            LOG_NET_ERROR("TLS private key does not match the certificate: {}", ssl_errors());
            return nullptr;
        }
        out->fingerprint_ = hex_fingerprint(SSL_CTX_get0_certificate(ctx));
        LOG_NET_INFO("TLS certificate fingerprint {}", out->fingerprint_);
        return out;
    }

    std::shared_ptr<TlsContext> TlsContext::create_client(const TlsConfig &cfg) {
        (void)cfg;
        init_openssl();
        SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) {
            LOG_NET_ERROR("SSL_CTX_new failed: {}", ssl_errors());
            return nullptr;
        }
        std::shared_ptr<TlsContext> out(new TlsContext(ctx, false));
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
        // the host certificate is checked by fingerprint after the handshake
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
        return out;
    }

    TlsContext::~TlsContext() {
        if (ctx_) SSL_CTX_free(ctx_);
    }

    std::unique_ptr<ControlStream> TlsContext::wrap(sock_t fd) const {
        SSL *ssl = SSL_new(ctx_);
        if (!ssl) {
            LOG_NET_ERROR("SSL_new failed: {}", ssl_errors());
            return nullptr;
        }
        if (SSL_set_fd(ssl, fd) != 1) {
            LOG_NET_ERROR("SSL_set_fd({}) failed: {}", fd, ssl_errors());
            SSL_free(ssl);
            return nullptr;
        }
        if (server_) SSL_set_accept_state(ssl);
        else SSL_set_connect_state(ssl);
        return std::make_unique<TlsStream>(ssl, fd);
    }

    bool write_all(ControlStream &stream, const uint8_t *data, size_t len, std::chrono::milliseconds timeout,
                   std::string &error) {
        const auto deadline = Clock::now() + timeout;
        size_t total = 0;
        while (total < len) {
            IoResult r = stream.write(data + total, len - total);
            if (r.status == IoStatus::OK) {
                total += r.bytes;
                continue;
            }
            if (r.status == IoStatus::WANT_READ || r.status == IoStatus::WANT_WRITE) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
                if (left <= 0) {
                    error = fmt::format("timed out after {}/{} bytes", (uint64_t)total, (uint64_t)len);
                    return false;
                }
                if (wait_for(stream.fd(), r.status, (int)left) == IoStatus::FAILED) {
                    error = std::string("poll failed: ") + strerror(errno);
                    return false;
                }
                continue;
            }
            error = r.status == IoStatus::CLOSED ? std::string("peer closed the channel") : stream.last_error();
            return false;
        }
        return true;
    }

    bool complete_handshake(ControlStream &stream, std::chrono::milliseconds timeout, std::string &error) {
        const auto deadline = Clock::now() + timeout;
        for (;;) {
            IoResult r = stream.handshake();
            if (r.status == IoStatus::OK) return true;
            if (r.status != IoStatus::WANT_READ && r.status != IoStatus::WANT_WRITE) {
                error = stream.last_error();
                return false;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) {
                error = "TLS handshake timed out";
                return false;
            }
            if (wait_for(stream.fd(), r.status, (int)left) == IoStatus::FAILED) {
                error = std::string("poll failed: ") + strerror(errno);
                return false;
            }
        }
    }

    bool fingerprint_matches(const std::string &expected, const std::string &actual) {
        auto normalize = [](const std::string &s) {
            std::string out;
            for (char c : s) {
                if (c == ':' || c == ' ') continue;
                out += (char)std::toupper((unsigned char)c);
            }
            return out;
        };
        std::string e = normalize(expected);
        return !e.empty() && e == normalize(actual);
    }

} // namespace gamecast::tls
