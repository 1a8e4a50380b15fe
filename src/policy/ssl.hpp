// src/policy/ssl.hpp
// SSL/TLS policies
//
//   - OpenSSLPolicy: TLS 1.2+ client for wss:// (SNI, optional peer verification)
//   - NoSSLPolicy: plaintext ws://, every call is a no-op
//
// Both conform to SSLPolicyConcept:
//   - static constexpr bool is_tls
//   - void init(bool verify_peer)
//   - void handshake(int fd, const std::string& server_name, int timeout_ms)
//   - ssize_t read(void* buf, size_t len)        // errno = EAGAIN on would-block
//   - ssize_t write(const void* buf, size_t len) // errno = EAGAIN on would-block
//   - int get_fd() const
//   - void shutdown()
//
// Namespace: tinyws::ssl

#pragma once

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

#include <poll.h>
#include <sys/types.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "../ws_policies.hpp"

namespace tinyws {
namespace ssl {

// ============================================================================
// OpenSSL Policy
// ============================================================================

/**
 * OpenSSLPolicy - OpenSSL client over an already connected non-blocking socket
 *
 * The handshake drives SSL_connect() with poll() until it completes or the
 * timeout expires. After that, read()/write() never block: a would-block
 * condition returns -1 with errno = EAGAIN.
 *
 * Thread safety: Not thread-safe. SSL_read and SSL_write on the same SSL
 * object must be serialized by the caller.
 *
 * OpenSSL writes with write(2), not send(MSG_NOSIGNAL): processes using
 * wss:// should ignore SIGPIPE.
 */
struct OpenSSLPolicy {
    static constexpr bool is_tls = true;

    OpenSSLPolicy() : ctx_(nullptr), ssl_(nullptr) {}

    ~OpenSSLPolicy() {
        shutdown();
    }

    OpenSSLPolicy(const OpenSSLPolicy&) = delete;
    OpenSSLPolicy& operator=(const OpenSSLPolicy&) = delete;

    OpenSSLPolicy(OpenSSLPolicy&& other) noexcept
        : ctx_(other.ctx_)
        , ssl_(other.ssl_)
    {
        other.ctx_ = nullptr;
        other.ssl_ = nullptr;
    }

    OpenSSLPolicy& operator=(OpenSSLPolicy&& other) noexcept {
        if (this != &other) {
            shutdown();
            ctx_ = other.ctx_;
            ssl_ = other.ssl_;
            other.ctx_ = nullptr;
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /**
     * Create the client SSL context
     *
     * @param verify_peer Verify the server certificate chain and hostname
     *                    against the default trust store
     * @throws std::runtime_error if initialization fails
     */
    void init(bool verify_peer = false) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new() failed");
        }

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_mode(ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        verify_peer_ = verify_peer;
        if (verify_peer) {
            if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
                throw std::runtime_error("SSL_CTX_set_default_verify_paths() failed");
            }
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        } else {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    /**
     * Perform TLS handshake on a non-blocking socket
     *
     * @param fd Connected socket
     * @param server_name Host name for SNI (and verification when enabled)
     * @param timeout_ms Upper bound for the whole handshake
     * @throws std::runtime_error on failure or timeout
     */
    void handshake(int fd, const std::string& server_name, int timeout_ms) {
        if (!ctx_) {
            throw std::runtime_error("SSL handshake before init()");
        }
        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new() failed");
        }
        if (SSL_set_fd(ssl_, fd) != 1) {
            throw std::runtime_error("SSL_set_fd() failed");
        }
        if (SSL_set_tlsext_host_name(ssl_, server_name.c_str()) != 1) {
            throw std::runtime_error("SSL_set_tlsext_host_name() failed");
        }
        if (verify_peer_) {
            X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);
            X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            if (X509_VERIFY_PARAM_set1_host(param, server_name.c_str(), 0) != 1) {
                throw std::runtime_error("X509_VERIFY_PARAM_set1_host() failed");
            }
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (true) {
            ERR_clear_error();
            int ret = SSL_connect(ssl_);
            if (ret == 1) {
                break;
            }

            int err = SSL_get_error(ssl_, ret);
            short events = 0;
            if (err == SSL_ERROR_WANT_READ) {
                events = POLLIN;
            } else if (err == SSL_ERROR_WANT_WRITE) {
                events = POLLOUT;
            } else {
                char err_buf[256];
                ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
                throw std::runtime_error(std::string("SSL_connect() failed: ") + err_buf);
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                throw std::runtime_error("SSL_connect() timeout");
            }

            struct pollfd pfd = {fd, events, 0};
            int n = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (n < 0 && errno != EINTR) {
                throw std::runtime_error(std::string("poll() failed: ") + strerror(errno));
            }
        }
    }

    /**
     * Read decrypted data
     *
     * @return Bytes read, 0 on orderly close, -1 on error (errno = EAGAIN
     *         when no decrypted data is available yet)
     */
    ssize_t read(void* buf, size_t len) {
        if (!ssl_) {
            errno = ENOTCONN;
            return -1;
        }

        ERR_clear_error();
        errno = 0;
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        switch (err) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                errno = EAGAIN;
                return -1;
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_SYSCALL:
                if (errno == 0) return 0;   // EOF without close_notify
                return -1;
            default:
                errno = EIO;
                return -1;
        }
    }

    /**
     * Write data through TLS
     *
     * @return Bytes accepted, -1 on error (errno = EAGAIN on would-block; the
     *         retry must pass the same data)
     */
    ssize_t write(const void* buf, size_t len) {
        if (!ssl_) {
            errno = ENOTCONN;
            return -1;
        }

        ERR_clear_error();
        errno = 0;
        int n = SSL_write(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            errno = EAGAIN;
            return -1;
        }
        if (err != SSL_ERROR_SYSCALL || errno == 0) {
            errno = EIO;
        }
        return -1;
    }

    int get_fd() const {
        if (!ssl_) return -1;
        return SSL_get_fd(ssl_);
    }

    /**
     * Send close_notify (best-effort) and free the SSL objects
     */
    void shutdown() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }

        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    static constexpr const char* name() {
        return "OpenSSL";
    }

private:
    SSL_CTX* ctx_;
    SSL* ssl_;
    bool verify_peer_ = false;
};

// ============================================================================
// Plaintext Policy
// ============================================================================

/**
 * NoSSLPolicy - ws:// without encryption
 *
 * The connection routes I/O straight to the transport when is_tls is false;
 * read()/write() exist only to satisfy the concept.
 */
struct NoSSLPolicy {
    static constexpr bool is_tls = false;

    void init(bool = false) {}
    void handshake(int, const std::string&, int) {}

    ssize_t read(void*, size_t) {
        errno = ENOTSUP;
        return -1;
    }

    ssize_t write(const void*, size_t) {
        errno = ENOTSUP;
        return -1;
    }

    int get_fd() const { return -1; }
    void shutdown() {}

    static constexpr const char* name() {
        return "NoSSL";
    }
};

} // namespace ssl

static_assert(SSLPolicyConcept<ssl::OpenSSLPolicy>);
static_assert(SSLPolicyConcept<ssl::NoSSLPolicy>);

} // namespace tinyws
