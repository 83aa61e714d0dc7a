#pragma once

#include <trueform/stream/tcp.hpp>

#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace trueform {

    // Pop the OpenSSL error queue into one message
    inline dp::String ssl_error_string(const char *what) {
        dp::String text(what);
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return text;
        }
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        text = text + ": " + buf;
        ERR_clear_error();
        return text;
    }

    // Client TLS context
    // verify_peer selects certificate chain and host name verification
    class TlsContext {
      private:
        SSL_CTX *ctx_;
        bool verify_peer_;

      public:
        explicit TlsContext(bool verify_peer) : ctx_(nullptr), verify_peer_(verify_peer) {
            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_) {
                echo::error(ssl_error_string("failed to create SSL context").c_str());
                return;
            }

            SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
            SSL_CTX_set_mode(ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

            if (verify_peer_) {
                if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
                    echo::warn(ssl_error_string("failed to load default CA paths").c_str());
                }
                SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            } else {
                SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
            }
            echo::trace("TLS context created, verify_peer=", verify_peer_);
        }

        ~TlsContext() {
            if (ctx_) {
                SSL_CTX_free(ctx_);
            }
        }

        TlsContext(const TlsContext &) = delete;
        TlsContext &operator=(const TlsContext &) = delete;

        bool is_valid() const { return ctx_ != nullptr; }
        bool verify_peer() const { return verify_peer_; }
        SSL_CTX *get() const { return ctx_; }
    };

    // TLS client socket over TcpSocket
    class TlsSocket : public Socket {
      private:
        TcpSocket tcp_;
        std::shared_ptr<TlsContext> tls_ctx_;
        SSL *ssl_;
        bool handshake_complete_;

        dp::Res<void> handshake(const WsEndpoint &endpoint, Deadline deadline) {
            ssl_ = SSL_new(tls_ctx_->get());
            if (!ssl_) {
                return dp::result::err(dp::Error::io_error(ssl_error_string("SSL_new failed")));
            }
            SSL_set_fd(ssl_, tcp_.native_handle());

            // SNI
            if (SSL_set_tlsext_host_name(ssl_, endpoint.host.c_str()) != 1) {
                echo::warn("failed to set TLS server name for ", endpoint.host.c_str());
            }
            if (tls_ctx_->verify_peer()) {
                if (SSL_set1_host(ssl_, endpoint.host.c_str()) != 1) {
                    return dp::result::err(dp::Error::io_error(ssl_error_string("failed to set expected host name")));
                }
            }

            while (true) {
                dp::i32 result = SSL_connect(ssl_);
                if (result == 1) {
                    handshake_complete_ = true;
                    echo::debug("TLS handshake completed with ", endpoint.host.c_str(), " (", SSL_get_version(ssl_),
                                ")");
                    return dp::result::ok();
                }

                dp::i32 ssl_error = SSL_get_error(ssl_, result);
                if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
                    short events = ssl_error == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
                    auto wait_res = wait_fd(tcp_.native_handle(), events, remaining_ms(deadline));
                    if (wait_res.is_err()) {
                        return dp::result::err(wait_res.error());
                    }
                    if (!wait_res.value()) {
                        return dp::result::err(dp::Error::timeout("TLS handshake timed out"));
                    }
                    continue;
                }

                long verify = SSL_get_verify_result(ssl_);
                if (verify != X509_V_OK) {
                    ERR_clear_error();
                    return dp::result::err(dp::Error::io_error(dp::String("TLS certificate verification failed: ") +
                                                               X509_verify_cert_error_string(verify)));
                }
                return dp::result::err(dp::Error::io_error(ssl_error_string("TLS handshake failed")));
            }
        }

      public:
        explicit TlsSocket(std::shared_ptr<TlsContext> tls_ctx)
            : tls_ctx_(std::move(tls_ctx)), ssl_(nullptr), handshake_complete_(false) {}

        ~TlsSocket() override {
            if (ssl_) {
                SSL_free(ssl_);
                ssl_ = nullptr;
            }
        }

        TlsSocket(const TlsSocket &) = delete;
        TlsSocket &operator=(const TlsSocket &) = delete;

        dp::Res<void> connect(const WsEndpoint &endpoint, Deadline deadline) override {
            if (!tls_ctx_ || !tls_ctx_->is_valid()) {
                return dp::result::err(dp::Error::io_error("TLS context not initialized"));
            }

            auto tcp_res = tcp_.connect(endpoint, deadline);
            if (tcp_res.is_err()) {
                return tcp_res;
            }
            return handshake(endpoint, deadline);
        }

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) override {
            if (!ssl_ || !handshake_complete_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            dp::i32 n = SSL_read(ssl_, buffer, static_cast<dp::i32>(count));
            if (n > 0) {
                return dp::result::ok(static_cast<dp::usize>(n));
            }

            dp::i32 ssl_error = SSL_get_error(ssl_, n);
            switch (ssl_error) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                return dp::result::err(dp::Error::timeout("read would block"));
            case SSL_ERROR_ZERO_RETURN:
                echo::trace("TLS session closed by peer");
                return dp::result::err(dp::Error::not_found("connection closed by peer"));
            case SSL_ERROR_SYSCALL:
                ERR_clear_error();
                return dp::result::err(dp::Error::not_found("connection closed by peer"));
            default:
                return dp::result::err(dp::Error::io_error(ssl_error_string("TLS read failed")));
            }
        }

        dp::Res<dp::usize> write_some(const dp::u8 *buffer, dp::usize count) override {
            if (!ssl_ || !handshake_complete_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            dp::i32 n = SSL_write(ssl_, buffer, static_cast<dp::i32>(count));
            if (n > 0) {
                return dp::result::ok(static_cast<dp::usize>(n));
            }

            dp::i32 ssl_error = SSL_get_error(ssl_, n);
            switch (ssl_error) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                return dp::result::ok(static_cast<dp::usize>(0));
            case SSL_ERROR_ZERO_RETURN:
            case SSL_ERROR_SYSCALL:
                ERR_clear_error();
                return dp::result::err(dp::Error::not_found("connection closed"));
            default:
                return dp::result::err(dp::Error::io_error(ssl_error_string("TLS write failed")));
            }
        }

        bool has_buffered() const override { return ssl_ && SSL_pending(ssl_) > 0; }

        dp::i32 native_handle() const override { return tcp_.native_handle(); }

        void shutdown() override {
            // close_notify is best effort on a non-blocking socket
            if (ssl_ && handshake_complete_) {
                if (SSL_shutdown(ssl_) < 0) {
                    ERR_clear_error();
                }
            }
            tcp_.shutdown();
        }
    };

} // namespace trueform
