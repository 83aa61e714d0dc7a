#pragma once

#include <trueform/stream.hpp>
#include <trueform/stream/tcp.hpp>
#include <trueform/stream/tls.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>
#include <deque>
#include <mutex>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <string>
#include <wslay/wslay.h>

namespace trueform {

    namespace websocket {

        // RFC 6455 magic value appended to the client key
        constexpr const char *ACCEPT_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

        // Largest HTTP upgrade response header we accept
        constexpr dp::usize MAX_HANDSHAKE_BYTES = 16384;

        inline std::string base64_encode(const unsigned char *data, dp::usize len) {
            std::string out(4 * ((len + 2) / 3), '\0');
            dp::i32 written =
                EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data, static_cast<dp::i32>(len));
            out.resize(static_cast<dp::usize>(written));
            return out;
        }

        /// Sec-WebSocket-Accept value the server must answer for client_key
        inline std::string compute_accept_key(const std::string &client_key) {
            std::string combined = client_key + ACCEPT_GUID;
            unsigned char hash[SHA_DIGEST_LENGTH];
            SHA1(reinterpret_cast<const unsigned char *>(combined.data()), combined.size(), hash);
            return base64_encode(hash, SHA_DIGEST_LENGTH);
        }

        /// Random 16-byte nonce, base64 encoded
        inline dp::Res<std::string> make_client_key() {
            unsigned char nonce[16];
            if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
                return dp::result::err(dp::Error::io_error(ssl_error_string("failed to generate WebSocket key")));
            }
            return dp::result::ok(base64_encode(nonce, sizeof(nonce)));
        }

        inline std::string build_upgrade_request(const WsEndpoint &endpoint, const std::string &client_key) {
            std::string request;
            request += "GET ";
            request += endpoint.path.c_str();
            request += " HTTP/1.1\r\n";
            request += "Host: ";
            request += endpoint.authority().c_str();
            request += "\r\n";
            request += "Upgrade: websocket\r\n";
            request += "Connection: Upgrade\r\n";
            request += "Sec-WebSocket-Key: " + client_key + "\r\n";
            request += "Sec-WebSocket-Version: 13\r\n";
            request += "\r\n";
            return request;
        }

        inline std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        inline std::string trim(const std::string &text) {
            auto begin = text.find_first_not_of(" \t");
            if (begin == std::string::npos) {
                return "";
            }
            auto end = text.find_last_not_of(" \t\r");
            return text.substr(begin, end - begin + 1);
        }

        /// Validate the server's answer to the upgrade request
        /// header_block is everything before the blank line
        inline dp::Res<void> check_upgrade_response(const std::string &header_block, const std::string &client_key) {
            auto line_end = header_block.find("\r\n");
            std::string status_line = header_block.substr(0, line_end);
            if (status_line.size() < 12 || status_line.compare(0, 9, "HTTP/1.1 ") != 0 ||
                status_line.compare(9, 3, "101") != 0) {
                return dp::result::err(
                    dp::Error::io_error(dp::String("WebSocket upgrade rejected: ") + status_line.c_str()));
            }

            bool upgrade_ok = false;
            std::string accept;
            dp::usize pos = line_end == std::string::npos ? header_block.size() : line_end + 2;
            while (pos < header_block.size()) {
                auto next = header_block.find("\r\n", pos);
                std::string line = header_block.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
                pos = next == std::string::npos ? header_block.size() : next + 2;

                auto colon = line.find(':');
                if (colon == std::string::npos) {
                    continue;
                }
                std::string name = lowercase(trim(line.substr(0, colon)));
                std::string value = trim(line.substr(colon + 1));
                if (name == "upgrade") {
                    upgrade_ok = lowercase(value) == "websocket";
                } else if (name == "sec-websocket-accept") {
                    accept = value;
                }
            }

            if (!upgrade_ok) {
                return dp::result::err(dp::Error::io_error("WebSocket upgrade response has no Upgrade: websocket"));
            }
            if (accept != compute_accept_key(client_key)) {
                return dp::result::err(dp::Error::io_error("WebSocket upgrade response has a wrong accept key"));
            }
            return dp::result::ok();
        }

    } // namespace websocket

    // WebSocket client stream
    // Text frames over a TcpSocket (ws://) or TlsSocket (wss://), framed by wslay.
    // The TLS session and the wslay context are guarded by io_mutex_, which is
    // only held for non-blocking work; waiting on the socket happens unlocked.
    class WsStream : public Stream {
      private:
        std::unique_ptr<Socket> socket_;
        wslay_event_context_ptr ctx_;
        mutable std::mutex io_mutex_;
        std::deque<Message> inbox_;
        std::string residue_; // bytes that arrived right behind the upgrade response
        dp::usize residue_pos_;
        dp::String io_error_;
        std::atomic<bool> connected_;
        std::atomic<bool> closed_;
        std::atomic<bool> peer_closed_;
        std::atomic<dp::u32> recv_timeout_ms_;
        dp::u32 send_timeout_ms_;

        // ====================================================================
        // wslay callbacks (run inside wslay_event_recv/send, io_mutex_ held)
        // ====================================================================

        static ssize_t recv_callback(wslay_event_context_ptr ctx, uint8_t *buf, size_t len, int, void *user_data) {
            auto *self = static_cast<WsStream *>(user_data);

            if (self->residue_pos_ < self->residue_.size()) {
                dp::usize n = std::min(len, self->residue_.size() - self->residue_pos_);
                std::memcpy(buf, self->residue_.data() + self->residue_pos_, n);
                self->residue_pos_ += n;
                return static_cast<ssize_t>(n);
            }

            auto res = self->socket_->read_some(buf, len);
            if (res.is_ok()) {
                return static_cast<ssize_t>(res.value());
            }
            if (res.error().code == dp::Error::TIMEOUT) {
                wslay_event_set_error(ctx, WSLAY_ERR_WOULDBLOCK);
                return -1;
            }
            self->io_error_ = res.error().message;
            wslay_event_set_error(ctx, WSLAY_ERR_CALLBACK_FAILURE);
            return -1;
        }

        static ssize_t send_callback(wslay_event_context_ptr ctx, const uint8_t *data, size_t len, int,
                                     void *user_data) {
            auto *self = static_cast<WsStream *>(user_data);

            auto res = self->socket_->write_some(data, len);
            if (res.is_err()) {
                self->io_error_ = res.error().message;
                wslay_event_set_error(ctx, WSLAY_ERR_CALLBACK_FAILURE);
                return -1;
            }
            if (res.value() == 0) {
                wslay_event_set_error(ctx, WSLAY_ERR_WOULDBLOCK);
                return -1;
            }
            return static_cast<ssize_t>(res.value());
        }

        static int genmask_callback(wslay_event_context_ptr, uint8_t *buf, size_t len, void *) {
            return RAND_bytes(buf, static_cast<int>(len)) == 1 ? 0 : -1;
        }

        static void on_msg_recv_callback(wslay_event_context_ptr, const struct wslay_event_on_msg_recv_arg *arg,
                                         void *user_data) {
            auto *self = static_cast<WsStream *>(user_data);

            if (!wslay_is_ctrl_frame(arg->opcode)) {
                echo::trace("websocket message received, ", arg->msg_length, " bytes");
                self->inbox_.emplace_back(arg->msg, arg->msg + arg->msg_length);
            } else if (arg->opcode == WSLAY_CONNECTION_CLOSE) {
                echo::debug("websocket close frame received, status=", arg->status_code);
                self->peer_closed_ = true;
            }
        }

        // ====================================================================
        // Handshake helpers (before the stream is shared, no locking)
        // ====================================================================

        dp::Res<void> write_all(const std::string &data, Deadline deadline) {
            dp::usize sent = 0;
            while (sent < data.size()) {
                auto res = socket_->write_some(reinterpret_cast<const dp::u8 *>(data.data()) + sent, data.size() - sent);
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                if (res.value() > 0) {
                    sent += res.value();
                    continue;
                }
                auto wait_res = wait_fd(socket_->native_handle(), POLLOUT, remaining_ms(deadline));
                if (wait_res.is_err()) {
                    return dp::result::err(wait_res.error());
                }
                if (!wait_res.value()) {
                    return dp::result::err(dp::Error::timeout("WebSocket handshake timed out"));
                }
            }
            return dp::result::ok();
        }

        dp::Res<std::string> read_upgrade_response(Deadline deadline) {
            std::string buffer;
            dp::u8 chunk[4096];
            while (true) {
                auto header_end = buffer.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    residue_ = buffer.substr(header_end + 4);
                    residue_pos_ = 0;
                    return dp::result::ok(buffer.substr(0, header_end));
                }
                if (buffer.size() > websocket::MAX_HANDSHAKE_BYTES) {
                    return dp::result::err(dp::Error::io_error("WebSocket upgrade response too large"));
                }

                auto res = socket_->read_some(chunk, sizeof(chunk));
                if (res.is_ok()) {
                    buffer.append(reinterpret_cast<const char *>(chunk), res.value());
                    continue;
                }
                if (res.error().code != dp::Error::TIMEOUT) {
                    return dp::result::err(res.error());
                }

                auto wait_res = wait_fd(socket_->native_handle(), POLLIN, remaining_ms(deadline));
                if (wait_res.is_err()) {
                    return dp::result::err(wait_res.error());
                }
                if (!wait_res.value()) {
                    return dp::result::err(dp::Error::timeout("WebSocket handshake timed out"));
                }
            }
        }

        // ====================================================================
        // Locked I/O
        // ====================================================================

        // Feed available bytes to wslay and send anything it queued in reply
        dp::Res<void> pump_locked() {
            if (wslay_event_recv(ctx_) != 0) {
                connected_ = false;
                echo::debug("websocket receive failed: ", io_error_.c_str());
                return dp::result::err(dp::Error::not_found(dp::String("connection lost: ") + io_error_));
            }
            // Pong and close replies are queued by wslay itself
            if (wslay_event_want_write(ctx_) && wslay_event_send(ctx_) != 0) {
                echo::warn("websocket control reply failed: ", io_error_.c_str());
            }
            return dp::result::ok();
        }

        dp::Res<void> flush(std::unique_lock<std::mutex> &lock, Deadline deadline) {
            while (wslay_event_want_write(ctx_)) {
                if (wslay_event_send(ctx_) != 0) {
                    connected_ = false;
                    return dp::result::err(dp::Error::not_found(dp::String("send failed: ") + io_error_));
                }
                if (!wslay_event_want_write(ctx_)) {
                    break;
                }

                // Socket buffer full, wait for room without holding the lock
                dp::i32 fd = socket_->native_handle();
                lock.unlock();
                auto wait_res = wait_fd(fd, POLLOUT, remaining_ms(deadline));
                lock.lock();
                if (wait_res.is_err()) {
                    return dp::result::err(wait_res.error());
                }
                if (!wait_res.value()) {
                    return dp::result::err(dp::Error::timeout("send timed out"));
                }
                if (closed_) {
                    return dp::result::err(dp::Error::not_found("connection closed"));
                }
            }
            return dp::result::ok();
        }

      public:
        explicit WsStream(std::unique_ptr<Socket> socket)
            : socket_(std::move(socket)), ctx_(nullptr), residue_pos_(0), connected_(false), closed_(false),
              peer_closed_(false), recv_timeout_ms_(0), send_timeout_ms_(10000) {
            echo::trace("WsStream constructed");
        }

        ~WsStream() override {
            close();
            if (ctx_) {
                wslay_event_context_free(ctx_);
                ctx_ = nullptr;
            }
        }

        WsStream(const WsStream &) = delete;
        WsStream &operator=(const WsStream &) = delete;

        dp::Res<void> connect(const WsEndpoint &endpoint, dp::u32 timeout_ms) override {
            echo::trace("websocket connecting to ", endpoint.to_string().c_str());
            Deadline deadline = deadline_after(timeout_ms);
            send_timeout_ms_ = timeout_ms;

            auto socket_res = socket_->connect(endpoint, deadline);
            if (socket_res.is_err()) {
                return socket_res;
            }

            auto key_res = websocket::make_client_key();
            if (key_res.is_err()) {
                return dp::result::err(key_res.error());
            }
            const std::string &key = key_res.value();

            auto write_res = write_all(websocket::build_upgrade_request(endpoint, key), deadline);
            if (write_res.is_err()) {
                return write_res;
            }

            auto header_res = read_upgrade_response(deadline);
            if (header_res.is_err()) {
                return dp::result::err(header_res.error());
            }

            auto check_res = websocket::check_upgrade_response(header_res.value(), key);
            if (check_res.is_err()) {
                echo::error(check_res.error().message.c_str());
                return check_res;
            }

            wslay_event_callbacks callbacks = {};
            callbacks.recv_callback = &WsStream::recv_callback;
            callbacks.send_callback = &WsStream::send_callback;
            callbacks.genmask_callback = &WsStream::genmask_callback;
            callbacks.on_msg_recv_callback = &WsStream::on_msg_recv_callback;

            if (wslay_event_context_client_init(&ctx_, &callbacks, this) != 0) {
                ctx_ = nullptr;
                return dp::result::err(dp::Error::io_error("failed to initialize WebSocket context"));
            }

            connected_ = true;
            echo::debug("websocket connected to ", endpoint.to_string().c_str());
            return dp::result::ok();
        }

        dp::Res<void> send(const Message &msg) override {
            std::unique_lock<std::mutex> lock(io_mutex_);
            if (!is_connected()) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            struct wslay_event_msg frame = {WSLAY_TEXT_FRAME, msg.data(), msg.size()};
            if (wslay_event_queue_msg(ctx_, &frame) != 0) {
                return dp::result::err(dp::Error::io_error("failed to queue WebSocket frame"));
            }
            echo::trace("websocket send ", msg.size(), " bytes");
            return flush(lock, deadline_after(send_timeout_ms_));
        }

        dp::Res<Message> recv() override {
            dp::u32 timeout_ms = recv_timeout_ms_.load();
            Deadline deadline = deadline_after(timeout_ms);

            while (true) {
                {
                    std::lock_guard<std::mutex> lock(io_mutex_);
                    if (!inbox_.empty()) {
                        Message msg = std::move(inbox_.front());
                        inbox_.pop_front();
                        return dp::result::ok(std::move(msg));
                    }
                    if (closed_) {
                        return dp::result::err(dp::Error::not_found("connection closed"));
                    }
                    if (peer_closed_) {
                        return dp::result::err(dp::Error::not_found("connection closed by peer"));
                    }
                    if (!connected_) {
                        return dp::result::err(dp::Error::not_found("not connected"));
                    }
                    // Data already buffered above the kernel will not wake poll()
                    if (residue_pos_ < residue_.size() || socket_->has_buffered()) {
                        auto pump_res = pump_locked();
                        if (pump_res.is_err()) {
                            return dp::result::err(pump_res.error());
                        }
                        continue;
                    }
                }

                dp::i32 wait_ms = -1;
                if (timeout_ms > 0) {
                    wait_ms = remaining_ms(deadline);
                    if (wait_ms == 0) {
                        return dp::result::err(dp::Error::timeout("read timeout"));
                    }
                }

                auto wait_res = wait_fd(socket_->native_handle(), POLLIN, wait_ms);
                if (wait_res.is_err()) {
                    return dp::result::err(wait_res.error());
                }
                if (!wait_res.value()) {
                    continue;
                }

                std::lock_guard<std::mutex> lock(io_mutex_);
                if (closed_) {
                    return dp::result::err(dp::Error::not_found("connection closed"));
                }
                auto pump_res = pump_locked();
                if (pump_res.is_err()) {
                    return dp::result::err(pump_res.error());
                }
            }
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override {
            recv_timeout_ms_ = timeout_ms;
            return dp::result::ok();
        }

        void close() override {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;

            if (ctx_ && connected_ && !peer_closed_) {
                // Best effort: one non-blocking attempt at a close frame
                if (wslay_event_queue_close(ctx_, WSLAY_CODE_NORMAL_CLOSURE, nullptr, 0) == 0 &&
                    wslay_event_send(ctx_) != 0) {
                    echo::debug("websocket close frame not sent: ", io_error_.c_str());
                }
            }
            connected_ = false;
            socket_->shutdown();
            echo::debug("websocket closed");
        }

        bool is_connected() const override { return connected_ && !closed_ && !peer_closed_; }
    };

    // Build the stream for a ws:// or wss:// endpoint
    inline std::unique_ptr<Stream> make_websocket_stream(bool use_tls, bool verify_ssl) {
        if (!use_tls) {
            return std::unique_ptr<Stream>(new WsStream(std::unique_ptr<Socket>(new TcpSocket())));
        }
        auto tls_ctx = std::make_shared<TlsContext>(verify_ssl);
        return std::unique_ptr<Stream>(new WsStream(std::unique_ptr<Socket>(new TlsSocket(tls_ctx))));
    }

} // namespace trueform
