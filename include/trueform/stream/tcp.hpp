#pragma once

#include <trueform/endpoint.hpp>

#include <chrono>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace trueform {

    using Deadline = std::chrono::steady_clock::time_point;

    inline Deadline deadline_after(dp::u32 timeout_ms) {
        return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    }

    // Milliseconds left until the deadline, 0 once it has passed
    inline dp::i32 remaining_ms(Deadline deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return 0;
        }
        return static_cast<dp::i32>(left.count());
    }

    // Wait until fd is ready for the given poll events
    // Returns true when ready, false on timeout; timeout_ms < 0 waits forever
    inline dp::Res<bool> wait_fd(dp::i32 fd, short events, dp::i32 timeout_ms) {
        while (true) {
            struct pollfd pfd = {};
            pfd.fd = fd;
            pfd.events = events;
            dp::i32 ret = ::poll(&pfd, 1, timeout_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                echo::error("poll failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("poll failed: ") + strerror(errno)));
            }
            return dp::result::ok(ret > 0);
        }
    }

    // Byte-level client connection underneath a framed stream
    // All I/O is non-blocking; callers wait with wait_fd() on native_handle()
    class Socket {
      public:
        virtual ~Socket() = default;

        // Connect and run any handshake of this layer before the deadline
        virtual dp::Res<void> connect(const WsEndpoint &endpoint, Deadline deadline) = 0;

        // Read what is available
        // timeout error means nothing available right now, not_found means closed
        virtual dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) = 0;

        // Write what the socket accepts, 0 when it would block
        virtual dp::Res<dp::usize> write_some(const dp::u8 *buffer, dp::usize count) = 0;

        // Bytes already buffered above the kernel socket (decrypted TLS records)
        virtual bool has_buffered() const { return false; }

        virtual dp::i32 native_handle() const = 0;

        // Shut the connection down in both directions, waking any poll() on it
        virtual void shutdown() = 0;
    };

    // Plain TCP client socket using BSD sockets
    class TcpSocket : public Socket {
      private:
        dp::i32 fd_;

        static dp::Res<void> set_nonblocking(dp::i32 fd) {
            dp::i32 flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                return dp::result::err(dp::Error::io_error(dp::String("fcntl failed: ") + strerror(errno)));
            }
            return dp::result::ok();
        }

        // Non-blocking connect to one resolved address
        dp::Res<void> connect_one(const struct addrinfo *ai, Deadline deadline) {
            dp::i32 fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                return dp::result::err(dp::Error::io_error(dp::String("socket creation failed: ") + strerror(errno)));
            }

            auto nb_res = set_nonblocking(fd);
            if (nb_res.is_err()) {
                ::close(fd);
                return nb_res;
            }

            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
                if (errno != EINPROGRESS) {
                    dp::String cause = dp::String("connect failed: ") + strerror(errno);
                    ::close(fd);
                    return dp::result::err(dp::Error::io_error(cause));
                }

                auto wait_res = wait_fd(fd, POLLOUT, remaining_ms(deadline));
                if (wait_res.is_err()) {
                    ::close(fd);
                    return dp::result::err(wait_res.error());
                }
                if (!wait_res.value()) {
                    ::close(fd);
                    return dp::result::err(dp::Error::timeout("connect timed out"));
                }

                dp::i32 so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
                    dp::String cause = dp::String("connect failed: ") + strerror(so_error != 0 ? so_error : errno);
                    ::close(fd);
                    return dp::result::err(dp::Error::io_error(cause));
                }
            }

            dp::i32 opt = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt TCP_NODELAY failed: ", strerror(errno));
            }

            fd_ = fd;
            return dp::result::ok();
        }

      public:
        TcpSocket() : fd_(-1) { echo::trace("TcpSocket constructed"); }

        ~TcpSocket() override {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        dp::Res<void> connect(const WsEndpoint &endpoint, Deadline deadline) override {
            echo::trace("tcp connecting to ", endpoint.host.c_str(), ":", endpoint.port);

            struct addrinfo hints = {};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(endpoint.port).c_str());
            dp::i32 ret = ::getaddrinfo(endpoint.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("failed to resolve host: ") + gai_strerror(ret)));
            }

            // Try each resolved address until one connects
            dp::Res<void> last = dp::result::err(dp::Error::io_error("no usable address"));
            for (struct addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
                if (remaining_ms(deadline) == 0) {
                    last = dp::result::err(dp::Error::timeout("connect timed out"));
                    break;
                }
                last = connect_one(ai, deadline);
                if (last.is_ok()) {
                    break;
                }
                echo::debug("address attempt failed: ", last.error().message.c_str());
            }
            ::freeaddrinfo(result);

            if (last.is_err()) {
                echo::error("tcp connect to ", endpoint.host.c_str(), " failed: ", last.error().message.c_str());
                return last;
            }

            echo::debug("tcp connected to ", endpoint.host.c_str(), ":", endpoint.port, " fd=", fd_);
            return dp::result::ok();
        }

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) override {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            return trueform::read_some(fd_, buffer, count);
        }

        dp::Res<dp::usize> write_some(const dp::u8 *buffer, dp::usize count) override {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            return trueform::write_some(fd_, buffer, count);
        }

        dp::i32 native_handle() const override { return fd_; }

        void shutdown() override {
            if (fd_ >= 0) {
                ::shutdown(fd_, SHUT_RDWR);
            }
        }
    };

} // namespace trueform
