#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <functional>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace trueform {

    // Message type - one complete frame payload
    using Message = dp::Vector<dp::u8>;

    // JSON document type used for params, results and envelopes
    using Json = nlohmann::json;

    inline Message to_message(const std::string &text) { return Message(text.begin(), text.end()); }

    inline std::string to_text(const Message &msg) {
        return std::string(reinterpret_cast<const char *>(msg.data()), msg.size());
    }

    inline dp::String to_dp(const std::string &text) { return dp::String(text.c_str()); }

    inline dp::String number_to_string(dp::i64 value) { return dp::String(std::to_string(value).c_str()); }

    /// Runs a callable when the enclosing scope exits, on every path
    class ScopeExit {
      private:
        std::function<void()> fn_;
        bool active_;

      public:
        explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)), active_(true) {}

        ScopeExit(const ScopeExit &) = delete;
        ScopeExit &operator=(const ScopeExit &) = delete;

        ~ScopeExit() {
            if (active_ && fn_) {
                fn_();
            }
        }

        void dismiss() { active_ = false; }
    };

    // Helper to read whatever is available from a non-blocking socket
    // Returns the number of bytes read
    // ERROR CATEGORIZATION:
    // - timeout: EAGAIN/EWOULDBLOCK (nothing available yet, recoverable)
    // - not_found: connection closed (ECONNRESET, EPIPE, EOF)
    // - io_error: other I/O errors
    inline dp::Res<dp::usize> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize count) {
        while (true) {
            dp::isize n = ::recv(fd, buffer, count, 0);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("read interrupted by signal, retrying");
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return dp::result::err(dp::Error::timeout("read would block"));
                }
                if (errno == ECONNRESET) {
                    echo::trace("read failed: connection reset by peer (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("connection reset by peer"));
                }
                if (errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                    echo::trace("read failed: ", strerror(errno), " (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("socket not connected"));
                }
                echo::trace("read failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
            }

            // n == 0: EOF - connection closed gracefully
            if (n == 0) {
                echo::trace("connection closed by peer (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection closed by peer"));
            }

            echo::trace("read ", n, " bytes (fd=", fd, ")");
            return dp::result::ok(static_cast<dp::usize>(n));
        }
    }

    // Helper to write as much as the socket accepts without blocking
    // Returns the number of bytes written, 0 when the send buffer is full
    // ERROR CATEGORIZATION:
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF)
    // - io_error: other I/O errors
    inline dp::Res<dp::usize> write_some(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        while (true) {
            dp::isize n = ::send(fd, buffer, count, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("write would block (fd=", fd, ", wanted=", count, ")");
                    return dp::result::ok(static_cast<dp::usize>(0));
                }
                if (errno == ECONNRESET || errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                    echo::trace("write failed: ", strerror(errno), " (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("connection closed"));
                }
                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            echo::trace("wrote ", n, " bytes (fd=", fd, ")");
            return dp::result::ok(static_cast<dp::usize>(n));
        }
    }

} // namespace trueform
