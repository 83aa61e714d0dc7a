#pragma once

#include <trueform/remote/protocol.hpp>

namespace trueform {
    namespace remote {

        /// Wire error codes
        namespace codes {
            // Generic JSON-RPC block
            constexpr dp::i32 PARSE_ERROR = -32700;
            constexpr dp::i32 INVALID_REQUEST = -32600;
            constexpr dp::i32 METHOD_NOT_FOUND = -32601;
            constexpr dp::i32 INVALID_PARAMS = -32602;
            constexpr dp::i32 INTERNAL_ERROR = -32603;

            // Application block
            constexpr dp::i32 NOT_AUTHENTICATED = 1;
            constexpr dp::i32 NOT_AUTHORIZED = 2;
            constexpr dp::i32 NOT_FOUND = 3;
            constexpr dp::i32 VALIDATION_FAILED = 4;
        } // namespace codes

        enum class ErrorKind : dp::u8 {
            Connection = 0, // dial or handshake failed
            Transport = 1,  // I/O failure on an established session
            Protocol = 2,   // malformed frame or undecodable result
            NotFound = 3,
            Auth = 4,
            Validation = 5,
            Remote = 6, // any other server error
            Timeout = 7,
            Cancelled = 8,
            Job = 9, // job failed, aborted or unknown
        };

        inline const char *kind_name(ErrorKind kind) {
            switch (kind) {
            case ErrorKind::Connection:
                return "connection";
            case ErrorKind::Transport:
                return "transport";
            case ErrorKind::Protocol:
                return "protocol";
            case ErrorKind::NotFound:
                return "not found";
            case ErrorKind::Auth:
                return "auth";
            case ErrorKind::Validation:
                return "validation";
            case ErrorKind::Remote:
                return "remote";
            case ErrorKind::Timeout:
                return "timeout";
            case ErrorKind::Cancelled:
                return "cancelled";
            case ErrorKind::Job:
                return "job";
            default:
                return "unknown";
            }
        }

        /// Error value returned by every client operation
        struct Error {
            ErrorKind kind = ErrorKind::Remote;
            dp::i32 code = 0;   // wire code, 0 when the error did not come from the server
            dp::String message;
            dp::String details; // raw text of the wire error data, empty when absent
            dp::String host;    // target host, set on connection errors

            static Error connection(const dp::String &host, const dp::String &cause) {
                Error e;
                e.kind = ErrorKind::Connection;
                e.message = cause;
                e.host = host;
                return e;
            }

            static Error transport(const dp::String &message) {
                Error e;
                e.kind = ErrorKind::Transport;
                e.message = message;
                return e;
            }

            static Error protocol(const dp::String &message) {
                Error e;
                e.kind = ErrorKind::Protocol;
                e.message = message;
                return e;
            }

            static Error auth(const dp::String &message) {
                Error e;
                e.kind = ErrorKind::Auth;
                e.message = message;
                return e;
            }

            static Error timeout(const dp::String &message) {
                Error e;
                e.kind = ErrorKind::Timeout;
                e.message = message;
                return e;
            }

            static Error cancelled(const dp::String &message = "context cancelled") {
                Error e;
                e.kind = ErrorKind::Cancelled;
                e.message = message;
                return e;
            }

            static Error job(const dp::String &message) {
                Error e;
                e.kind = ErrorKind::Job;
                e.message = message;
                return e;
            }

            /// Same error with "<prefix>: " put in front of the message
            Error with_context(const dp::String &prefix) const {
                Error e = *this;
                e.message = prefix + ": " + message;
                return e;
            }

            /// Human-readable rendering
            /// Server errors: "API error <code>: <message> (<details>)"
            /// Connection errors: multi-line diagnostic with remediation steps
            dp::String to_string() const;
        };

        /// Result type carried through the client surface
        template <typename T> using Res = dp::Result<T, Error>;

        // ========================================================================
        // Classification
        // ========================================================================

        inline bool contains(const dp::String &haystack, const char *needle) {
            return std::string(haystack.c_str()).find(needle) != std::string::npos;
        }

        /// Map a wire error into the taxonomy
        inline Error classify(const WireError &wire) {
            Error e;
            e.code = wire.code;
            e.message = to_dp(wire.message);
            if (!wire.data.is_null()) {
                e.details = wire.data.is_string() ? to_dp(wire.data.get<std::string>()) : to_dp(wire.data.dump());
            }

            switch (wire.code) {
            case codes::NOT_FOUND:
                e.kind = ErrorKind::NotFound;
                break;
            case codes::NOT_AUTHENTICATED:
            case codes::NOT_AUTHORIZED:
                e.kind = ErrorKind::Auth;
                break;
            case codes::VALIDATION_FAILED:
                e.kind = ErrorKind::Validation;
                break;
            case codes::INVALID_PARAMS:
                // Lookups of missing instances come back as invalid params
                if (contains(e.details, "InstanceNotFound") || contains(e.details, "does not exist")) {
                    e.kind = ErrorKind::NotFound;
                } else {
                    e.kind = ErrorKind::Remote;
                }
                break;
            default:
                e.kind = ErrorKind::Remote;
                break;
            }
            return e;
        }

        inline bool is_not_found(const Error &e) { return e.kind == ErrorKind::NotFound; }

        inline bool is_auth_error(const Error &e) { return e.kind == ErrorKind::Auth; }

        inline bool is_validation_error(const Error &e) { return e.kind == ErrorKind::Validation; }

        inline bool is_timeout(const Error &e) { return e.kind == ErrorKind::Timeout; }

        inline bool is_cancelled(const Error &e) { return e.kind == ErrorKind::Cancelled; }

        inline bool is_connection_error(const Error &e) { return e.kind == ErrorKind::Connection; }

        // ========================================================================
        // Rendering
        // ========================================================================

        inline dp::String connection_diagnostic(const dp::String &host, const dp::String &cause) {
            return dp::String("failed to connect to TrueNAS at \"") + host + "\": " + cause +
                   "\n\n"
                   "Please verify:\n"
                   "  1. The host is reachable (try: curl -k https://" +
                   host + "/api/current)\n" +
                   "  2. TrueNAS Scale 25.04+ is running and the API is enabled\n"
                   "  3. Your client configuration is correct\n"
                   "\n"
                   "Example configuration:\n"
                   "\n"
                   "  TRUENAS_HOST=\"192.168.1.100\"        # TrueNAS IP or hostname\n"
                   "  TRUENAS_API_KEY=\"1-xxxx...\"         # API key from TrueNAS UI\n"
                   "  TRUENAS_VERIFY_SSL=\"false\"          # Set true if using valid SSL cert\n";
        }

        inline dp::String Error::to_string() const {
            if (kind == ErrorKind::Connection) {
                return connection_diagnostic(host, message);
            }
            if (code != 0) {
                dp::String text = dp::String("API error ") + number_to_string(code) + ": " + message;
                if (!details.empty()) {
                    text = text + " (" + details + ")";
                }
                return text;
            }
            return message;
        }

    } // namespace remote

    using Error = remote::Error;
    using ErrorKind = remote::ErrorKind;
    template <typename T> using Res = remote::Res<T>;

    using remote::is_auth_error;
    using remote::is_cancelled;
    using remote::is_connection_error;
    using remote::is_not_found;
    using remote::is_timeout;
    using remote::is_validation_error;

} // namespace trueform
