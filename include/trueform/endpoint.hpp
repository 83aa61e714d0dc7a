#pragma once

#include <trueform/common.hpp>

#include <cstdlib>

namespace trueform {

    // Path of the versioned JSON-RPC WebSocket API
    constexpr const char *API_PATH = "/api/current";

    constexpr dp::u16 DEFAULT_WSS_PORT = 443;
    constexpr dp::u16 DEFAULT_WS_PORT = 80;

    // WebSocket endpoint - host, port, request path and scheme
    struct WsEndpoint {
        dp::String host; // IP address or hostname, without brackets
        dp::u16 port;
        dp::String path;
        bool secure; // wss:// when true, ws:// otherwise

        inline bool is_default_port() const {
            return (secure && port == DEFAULT_WSS_PORT) || (!secure && port == DEFAULT_WS_PORT);
        }

        // Value for the HTTP Host header: host, plus :port when not the scheme default
        inline dp::String authority() const {
            dp::String name = host;
            if (std::string(host.c_str()).find(':') != std::string::npos) {
                name = dp::String("[") + host + "]";
            }
            if (is_default_port()) {
                return name;
            }
            return name + ":" + dp::String(std::to_string(port).c_str());
        }

        inline dp::String to_string() const {
            return dp::String(secure ? "wss://" : "ws://") + authority() + path;
        }
    };

    // Parse "host", "host:port" or "[v6addr]:port" into an endpoint
    inline dp::Res<WsEndpoint> parse_endpoint(const dp::String &address, bool secure, const char *path = API_PATH) {
        std::string text(address.c_str());
        if (text.empty()) {
            return dp::result::err(dp::Error::invalid_argument("empty host"));
        }

        std::string host = text;
        std::string port_text;

        if (text[0] == '[') {
            auto close = text.find(']');
            if (close == std::string::npos) {
                return dp::result::err(dp::Error::invalid_argument("unterminated IPv6 literal"));
            }
            host = text.substr(1, close - 1);
            if (close + 1 < text.size()) {
                if (text[close + 1] != ':') {
                    return dp::result::err(dp::Error::invalid_argument("unexpected text after IPv6 literal"));
                }
                port_text = text.substr(close + 2);
            }
        } else {
            auto colon = text.find(':');
            // More than one colon without brackets is a bare IPv6 address
            if (colon != std::string::npos && text.find(':', colon + 1) == std::string::npos) {
                host = text.substr(0, colon);
                port_text = text.substr(colon + 1);
            }
        }

        if (host.empty()) {
            return dp::result::err(dp::Error::invalid_argument("empty host"));
        }

        dp::u16 port = secure ? DEFAULT_WSS_PORT : DEFAULT_WS_PORT;
        if (!port_text.empty()) {
            char *end = nullptr;
            unsigned long value = std::strtoul(port_text.c_str(), &end, 10);
            if (end == nullptr || *end != '\0' || value == 0 || value > 65535) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + port_text.c_str()));
            }
            port = static_cast<dp::u16>(value);
        }

        return dp::result::ok(WsEndpoint{dp::String(host.c_str()), port, dp::String(path), secure});
    }

} // namespace trueform
