#pragma once

#include <trueform/common.hpp>

#include <cstdlib>
#include <string>

namespace trueform {

    constexpr dp::u32 DEFAULT_TIMEOUT_MS = 10000;
    constexpr dp::u32 DEFAULT_JOB_POLL_INTERVAL_MS = 2000;

    /// Connection settings for one client
    struct ClientConfig {
        dp::String host;    // "nas.local" or "10.0.0.5:8443"
        dp::String api_key; // secret, never logged
        bool verify_ssl = true;
        bool use_tls = true; // false selects ws:// (local test servers)
        dp::u32 timeout_ms = DEFAULT_TIMEOUT_MS;
        dp::u32 job_poll_interval_ms = DEFAULT_JOB_POLL_INTERVAL_MS;
    };

    namespace config {

        constexpr const char *ENV_HOST = "TRUENAS_HOST";
        constexpr const char *ENV_API_KEY = "TRUENAS_API_KEY";
        constexpr const char *ENV_VERIFY_SSL = "TRUENAS_VERIFY_SSL";
        constexpr const char *ENV_TIMEOUT_MS = "TRUENAS_TIMEOUT_MS";

        inline bool parse_bool(const char *text, bool fallback) {
            if (text == nullptr || *text == '\0') {
                return fallback;
            }
            std::string value(text);
            if (value == "false" || value == "0" || value == "no" || value == "FALSE" || value == "False") {
                return false;
            }
            if (value == "true" || value == "1" || value == "yes" || value == "TRUE" || value == "True") {
                return true;
            }
            echo::warn("ignoring unrecognised boolean value '", text, "'");
            return fallback;
        }

        /// Defaults overlaid with TRUENAS_* environment variables
        inline ClientConfig from_env() {
            ClientConfig cfg;

            if (const char *host = std::getenv(ENV_HOST)) {
                cfg.host = dp::String(host);
            }
            if (const char *key = std::getenv(ENV_API_KEY)) {
                cfg.api_key = dp::String(key);
            }
            cfg.verify_ssl = parse_bool(std::getenv(ENV_VERIFY_SSL), cfg.verify_ssl);

            if (const char *timeout = std::getenv(ENV_TIMEOUT_MS)) {
                char *end = nullptr;
                unsigned long value = std::strtoul(timeout, &end, 10);
                if (end != nullptr && *end == '\0' && value > 0 && value <= 0xFFFFFFFFul) {
                    cfg.timeout_ms = static_cast<dp::u32>(value);
                } else {
                    echo::warn("ignoring invalid ", ENV_TIMEOUT_MS, " value '", timeout, "'");
                }
            }

            echo::debug("config from environment: host=", cfg.host.c_str(), " verify_ssl=", cfg.verify_ssl,
                        " timeout_ms=", cfg.timeout_ms);
            return cfg;
        }

        inline dp::Res<void> validate(const ClientConfig &cfg) {
            if (cfg.host.empty()) {
                return dp::result::err(dp::Error::invalid_argument("missing TrueNAS host: set host or TRUENAS_HOST"));
            }
            if (cfg.api_key.empty()) {
                return dp::result::err(
                    dp::Error::invalid_argument("missing TrueNAS API key: set api_key or TRUENAS_API_KEY"));
            }
            if (cfg.job_poll_interval_ms == 0) {
                return dp::result::err(dp::Error::invalid_argument("job poll interval must be positive"));
            }
            return dp::result::ok();
        }

    } // namespace config

} // namespace trueform
