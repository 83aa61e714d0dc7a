#include <doctest/doctest.h>
#include <trueform/config.hpp>

#include <cstdlib>
#include <string>

namespace {
    void clear_env() {
        unsetenv(trueform::config::ENV_HOST);
        unsetenv(trueform::config::ENV_API_KEY);
        unsetenv(trueform::config::ENV_VERIFY_SSL);
        unsetenv(trueform::config::ENV_TIMEOUT_MS);
    }
} // namespace

TEST_CASE("ClientConfig defaults") {
    trueform::ClientConfig cfg;
    CHECK(cfg.host.empty());
    CHECK(cfg.api_key.empty());
    CHECK(cfg.verify_ssl == true);
    CHECK(cfg.use_tls == true);
    CHECK(cfg.timeout_ms == 10000);
    CHECK(cfg.job_poll_interval_ms == 2000);
}

TEST_CASE("config::from_env") {
    clear_env();

    SUBCASE("Nothing set keeps defaults") {
        auto cfg = trueform::config::from_env();
        CHECK(cfg.host.empty());
        CHECK(cfg.verify_ssl == true);
        CHECK(cfg.timeout_ms == trueform::DEFAULT_TIMEOUT_MS);
    }

    SUBCASE("All variables") {
        setenv("TRUENAS_HOST", "192.168.1.100", 1);
        setenv("TRUENAS_API_KEY", "1-abcdef", 1);
        setenv("TRUENAS_VERIFY_SSL", "false", 1);
        setenv("TRUENAS_TIMEOUT_MS", "30000", 1);

        auto cfg = trueform::config::from_env();
        CHECK(std::string(cfg.host.c_str()) == "192.168.1.100");
        CHECK(std::string(cfg.api_key.c_str()) == "1-abcdef");
        CHECK(cfg.verify_ssl == false);
        CHECK(cfg.timeout_ms == 30000);
    }

    SUBCASE("Invalid values fall back") {
        setenv("TRUENAS_VERIFY_SSL", "maybe", 1);
        setenv("TRUENAS_TIMEOUT_MS", "ten", 1);

        auto cfg = trueform::config::from_env();
        CHECK(cfg.verify_ssl == true);
        CHECK(cfg.timeout_ms == trueform::DEFAULT_TIMEOUT_MS);
    }

    clear_env();
}

TEST_CASE("config::validate") {
    trueform::ClientConfig cfg;
    CHECK(trueform::config::validate(cfg).is_err());

    cfg.host = "nas.local";
    auto missing_key = trueform::config::validate(cfg);
    REQUIRE(missing_key.is_err());
    CHECK(std::string(missing_key.error().message.c_str()).find("TRUENAS_API_KEY") != std::string::npos);

    cfg.api_key = "1-abcdef";
    CHECK(trueform::config::validate(cfg).is_ok());

    cfg.job_poll_interval_ms = 0;
    CHECK(trueform::config::validate(cfg).is_err());
}
