#include <atomic>
#include <chrono>
#include <doctest/doctest.h>
#include <string>
#include <thread>
#include <vector>

#include "support/scripted_server.hpp"

using trueform::Json;
using trueform_test::ScriptedServer;
using trueform_test::WireRequest;
namespace rpc = trueform::remote;

namespace {
    std::string str(const dp::String &s) { return std::string(s.c_str()); }

    // Echo the first positional param back as the result
    void echo_handler(const WireRequest &request, ScriptedServer &server) {
        Json result = request.params.is_array() && !request.params.empty() ? request.params[0] : Json();
        server.reply(rpc::make_result(request.id, result));
    }

    template <typename Pred> bool wait_until(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(2)) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return pred();
    }
} // namespace

TEST_CASE("Connect and authenticate") {
    SUBCASE("Repeated connect authenticates once") {
        ScriptedServer server;
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        CHECK(client.state() == trueform::ConnectionState::Disconnected);
        REQUIRE(client.connect(ctx).is_ok());
        REQUIRE(client.connect(ctx).is_ok());
        REQUIRE(client.connect(ctx).is_ok());

        CHECK(client.is_connected());
        CHECK(server.connects() == 1);
        CHECK(server.auth_calls() == 1);

        auto logins = server.requests_for("auth.login_with_api_key");
        REQUIRE(logins.size() == 1);
        CHECK(logins[0].params == Json::array({"1-testkey"}));
        CHECK(logins[0].id == 1);
    }

    SUBCASE("Concurrent connects share one session") {
        ScriptedServer server;
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; i++) {
            threads.emplace_back([&] {
                if (client.connect(ctx).is_ok()) {
                    ok++;
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        CHECK(ok == 8);
        CHECK(server.connects() == 1);
        CHECK(server.auth_calls() == 1);
    }

    SUBCASE("First call connects lazily") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "system.echo", Json::array({"hello"}));
        REQUIRE(res.is_ok());
        CHECK(res.value() == "hello");
        CHECK(server.auth_calls() == 1);

        // Authentication precedes the first call on the wire
        auto requests = server.requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].method == "auth.login_with_api_key");
        CHECK(requests[1].method == "system.echo");
    }

    SUBCASE("False login result is rejected") {
        ScriptedServer server;
        server.set_auth_result(false);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.connect(ctx);
        REQUIRE(res.is_err());
        CHECK(trueform::is_auth_error(res.error()));
        CHECK(str(res.error().message) == "authentication failed: invalid API key");
        CHECK_FALSE(client.is_connected());

        // Fixing the key lets the next attempt through on a fresh session
        server.set_auth_result(true);
        REQUIRE(client.connect(ctx).is_ok());
        CHECK(server.connects() == 2);
    }

    SUBCASE("Login error keeps its classification") {
        ScriptedServer server;
        server.set_auth_error(true);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "pool.query", Json::array());
        REQUIRE(res.is_err());
        CHECK(trueform::is_auth_error(res.error()));
        CHECK(str(res.error().message).find("authentication failed: ") == 0);
        CHECK(server.requests_for("pool.query").empty());
    }

    SUBCASE("Unreachable host produces the connection diagnostic") {
        ScriptedServer server;
        server.refuse_connections(true);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "pool.query", Json::array());
        REQUIRE(res.is_err());
        CHECK(trueform::is_connection_error(res.error()));
        CHECK(str(res.error().host) == "nas.test");

        std::string text = str(res.error().to_string());
        CHECK(text.find("failed to connect to TrueNAS at \"nas.test\"") == 0);
        CHECK(text.find("Connection refused") != std::string::npos);
        CHECK(text.find("curl -k https://nas.test/api/current") != std::string::npos);
        CHECK(client.state() == trueform::ConnectionState::Disconnected);
    }

    SUBCASE("Cancelled context does not dial") {
        ScriptedServer server;
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;
        ctx.cancel();

        auto res = client.connect(ctx);
        REQUIRE(res.is_err());
        CHECK(trueform::is_cancelled(res.error()));
        CHECK(server.connects() == 0);
    }

    SUBCASE("Close is idempotent and the next call reconnects") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        client.close();
        REQUIRE(client.connect(ctx).is_ok());
        client.close();
        client.close();
        CHECK_FALSE(client.is_connected());

        auto res = client.call(ctx, "system.echo", Json::array({1}));
        REQUIRE(res.is_ok());
        CHECK(server.connects() == 2);
        CHECK(server.auth_calls() == 2);
    }
}

TEST_CASE("Call routing") {
    SUBCASE("Out of order responses reach the right callers") {
        const int callers = 8;
        std::vector<WireRequest> held;
        ScriptedServer server([&held, callers](const WireRequest &request, ScriptedServer &srv) {
            // Hold every call, then answer newest first
            held.push_back(request);
            if (static_cast<int>(held.size()) == callers) {
                for (auto it = held.rbegin(); it != held.rend(); ++it) {
                    srv.reply(rpc::make_result(it->id, it->params[0]));
                }
                held.clear();
            }
        });
        trueform::Client client(trueform_test::test_config(5000), trueform_test::scripted_factory(server));
        trueform::Context ctx;
        REQUIRE(client.connect(ctx).is_ok());

        std::vector<Json> results(callers);
        std::vector<int> ok(callers, 0);
        std::vector<std::thread> threads;
        for (int i = 0; i < callers; i++) {
            threads.emplace_back([&, i] {
                auto res = client.call(ctx, "test.echo", Json::array({i * 10}));
                if (res.is_ok()) {
                    results[i] = res.value();
                    ok[i] = 1;
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        for (int i = 0; i < callers; i++) {
            CHECK(ok[i] == 1);
            CHECK(results[i] == i * 10);
        }
        CHECK(client.pending_calls() == 0);
    }

    SUBCASE("Identifiers increase from one") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        REQUIRE(client.call(ctx, "a.b", Json::array({1})).is_ok());
        REQUIRE(client.call(ctx, "a.b", Json::array({2})).is_ok());

        auto requests = server.requests();
        REQUIRE(requests.size() == 3);
        CHECK(requests[0].id == 1);
        CHECK(requests[1].id == 2);
        CHECK(requests[2].id == 3);
    }

    SUBCASE("Invalid frames are skipped") {
        ScriptedServer server([](const WireRequest &request, ScriptedServer &srv) {
            srv.reply_raw(trueform::to_message("this is not json"));
            srv.reply_raw(trueform::to_message(R"({"jsonrpc":"2.0","result":1})"));
            srv.reply(rpc::make_result(request.id, "done"));
        });
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "x.y");
        REQUIRE(res.is_ok());
        CHECK(res.value() == "done");
        CHECK(client.is_connected());
    }

    SUBCASE("Response for nobody is dropped") {
        ScriptedServer server([](const WireRequest &request, ScriptedServer &srv) {
            srv.reply(rpc::make_result(request.id + 1000, "stray"));
            srv.reply(rpc::make_result(request.id, "mine"));
        });
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "x.y");
        REQUIRE(res.is_ok());
        CHECK(res.value() == "mine");
    }

    SUBCASE("Null result") {
        ScriptedServer server;
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto res = client.call(ctx, "service.restart", Json::array({"nfs"}));
        REQUIRE(res.is_ok());
        CHECK(res.value().is_null());
    }
}

TEST_CASE("Call errors") {
    SUBCASE("Wire errors are classified") {
        ScriptedServer server([](const WireRequest &request, ScriptedServer &srv) {
            if (request.method == "pool.dataset.get_instance") {
                srv.reply(rpc::make_error(request.id, rpc::codes::INVALID_PARAMS, "Invalid params",
                                          "InstanceNotFound: tank/missing"));
            } else {
                srv.reply(rpc::make_error(request.id, rpc::codes::VALIDATION_FAILED, "Validation error",
                                          "sharing.nfs.create.path: not a directory"));
            }
        });
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto missing = client.get_instance(ctx, "pool.dataset", "tank/missing");
        REQUIRE(missing.is_err());
        CHECK(trueform::is_not_found(missing.error()));

        auto invalid = client.create(ctx, "sharing.nfs", Json{{"path", "/mnt/tank/file"}});
        REQUIRE(invalid.is_err());
        CHECK(trueform::is_validation_error(invalid.error()));
        CHECK(str(invalid.error().to_string()) ==
              "API error 4: Validation error (sharing.nfs.create.path: not a directory)");

        // Errors do not end the session
        CHECK(client.is_connected());
    }

    SUBCASE("Timeout after the configured duration") {
        ScriptedServer server([](const WireRequest &, ScriptedServer &) {});
        trueform::Client client(trueform_test::test_config(200), trueform_test::scripted_factory(server));
        trueform::Context ctx;
        REQUIRE(client.connect(ctx).is_ok());

        auto start = std::chrono::steady_clock::now();
        auto res = client.call(ctx, "test.hang");
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(res.is_err());
        CHECK(trueform::is_timeout(res.error()));
        CHECK(elapsed >= std::chrono::milliseconds(190));
        CHECK(elapsed < std::chrono::seconds(2));
        CHECK(client.pending_calls() == 0);
        CHECK(client.metrics().timeout_calls.load() == 1);
    }

    SUBCASE("Late response after a timeout is dropped") {
        std::atomic<dp::i64> late_id{0};
        ScriptedServer server([&late_id](const WireRequest &request, ScriptedServer &srv) {
            if (request.method == "test.slow") {
                late_id = request.id;
                return;
            }
            srv.reply(rpc::make_result(request.id, "fast"));
        });
        trueform::Client client(trueform_test::test_config(150), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        auto slow = client.call(ctx, "test.slow");
        REQUIRE(slow.is_err());
        CHECK(trueform::is_timeout(slow.error()));

        server.reply(rpc::make_result(late_id.load(), "too late"));

        auto fast = client.call(ctx, "test.fast");
        REQUIRE(fast.is_ok());
        CHECK(fast.value() == "fast");
    }

    SUBCASE("Cancellation returns promptly") {
        ScriptedServer server([](const WireRequest &, ScriptedServer &) {});
        trueform::Client client(trueform_test::test_config(5000), trueform_test::scripted_factory(server));
        trueform::Context connect_ctx;
        REQUIRE(client.connect(connect_ctx).is_ok());

        trueform::Context ctx;
        std::thread canceller([ctx] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            ctx.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        auto res = client.call(ctx, "test.hang");
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE(res.is_err());
        CHECK(trueform::is_cancelled(res.error()));
        CHECK(elapsed < std::chrono::seconds(2));
        CHECK(client.pending_calls() == 0);
        CHECK(ctx.listener_count() == 0);
    }

    SUBCASE("Many cancelled calls leave nothing behind") {
        ScriptedServer server([](const WireRequest &, ScriptedServer &) {});
        trueform::Client client(trueform_test::test_config(5000), trueform_test::scripted_factory(server));
        trueform::Context connect_ctx;
        REQUIRE(client.connect(connect_ctx).is_ok());

        const int calls = 16;
        trueform::Context ctx;
        std::atomic<int> cancelled{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < calls; i++) {
            threads.emplace_back([&] {
                auto res = client.call(ctx, "test.hang");
                if (res.is_err() && trueform::is_cancelled(res.error())) {
                    cancelled++;
                }
            });
        }

        REQUIRE(wait_until([&] { return server.requests_for("test.hang").size() == static_cast<size_t>(calls); }));
        ctx.cancel();
        for (auto &t : threads) {
            t.join();
        }

        CHECK(cancelled == calls);
        CHECK(client.pending_calls() == 0);
        CHECK(ctx.listener_count() == 0);
        CHECK(client.metrics().cancelled_calls.load() == static_cast<dp::u64>(calls));
    }

    SUBCASE("Call with an already cancelled context") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context connect_ctx;
        REQUIRE(client.connect(connect_ctx).is_ok());

        trueform::Context ctx;
        ctx.cancel();
        auto res = client.call(ctx, "system.echo", Json::array({1}));
        REQUIRE(res.is_err());
        CHECK(trueform::is_cancelled(res.error()));
        CHECK(server.requests_for("system.echo").empty());
    }
}

TEST_CASE("Connection loss") {
    SUBCASE("Waiting calls fail when the server closes the session") {
        ScriptedServer server([](const WireRequest &, ScriptedServer &) {});
        trueform::Client client(trueform_test::test_config(5000), trueform_test::scripted_factory(server));
        trueform::Context ctx;
        REQUIRE(client.connect(ctx).is_ok());

        std::thread dropper([&server] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            server.drop_connection();
        });

        auto start = std::chrono::steady_clock::now();
        auto res = client.call(ctx, "test.hang");
        auto elapsed = std::chrono::steady_clock::now() - start;
        dropper.join();

        REQUIRE(res.is_err());
        CHECK(res.error().kind == trueform::ErrorKind::Transport);
        CHECK(elapsed < std::chrono::seconds(2));
        CHECK(wait_until([&] { return !client.is_connected(); }));
        CHECK(client.pending_calls() == 0);
    }

    SUBCASE("Next call reconnects after the server closes the session") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        REQUIRE(client.call(ctx, "system.echo", Json::array({"one"})).is_ok());
        server.drop_connection();
        REQUIRE(wait_until([&] { return client.state() == trueform::ConnectionState::Disconnected; }));

        auto res = client.call(ctx, "system.echo", Json::array({"two"}));
        REQUIRE(res.is_ok());
        CHECK(res.value() == "two");
        CHECK(server.connects() == 2);
        CHECK(server.auth_calls() == 2);
        CHECK(client.metrics().disconnects.load() >= 1);
    }

    SUBCASE("No request goes out while a reconnect is still logging in") {
        ScriptedServer server(echo_handler);
        trueform::Client client(trueform_test::test_config(300), trueform_test::scripted_factory(server));
        trueform::Context ctx;

        REQUIRE(client.call(ctx, "system.echo", Json::array({"one"})).is_ok());
        server.set_auth_silent(true);
        server.drop_connection();
        REQUIRE(wait_until([&] { return client.state() == trueform::ConnectionState::Disconnected; }));

        std::atomic<bool> login_done{false};
        std::thread reconnect([&] {
            auto res = client.connect(ctx);
            CHECK(res.is_err());
            login_done = true;
        });
        REQUIRE(wait_until([&] { return server.auth_calls() == 2; }));
        CHECK(client.state() == trueform::ConnectionState::Connecting);

        std::vector<std::thread> callers;
        for (int i = 0; i < 4; i++) {
            callers.emplace_back([&client, &ctx] { CHECK(client.call(ctx, "system.info").is_err()); });
        }
        for (auto &t : callers) {
            t.join();
        }
        reconnect.join();
        CHECK(login_done);

        // Every request after the first login is a login attempt
        auto sent = server.requests();
        for (size_t i = 2; i < sent.size(); i++) {
            CHECK(sent[i].method == "auth.login_with_api_key");
        }
        CHECK(server.requests_for("system.info").empty());

        server.set_auth_silent(false);
        auto res = client.call(ctx, "system.echo", Json::array({"two"}));
        REQUIRE(res.is_ok());
        CHECK(res.value() == "two");
    }
}

TEST_CASE("High-level call surface") {
    ScriptedServer server([](const WireRequest &request, ScriptedServer &srv) {
        if (request.method == "pool.query") {
            srv.reply(rpc::make_result(request.id, Json::parse(R"([{"id":1,"name":"tank"}])")));
        } else if (request.method == "pool.dataset.get_instance") {
            srv.reply(rpc::make_result(request.id, Json{{"id", request.params[0]}, {"type", "FILESYSTEM"}}));
        } else if (request.method == "pool.dataset.create" || request.method == "pool.dataset.update") {
            srv.reply(rpc::make_result(request.id, Json{{"id", "tank/data"}}));
        } else if (request.method == "pool.dataset.delete") {
            srv.reply(rpc::make_result(request.id, true));
        } else {
            srv.reply(rpc::make_result(request.id, nullptr));
        }
    });
    trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
    trueform::Context ctx;

    SUBCASE("query without params sends an empty list") {
        auto res = client.query(ctx, "pool");
        REQUIRE(res.is_ok());
        CHECK(res.value()[0]["name"] == "tank");

        auto sent = server.requests_for("pool.query");
        REQUIRE(sent.size() == 1);
        CHECK(sent[0].params == Json::array());
    }

    SUBCASE("query with filters and options") {
        trueform::QueryParams params;
        params.filter("name", "=", "tank").limit(1);
        REQUIRE(client.query(ctx, "pool", &params).is_ok());

        auto sent = server.requests_for("pool.query");
        REQUIRE(sent.size() == 1);
        CHECK(sent[0].params == Json::parse(R"([[["name","=","tank"]],{"limit":1}])"));
    }

    SUBCASE("get_instance") {
        auto res = client.get_instance(ctx, "pool.dataset", "tank/data");
        REQUIRE(res.is_ok());
        CHECK(res.value()["id"] == "tank/data");
        CHECK(server.requests_for("pool.dataset.get_instance")[0].params == Json::array({"tank/data"}));
    }

    SUBCASE("create and update") {
        Json data = {{"name", "tank/data"}, {"compression", "LZ4"}};
        REQUIRE(client.create(ctx, "pool.dataset", data).is_ok());
        REQUIRE(client.update(ctx, "pool.dataset", "tank/data", Json{{"compression", "ZSTD"}}).is_ok());

        CHECK(server.requests_for("pool.dataset.create")[0].params == Json::array({data}));
        CHECK(server.requests_for("pool.dataset.update")[0].params ==
              Json::parse(R"(["tank/data",{"compression":"ZSTD"}])"));
    }

    SUBCASE("remove and remove_with_options") {
        REQUIRE(client.remove(ctx, "pool.dataset", "tank/data").is_ok());
        REQUIRE(client.remove_with_options(ctx, "pool.dataset", "tank/data", Json{{"recursive", true}}).is_ok());

        auto sent = server.requests_for("pool.dataset.delete");
        REQUIRE(sent.size() == 2);
        CHECK(sent[0].params == Json::array({"tank/data"}));
        CHECK(sent[1].params == Json::parse(R"(["tank/data",{"recursive":true}])"));
    }

    SUBCASE("Typed results") {
        auto names = client.query<std::vector<Json>>(ctx, "pool");
        REQUIRE(names.is_ok());
        REQUIRE(names.value().size() == 1);
        CHECK(names.value()[0]["id"] == 1);

        auto flag = client.call<bool>(ctx, "pool.dataset.delete", Json::array({"x"}));
        REQUIRE(flag.is_ok());
        CHECK(flag.value() == true);
    }

    SUBCASE("Undecodable typed result is a protocol error") {
        auto res = client.call<std::vector<int>>(ctx, "pool.dataset.delete", Json::array({"x"}));
        REQUIRE(res.is_err());
        CHECK(res.error().kind == trueform::ErrorKind::Protocol);
    }
}

TEST_CASE("Call metrics") {
    ScriptedServer server(echo_handler);
    trueform::Client client(trueform_test::test_config(), trueform_test::scripted_factory(server));
    trueform::Context ctx;

    for (int i = 0; i < 5; i++) {
        REQUIRE(client.call(ctx, "system.echo", Json::array({i})).is_ok());
    }

    const auto &metrics = client.metrics();
    // Authentication counts as a call too
    CHECK(metrics.total_calls.load() == 6);
    CHECK(metrics.successful_calls.load() == 6);
    CHECK(metrics.failed_calls.load() == 0);
    CHECK(metrics.in_flight_calls.load() == 0);
    CHECK(metrics.connects.load() == 1);
    CHECK(metrics.total_request_bytes.load() > 0);
    CHECK(metrics.success_rate() == doctest::Approx(1.0));

    client.reset_metrics();
    CHECK(client.metrics().total_calls.load() == 0);
}
