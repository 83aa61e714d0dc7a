#pragma once

#include <trueform/config.hpp>
#include <trueform/context.hpp>
#include <trueform/query.hpp>
#include <trueform/remote/error.hpp>
#include <trueform/remote/metrics.hpp>
#include <trueform/remote/protocol.hpp>
#include <trueform/remote/router.hpp>
#include <trueform/stream/websocket.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace trueform {

    enum class ConnectionState : dp::u8 {
        Disconnected = 0,
        Connecting = 1,
        Connected = 2,
    };

    inline const char *state_name(ConnectionState state) {
        switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        default:
            return "unknown";
        }
    }

    /// Creates the stream for a new session
    using StreamFactory = std::function<std::unique_ptr<Stream>(const ClientConfig &)>;

    inline StreamFactory default_stream_factory() {
        return [](const ClientConfig &cfg) { return make_websocket_stream(cfg.use_tls, cfg.verify_ssl); };
    }

    /// Decode a JSON value into T, mapping conversion failures to protocol errors
    template <typename T> inline Res<T> decode_result(const Json &value) {
        try {
            return dp::result::ok(value.get<T>());
        } catch (const Json::exception &e) {
            return dp::result::err(Error::protocol(dp::String("failed to decode result: ") + e.what()));
        }
    }

    /// Authenticated JSON-RPC client for one TrueNAS host.
    ///
    /// One client is shared by many threads. Each call blocks the calling thread
    /// until its own response arrives; a single receiver thread per session reads
    /// frames and hands each response to the call with the matching id, so
    /// responses may arrive in any order.
    ///
    /// The first call (or an explicit connect()) dials the host, upgrades to
    /// WebSocket and logs in with the API key. After the session drops, the next
    /// call reconnects. There is no background reconnect and no retry.
    class Client {
      private:
        ClientConfig config_;
        StreamFactory factory_;

        // Session: stream, state and frame writes
        std::unique_ptr<Stream> stream_;
        ConnectionState state_;
        mutable std::mutex conn_mutex_;

        // One connect/close sequence at a time; callers queue here while a
        // session is being established and authenticated
        std::mutex lifecycle_mutex_;

        CallRouter router_;
        std::atomic<dp::i64> next_request_id_;

        std::thread receiver_thread_;
        std::atomic<bool> running_;
        CallMetrics metrics_;

        // ====================================================================
        // Session management
        // ====================================================================

        /// Receiver thread function - reads frames and routes responses
        void receiver_loop(Stream *stream) {
            echo::debug("receiver thread started");

            while (true) {
                auto recv_res = stream->recv();
                if (recv_res.is_err()) {
                    // Idle read deadline: refresh and keep reading unless shutting down
                    if (recv_res.error().code == dp::Error::TIMEOUT) {
                        if (!running_) {
                            break;
                        }
                        echo::trace("read deadline passed, session idle");
                        continue;
                    }
                    if (running_) {
                        echo::warn("session ended: ", recv_res.error().message.c_str());
                        mark_disconnected();
                        router_.fail_all(Error::transport(dp::String("connection lost: ") +
                                                          recv_res.error().message));
                    }
                    break;
                }

                auto decode_res = remote::decode_response(recv_res.value());
                if (decode_res.is_err()) {
                    echo::warn("skipping invalid frame: ", decode_res.error().message.c_str());
                    continue;
                }

                router_.deliver(std::move(decode_res.value()));
            }

            echo::debug("receiver thread stopped");
        }

        void mark_disconnected() {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (state_ != ConnectionState::Disconnected) {
                state_ = ConnectionState::Disconnected;
                metrics_.disconnects.fetch_add(1);
                echo::info("disconnected from ", config_.host.c_str());
            }
        }

        void set_state(ConnectionState state) {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            state_ = state;
        }

        /// Stop the receiver and drop the stream. Caller holds lifecycle_mutex_.
        void teardown(const Error &reason) {
            running_ = false;
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                if (state_ != ConnectionState::Disconnected) {
                    state_ = ConnectionState::Disconnected;
                    metrics_.disconnects.fetch_add(1);
                }
                if (stream_) {
                    // Wakes the receiver out of recv()
                    stream_->close();
                }
            }

            if (receiver_thread_.joinable()) {
                receiver_thread_.join();
            }

            router_.fail_all(reason);

            std::lock_guard<std::mutex> lock(conn_mutex_);
            stream_.reset();
        }

        /// Dial and upgrade, then start the receiver. Caller holds lifecycle_mutex_.
        Res<void> open_session() {
            // A previous session may have dropped on its own; reap it first
            teardown(Error::transport("connection reset"));

            auto endpoint_res = parse_endpoint(config_.host, config_.use_tls);
            if (endpoint_res.is_err()) {
                return dp::result::err(Error::connection(config_.host, endpoint_res.error().message));
            }
            const WsEndpoint &endpoint = endpoint_res.value();

            set_state(ConnectionState::Connecting);
            echo::debug("dialing ", endpoint.to_string().c_str());

            std::unique_ptr<Stream> stream = factory_(config_);
            if (!stream) {
                set_state(ConnectionState::Disconnected);
                return dp::result::err(Error::connection(config_.host, "no transport available"));
            }

            auto connect_res = stream->connect(endpoint, config_.timeout_ms);
            if (connect_res.is_err()) {
                set_state(ConnectionState::Disconnected);
                echo::error("failed to connect to ", endpoint.to_string().c_str(), ": ",
                            connect_res.error().message.c_str());
                return dp::result::err(Error::connection(config_.host, connect_res.error().message));
            }

            // Initial read deadline; the receiver refreshes it on every idle timeout
            auto timeout_res = stream->set_recv_timeout(config_.timeout_ms);
            if (timeout_res.is_err()) {
                echo::warn("failed to set read deadline: ", timeout_res.error().message.c_str());
            }

            Stream *raw = stream.get();
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                stream_ = std::move(stream);
            }
            running_ = true;
            receiver_thread_ = std::thread(&Client::receiver_loop, this, raw);
            return dp::result::ok();
        }

        Res<void> authenticate(const Context &ctx) {
            auto res = invoke(ctx, "auth.login_with_api_key", Json::array({std::string(config_.api_key.c_str())}),
                              true);
            if (res.is_err()) {
                return dp::result::err(res.error().with_context("authentication failed"));
            }
            const Json &ok = res.value();
            if (!ok.is_boolean() || !ok.get<bool>()) {
                return dp::result::err(Error::auth("authentication failed: invalid API key"));
            }
            return dp::result::ok();
        }

        /// Serialized frame write. Only the login may go out before the session is Connected.
        Res<void> write_frame(const Message &frame, bool login) {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            bool writable = state_ == ConnectionState::Connected || (login && state_ == ConnectionState::Connecting);
            if (!stream_ || !writable) {
                return dp::result::err(Error::transport("not connected"));
            }

            auto send_res = stream_->send(frame);
            if (send_res.is_err()) {
                state_ = ConnectionState::Disconnected;
                metrics_.disconnects.fetch_add(1);
                echo::error("failed to send request: ", send_res.error().message.c_str());
                return dp::result::err(
                    Error::transport(dp::String("failed to send request: ") + send_res.error().message));
            }
            return dp::result::ok();
        }

        /// One round trip on the current session, without connecting first
        Res<Json> invoke(const Context &ctx, const std::string &method, const Json &params, bool login = false) {
            if (ctx.is_cancelled()) {
                return dp::result::err(Error::cancelled());
            }

            CallTracker tracker(metrics_);

            dp::i64 request_id = next_request_id_.fetch_add(1) + 1;
            auto pending = router_.add(request_id);
            ScopeExit unregister([this, request_id] { router_.remove(request_id); });

            dp::u64 token = ctx.on_cancel([pending] { pending->cancel(); });
            ScopeExit unsubscribe([&ctx, token] { ctx.remove_listener(token); });

            Message frame = remote::encode_request(remote::make_request(request_id, method, params));
            tracker.request_size(frame.size());
            echo::trace("call id=", request_id, " method=", method.c_str(), " bytes=", frame.size());

            auto write_res = write_frame(frame, login);
            if (write_res.is_err()) {
                tracker.failure();
                return dp::result::err(write_res.error());
            }

            Res<remote::WireResponse> outcome = dp::result::err(Error::timeout("call timed out"));
            if (!pending->wait_for(std::chrono::milliseconds(config_.timeout_ms), outcome)) {
                tracker.timeout();
                echo::warn("call id=", request_id, " method=", method.c_str(), " timed out after ",
                           config_.timeout_ms, "ms");
                return dp::result::err(Error::timeout(dp::String("request timeout after ") +
                                                      number_to_string(config_.timeout_ms) + "ms"));
            }

            if (outcome.is_err()) {
                if (is_cancelled(outcome.error())) {
                    tracker.cancelled();
                    echo::debug("call id=", request_id, " cancelled");
                } else {
                    tracker.failure();
                }
                return dp::result::err(outcome.error());
            }

            const remote::WireResponse &response = outcome.value();
            if (response.error) {
                tracker.failure();
                Error err = remote::classify(*response.error);
                echo::debug("call id=", request_id, " failed: ", err.to_string().c_str());
                return dp::result::err(err);
            }

            tracker.success();
            return dp::result::ok(response.result);
        }

      public:
        explicit Client(ClientConfig config, StreamFactory factory = default_stream_factory())
            : config_(std::move(config)), factory_(std::move(factory)), state_(ConnectionState::Disconnected),
              next_request_id_(0), running_(false) {
            if (config_.timeout_ms == 0) {
                config_.timeout_ms = DEFAULT_TIMEOUT_MS;
            }
            if (config_.job_poll_interval_ms == 0) {
                config_.job_poll_interval_ms = DEFAULT_JOB_POLL_INTERVAL_MS;
            }
            echo::trace("Client constructed for ", config_.host.c_str(), " timeout_ms=", config_.timeout_ms);
        }

        ~Client() { close(); }

        Client(const Client &) = delete;
        Client &operator=(const Client &) = delete;

        // ====================================================================
        // Connection lifecycle
        // ====================================================================

        /// Dial, upgrade and authenticate. No effect when already connected.
        Res<void> connect(const Context &ctx) {
            if (is_connected()) {
                return dp::result::ok();
            }

            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
            // Another caller may have finished connecting while we waited
            if (is_connected()) {
                return dp::result::ok();
            }
            if (ctx.is_cancelled()) {
                return dp::result::err(Error::cancelled());
            }

            auto open_res = open_session();
            if (open_res.is_err()) {
                return open_res;
            }

            auto auth_res = authenticate(ctx);
            if (auth_res.is_err()) {
                echo::error(auth_res.error().message.c_str());
                teardown(Error::transport("authentication failed"));
                return auth_res;
            }

            set_state(ConnectionState::Connected);
            metrics_.connects.fetch_add(1);
            echo::info("connected to ", config_.host.c_str());
            return dp::result::ok();
        }

        Res<void> ensure_connected(const Context &ctx) { return connect(ctx); }

        /// Tear down the session. Safe to call repeatedly.
        void close() {
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
            bool had_session = false;
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                had_session = stream_ != nullptr;
            }
            teardown(Error::transport("client closed"));
            if (had_session) {
                echo::info("closed connection to ", config_.host.c_str());
            }
        }

        bool is_connected() const {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            return state_ == ConnectionState::Connected;
        }

        ConnectionState state() const {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            return state_;
        }

        const ClientConfig &config() const { return config_; }

        const CallMetrics &metrics() const { return metrics_; }

        void reset_metrics() { metrics_.reset(); }

        dp::usize pending_calls() const { return router_.pending_count(); }

        // ====================================================================
        // Calls
        // ====================================================================

        /// Call a method and return its raw result (null when the server sent none)
        Res<Json> call(const Context &ctx, const std::string &method, const Json &params = Json()) {
            auto connect_res = ensure_connected(ctx);
            if (connect_res.is_err()) {
                return dp::result::err(connect_res.error());
            }
            return invoke(ctx, method, params);
        }

        template <typename T> Res<T> call(const Context &ctx, const std::string &method, const Json &params = Json()) {
            auto res = call(ctx, method, params);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return decode_result<T>(res.value());
        }

        /// "<kind>.query" with optional filters and options
        Res<Json> query(const Context &ctx, const std::string &kind, const QueryParams *params = nullptr) {
            Json args = params ? params->to_params() : Json::array();
            return call(ctx, kind + ".query", args);
        }

        template <typename T>
        Res<T> query(const Context &ctx, const std::string &kind, const QueryParams *params = nullptr) {
            auto res = query(ctx, kind, params);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return decode_result<T>(res.value());
        }

        Res<Json> get_instance(const Context &ctx, const std::string &kind, const Json &id) {
            return call(ctx, kind + ".get_instance", Json::array({id}));
        }

        template <typename T> Res<T> get_instance(const Context &ctx, const std::string &kind, const Json &id) {
            auto res = get_instance(ctx, kind, id);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return decode_result<T>(res.value());
        }

        Res<Json> create(const Context &ctx, const std::string &kind, const Json &data) {
            return call(ctx, kind + ".create", Json::array({data}));
        }

        template <typename T> Res<T> create(const Context &ctx, const std::string &kind, const Json &data) {
            auto res = create(ctx, kind, data);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return decode_result<T>(res.value());
        }

        Res<Json> update(const Context &ctx, const std::string &kind, const Json &id, const Json &data) {
            return call(ctx, kind + ".update", Json::array({id, data}));
        }

        template <typename T>
        Res<T> update(const Context &ctx, const std::string &kind, const Json &id, const Json &data) {
            auto res = update(ctx, kind, id, data);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return decode_result<T>(res.value());
        }

        /// "<kind>.delete" - the result payload is discarded
        Res<void> remove(const Context &ctx, const std::string &kind, const Json &id) {
            auto res = call(ctx, kind + ".delete", Json::array({id}));
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return dp::result::ok();
        }

        Res<void> remove_with_options(const Context &ctx, const std::string &kind, const Json &id,
                                      const Json &options) {
            auto res = call(ctx, kind + ".delete", Json::array({id, options}));
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return dp::result::ok();
        }

        // ====================================================================
        // Jobs
        // ====================================================================

        /// Poll core.get_jobs until the job finishes or timeout_ms passes.
        /// Returns the job's result object, or the whole job record when the
        /// result is not an object.
        Res<Json> wait_for_job(const Context &ctx, dp::i64 job_id, dp::u32 timeout_ms) {
            Deadline deadline = deadline_after(timeout_ms);
            dp::String id_text = number_to_string(job_id);
            echo::debug("waiting for job ", job_id, " (timeout ", timeout_ms, "ms)");

            while (true) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }

                Json filter = Json::array({Json::array({"id", "=", job_id})});
                auto res = call(ctx, "core.get_jobs", Json::array({filter}));
                if (res.is_err()) {
                    return dp::result::err(res.error().with_context("failed to query job status"));
                }

                const Json &jobs = res.value();
                if (!jobs.is_array()) {
                    return dp::result::err(Error::protocol("failed to query job status: job list is not an array"));
                }
                if (jobs.empty()) {
                    return dp::result::err(Error::job(dp::String("job ") + id_text + " not found"));
                }

                const Json &job = jobs[0];
                std::string job_state;
                if (job.is_object()) {
                    auto state = job.find("state");
                    if (state != job.end() && state->is_string()) {
                        job_state = state->get<std::string>();
                    }
                }
                echo::trace("job ", job_id, " state=", job_state.c_str());

                if (job_state == "SUCCESS") {
                    auto result = job.find("result");
                    if (result != job.end() && result->is_object()) {
                        return dp::result::ok(*result);
                    }
                    return dp::result::ok(job);
                }
                if (job_state == "FAILED") {
                    std::string reason = "job failed";
                    auto error = job.find("error");
                    if (error != job.end() && error->is_string() && !error->get<std::string>().empty()) {
                        reason = error->get<std::string>();
                    }
                    echo::warn("job ", job_id, " failed: ", reason.c_str());
                    return dp::result::err(Error::job(dp::String("job ") + id_text + " failed: " + reason.c_str()));
                }
                if (job_state == "ABORTED") {
                    return dp::result::err(Error::job(dp::String("job ") + id_text + " was aborted"));
                }

                // Still running: wait one interval, or less when the deadline is closer
                auto left = std::chrono::milliseconds(remaining_ms(deadline));
                auto interval = std::chrono::milliseconds(config_.job_poll_interval_ms);
                if (left.count() == 0) {
                    break;
                }
                if (!ctx.sleep_for(left < interval ? left : interval)) {
                    return dp::result::err(Error::cancelled());
                }
            }

            echo::warn("timeout waiting for job ", job_id);
            return dp::result::err(Error::timeout(dp::String("timeout waiting for job ") + id_text + " to complete"));
        }

        /// "<kind>.create" for methods that answer with a job id, then wait for the job
        Res<Json> create_with_job(const Context &ctx, const std::string &kind, const Json &data, dp::u32 timeout_ms) {
            auto res = create(ctx, kind, data);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            const Json &job_id = res.value();
            bool valid_id = job_id.is_number_integer() &&
                            (!job_id.is_number_unsigned() ||
                             job_id.get<dp::u64>() <= static_cast<dp::u64>(std::numeric_limits<dp::i64>::max()));
            if (!valid_id) {
                return dp::result::err(Error::protocol(dp::String("expected job id from ") + kind.c_str() +
                                                       ".create, got " + job_id.dump().c_str()));
            }
            return wait_for_job(ctx, job_id.get<dp::i64>(), timeout_ms);
        }
    };

} // namespace trueform
