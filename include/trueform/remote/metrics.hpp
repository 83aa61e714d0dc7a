#pragma once

#include <atomic>
#include <chrono>
#include <climits>
#include <cstdint>
#include <datapod/datapod.hpp>

namespace trueform {
    namespace remote {

        /// Counters for outgoing calls of one client
        struct CallMetrics {
            // Call counts
            std::atomic<dp::u64> total_calls{0};
            std::atomic<dp::u64> successful_calls{0};
            std::atomic<dp::u64> failed_calls{0};
            std::atomic<dp::u64> timeout_calls{0};
            std::atomic<dp::u64> cancelled_calls{0};

            // In-flight tracking
            std::atomic<dp::u64> in_flight_calls{0};
            std::atomic<dp::u64> peak_in_flight_calls{0};

            // Latency of successful calls (microseconds)
            std::atomic<dp::u64> total_latency_us{0};
            std::atomic<dp::u64> min_latency_us{UINT64_MAX};
            std::atomic<dp::u64> max_latency_us{0};

            // Frame sizes (bytes)
            std::atomic<dp::u64> total_request_bytes{0};

            // Session tracking
            std::atomic<dp::u64> connects{0};
            std::atomic<dp::u64> disconnects{0};

            inline void reset() {
                total_calls = 0;
                successful_calls = 0;
                failed_calls = 0;
                timeout_calls = 0;
                cancelled_calls = 0;
                in_flight_calls = 0;
                peak_in_flight_calls = 0;
                total_latency_us = 0;
                min_latency_us = UINT64_MAX;
                max_latency_us = 0;
                total_request_bytes = 0;
                connects = 0;
                disconnects = 0;
            }

            inline dp::u64 avg_latency_us() const {
                dp::u64 successful = successful_calls.load();
                if (successful == 0)
                    return 0;
                return total_latency_us.load() / successful;
            }

            inline double success_rate() const {
                dp::u64 total = total_calls.load();
                if (total == 0)
                    return 0.0;
                return static_cast<double>(successful_calls.load()) / static_cast<double>(total);
            }

            inline double timeout_rate() const {
                dp::u64 total = total_calls.load();
                if (total == 0)
                    return 0.0;
                return static_cast<double>(timeout_calls.load()) / static_cast<double>(total);
            }
        };

        /// RAII helper for tracking one call
        /// A call that leaves scope without an outcome counts as failed
        class CallTracker {
          private:
            CallMetrics &metrics_;
            std::chrono::steady_clock::time_point start_time_;
            bool completed_;

          public:
            explicit CallTracker(CallMetrics &metrics, dp::usize request_size = 0)
                : metrics_(metrics), start_time_(std::chrono::steady_clock::now()), completed_(false) {
                metrics_.total_calls.fetch_add(1);
                metrics_.total_request_bytes.fetch_add(request_size);

                dp::u64 in_flight = metrics_.in_flight_calls.fetch_add(1) + 1;
                dp::u64 peak = metrics_.peak_in_flight_calls.load();
                while (in_flight > peak && !metrics_.peak_in_flight_calls.compare_exchange_weak(peak, in_flight)) {
                    // Retry if another thread updated peak
                }
            }

            ~CallTracker() {
                if (!completed_) {
                    metrics_.failed_calls.fetch_add(1);
                }
                metrics_.in_flight_calls.fetch_sub(1);
            }

            CallTracker(const CallTracker &) = delete;
            CallTracker &operator=(const CallTracker &) = delete;

            inline void request_size(dp::usize bytes) { metrics_.total_request_bytes.fetch_add(bytes); }

            inline void success() {
                if (completed_)
                    return;

                auto end_time = std::chrono::steady_clock::now();
                dp::u64 latency_us = static_cast<dp::u64>(
                    std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_).count());

                metrics_.successful_calls.fetch_add(1);
                metrics_.total_latency_us.fetch_add(latency_us);

                dp::u64 min = metrics_.min_latency_us.load();
                while (latency_us < min && !metrics_.min_latency_us.compare_exchange_weak(min, latency_us)) {
                    // Retry if another thread updated min
                }

                dp::u64 max = metrics_.max_latency_us.load();
                while (latency_us > max && !metrics_.max_latency_us.compare_exchange_weak(max, latency_us)) {
                    // Retry if another thread updated max
                }

                completed_ = true;
            }

            inline void failure() {
                if (completed_)
                    return;

                metrics_.failed_calls.fetch_add(1);
                completed_ = true;
            }

            inline void timeout() {
                if (completed_)
                    return;

                metrics_.timeout_calls.fetch_add(1);
                metrics_.failed_calls.fetch_add(1);
                completed_ = true;
            }

            inline void cancelled() {
                if (completed_)
                    return;

                metrics_.cancelled_calls.fetch_add(1);
                metrics_.failed_calls.fetch_add(1);
                completed_ = true;
            }
        };

    } // namespace remote

    using CallMetrics = remote::CallMetrics;
    using CallTracker = remote::CallTracker;

} // namespace trueform
