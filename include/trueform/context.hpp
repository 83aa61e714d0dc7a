#pragma once

#include <trueform/common.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace trueform {

    /// Cancellation signal shared between a caller and the operations it starts.
    ///
    /// Copies refer to the same signal, so a caller can hand a Context to a
    /// blocking call and cancel it from another thread. Cancellation is
    /// one-way and sticky. Listeners registered with on_cancel() run exactly
    /// once, on the thread that cancels, or immediately when the context is
    /// already cancelled at registration time.
    class Context {
      private:
        struct State {
            std::mutex mutex;
            std::condition_variable cv;
            bool cancelled = false;
            dp::u64 next_token = 1;
            std::map<dp::u64, std::function<void()>> listeners;
        };

        std::shared_ptr<State> state_;

      public:
        Context() : state_(std::make_shared<State>()) {}

        /// Cancel the context and wake every waiter. Safe to call repeatedly.
        void cancel() const {
            std::vector<std::function<void()>> to_run;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->cancelled) {
                    return;
                }
                state_->cancelled = true;
                for (auto &pair : state_->listeners) {
                    to_run.push_back(std::move(pair.second));
                }
                state_->listeners.clear();
            }
            state_->cv.notify_all();

            // Listeners run outside the lock so they may touch the context again
            for (auto &fn : to_run) {
                fn();
            }
        }

        bool is_cancelled() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->cancelled;
        }

        /// Register a callback for cancellation.
        /// Returns a token for remove_listener(), 0 when the callback already ran.
        dp::u64 on_cancel(std::function<void()> fn) const {
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->cancelled) {
                    dp::u64 token = state_->next_token++;
                    state_->listeners.emplace(token, std::move(fn));
                    return token;
                }
            }
            fn();
            return 0;
        }

        void remove_listener(dp::u64 token) const {
            if (token == 0) {
                return;
            }
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->listeners.erase(token);
        }

        dp::usize listener_count() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->listeners.size();
        }

        /// Sleep for the given duration or until cancelled.
        /// Returns false when the sleep was cut short by cancellation.
        bool sleep_for(std::chrono::milliseconds duration) const {
            std::unique_lock<std::mutex> lock(state_->mutex);
            return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
        }
    };

} // namespace trueform
