#pragma once

#include <trueform/remote/error.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

namespace trueform {
    namespace remote {

        /// Single-use delivery slot for one outstanding call
        struct PendingCall {
            dp::i64 request_id;
            std::mutex mutex;
            std::condition_variable cv;
            bool completed;
            bool cancelled;
            Res<WireResponse> result;

            explicit PendingCall(dp::i64 id)
                : request_id(id), completed(false), cancelled(false),
                  result(dp::result::err(Error::timeout("call timed out"))) {}

            /// Deliver a response. Returns false when the slot was already settled.
            bool deliver(WireResponse &&response) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (completed) {
                        return false;
                    }
                    result = dp::result::ok(std::move(response));
                    completed = true;
                }
                cv.notify_one();
                return true;
            }

            /// Settle the slot with an error (connection lost, client closed)
            bool fail(const Error &error) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (completed) {
                        return false;
                    }
                    result = dp::result::err(error);
                    completed = true;
                }
                cv.notify_one();
                return true;
            }

            bool cancel() {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (completed) {
                        return false;
                    }
                    result = dp::result::err(Error::cancelled());
                    completed = true;
                    cancelled = true;
                }
                cv.notify_one();
                return true;
            }

            /// Wait until settled or the timeout passes.
            /// On settlement the outcome is moved into out and true is returned.
            bool wait_for(std::chrono::milliseconds timeout, Res<WireResponse> &out) {
                std::unique_lock<std::mutex> lock(mutex);
                if (!cv.wait_for(lock, timeout, [this] { return completed; })) {
                    return false;
                }
                out = std::move(result);
                return true;
            }
        };

        /// Routing table: correlation id -> waiting call
        /// Entries are removed on delivery, or by the caller when it stops waiting.
        class CallRouter {
          private:
            std::map<dp::i64, std::shared_ptr<PendingCall>> pending_calls_;
            mutable std::mutex pending_mutex_;

          public:
            std::shared_ptr<PendingCall> add(dp::i64 request_id) {
                auto pending = std::make_shared<PendingCall>(request_id);
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending_calls_[request_id] = pending;
                echo::trace("registered call id=", request_id, " pending=", pending_calls_.size());
                return pending;
            }

            void remove(dp::i64 request_id) {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending_calls_.erase(request_id);
            }

            /// Hand a response to its waiter without blocking on it.
            /// Returns false when nobody waits for this id; the response is dropped.
            bool deliver(WireResponse &&response) {
                std::shared_ptr<PendingCall> pending;
                {
                    std::lock_guard<std::mutex> lock(pending_mutex_);
                    auto it = pending_calls_.find(response.id);
                    if (it != pending_calls_.end()) {
                        pending = it->second;
                        pending_calls_.erase(it);
                    }
                }

                if (!pending) {
                    echo::warn("dropping response for unknown request id=", response.id);
                    return false;
                }

                echo::trace("delivering response id=", response.id);
                return pending->deliver(std::move(response));
            }

            /// Settle every waiting call with the same error and clear the table
            dp::usize fail_all(const Error &error) {
                std::map<dp::i64, std::shared_ptr<PendingCall>> drained;
                {
                    std::lock_guard<std::mutex> lock(pending_mutex_);
                    drained.swap(pending_calls_);
                }

                for (auto &pair : drained) {
                    pair.second->fail(error);
                }
                if (!drained.empty()) {
                    echo::debug("failed ", drained.size(), " pending calls: ", error.message.c_str());
                }
                return drained.size();
            }

            dp::usize pending_count() const {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                return pending_calls_.size();
            }
        };

    } // namespace remote

    using CallRouter = remote::CallRouter;
    using PendingCall = remote::PendingCall;

} // namespace trueform
