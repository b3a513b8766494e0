#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace netcall {

    /**
     * @brief Single-fire completion carrying a value of type T.
     *
     * The first complete() wins; later calls are ignored and return false.
     * Callbacks registered with on_complete() run exactly once, on the
     * completing thread (or immediately if already complete).
     */
    template <typename T>
    class Completion {
       public:
        using Callback = std::function<void(const T&)>;

        /// @brief Complete with @p value. Returns false if already completed.
        bool complete(T value) {
            std::vector<Callback> callbacks;
            {
                std::lock_guard<std::mutex> lk(m_);
                if (value_) return false;
                value_.emplace(std::move(value));
                callbacks.swap(callbacks_);
            }
            cv_.notify_all();
            for (auto& cb : callbacks) cb(*value_);
            return true;
        }

        bool is_done() const {
            std::lock_guard<std::mutex> lk(m_);
            return value_.has_value();
        }

        /// @brief Block until completed, then return the value.
        const T& wait() const {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&] { return value_.has_value(); });
            return *value_;
        }

        /// @brief Wait up to @p timeout; nullptr when still pending.
        template <typename Rep, typename Period>
        const T* wait_for(std::chrono::duration<Rep, Period> timeout) const {
            std::unique_lock<std::mutex> lk(m_);
            if (!cv_.wait_for(lk, timeout, [&] { return value_.has_value(); }))
                return nullptr;
            return &*value_;
        }

        void on_complete(Callback cb) {
            {
                std::lock_guard<std::mutex> lk(m_);
                if (!value_) {
                    callbacks_.push_back(std::move(cb));
                    return;
                }
            }
            cb(*value_);
        }

       private:
        mutable std::mutex m_;
        mutable std::condition_variable cv_;
        std::optional<T> value_;
        std::vector<Callback> callbacks_;
    };

}  // namespace netcall
