#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace netcall {

    /**
     * @brief Propagates cancellation of an asynchronous request into the
     * transport it is currently using.
     *
     * The request registers an abort hook for the duration of each blocking
     * I/O phase; cancel() runs the current hook (if any) and makes later
     * registrations run their hook immediately.
     */
    class CancellationToken {
       public:
        /// @brief Unregisters its hook on destruction.
        class Registration {
           public:
            Registration() = default;
            Registration(Registration&& other) noexcept
                : token_(std::exchange(other.token_, nullptr)),
                  id_(other.id_) {}
            Registration& operator=(Registration&& other) noexcept {
                if (this != &other) {
                    reset();
                    token_ = std::exchange(other.token_, nullptr);
                    id_ = other.id_;
                }
                return *this;
            }
            Registration(const Registration&) = delete;
            Registration& operator=(const Registration&) = delete;

            ~Registration() { reset(); }

           private:
            friend class CancellationToken;
            Registration(CancellationToken* token, std::uint64_t id)
                : token_(token), id_(id) {}

            void reset() noexcept {
                if (token_) token_->unregister(id_);
                token_ = nullptr;
            }

            CancellationToken* token_{nullptr};
            std::uint64_t id_{0};
        };

        /// @brief Install @p hook until the returned Registration dies.
        [[nodiscard]] Registration on_cancel(std::function<void()> hook) {
            std::unique_lock<std::mutex> lk(m_);
            if (cancelled_) {
                lk.unlock();
                hook();
                return {};
            }
            hook_ = std::move(hook);
            return Registration(this, ++generation_);
        }

        void cancel() {
            std::lock_guard<std::mutex> lk(m_);
            if (cancelled_) return;
            cancelled_ = true;
            // Runs under m_: hooks must not block or re-enter the token.
            if (hook_) hook_();
            hook_ = nullptr;
        }

        bool is_cancelled() const {
            std::lock_guard<std::mutex> lk(m_);
            return cancelled_;
        }

       private:
        void unregister(std::uint64_t id) noexcept {
            std::lock_guard<std::mutex> lk(m_);
            if (id == generation_) hook_ = nullptr;
        }

        mutable std::mutex m_;
        bool cancelled_{false};
        std::uint64_t generation_{0};
        std::function<void()> hook_;
    };

}  // namespace netcall
