#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "netcall/cancellation.hpp"
#include "netcall/client_response.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief Result of Client::submit_async().
     *
     * Completes exactly once, with the response or an Error. The response
     * can be taken out once; get() afterwards returns InvalidState.
     */
    class ResponseFuture {
       public:
        /// @brief Shared between the future and the worker running the
        /// request.
        class State {
           public:
            /// @brief Complete with @p result. A result arriving after
            /// cancel() is closed and dropped.
            void complete(Result<ClientResponse> result);

            /// @brief Whether the worker should still start the request.
            bool should_run() const;

            CancellationToken& token() noexcept { return token_; }

           private:
            friend class ResponseFuture;

            mutable std::mutex m_;
            std::condition_variable cv_;
            std::optional<Result<ClientResponse>> result_;
            bool cancelled_{false};
            bool retrieved_{false};
            CancellationToken token_;
        };

        ResponseFuture() = default;

        explicit ResponseFuture(std::shared_ptr<State> state)
            : state_(std::move(state)) {}

        bool valid() const noexcept { return state_ != nullptr; }

        /// @brief Block until the request completed and take its result.
        Result<ClientResponse> get();

        /// @brief Wait up to @p timeout; true once complete.
        bool wait_for(std::chrono::milliseconds timeout) const;

        bool is_ready() const;

        /**
         * @brief Complete the future with Cancelled.
         *
         * With @p may_interrupt_if_running the request's connection or
         * stream is aborted as well, which unblocks the worker; otherwise a
         * running request finishes and its response is closed.
         * @return false when the future already completed.
         */
        bool cancel(bool may_interrupt_if_running);

        bool is_cancelled() const;

       private:
        std::shared_ptr<State> state_;
    };

}  // namespace netcall
