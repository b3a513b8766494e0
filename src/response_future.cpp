#include "netcall/response_future.hpp"

namespace netcall {

    void ResponseFuture::State::complete(Result<ClientResponse> result) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (!result_) {
                result_.emplace(std::move(result));
                cv_.notify_all();
                return;
            }
        }
        // Completed by cancel(); the late response still owns a connection.
        if (auto* response = result.value_ptr()) response->close();
    }

    bool ResponseFuture::State::should_run() const {
        std::lock_guard<std::mutex> lk(m_);
        return !cancelled_;
    }

    Result<ClientResponse> ResponseFuture::get() {
        if (!state_) {
            return Result<ClientResponse>::err(Error::Code::InvalidState,
                                               "Future has no state");
        }
        std::unique_lock<std::mutex> lk(state_->m_);
        state_->cv_.wait(lk, [&] { return state_->result_.has_value(); });
        if (state_->retrieved_) {
            return Result<ClientResponse>::err(Error::Code::InvalidState,
                                               "Response already retrieved");
        }
        state_->retrieved_ = true;
        return std::move(*state_->result_);
    }

    bool ResponseFuture::wait_for(std::chrono::milliseconds timeout) const {
        if (!state_) return false;
        std::unique_lock<std::mutex> lk(state_->m_);
        return state_->cv_.wait_for(
            lk, timeout, [&] { return state_->result_.has_value(); });
    }

    bool ResponseFuture::is_ready() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lk(state_->m_);
        return state_->result_.has_value();
    }

    bool ResponseFuture::cancel(bool may_interrupt_if_running) {
        if (!state_) return false;
        {
            std::lock_guard<std::mutex> lk(state_->m_);
            if (state_->result_) return false;
            state_->cancelled_ = true;
            state_->result_.emplace(Result<ClientResponse>::err(
                Error::Code::Cancelled, "Request was cancelled"));
            state_->cv_.notify_all();
        }
        if (may_interrupt_if_running) state_->token_.cancel();
        return true;
    }

    bool ResponseFuture::is_cancelled() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lk(state_->m_);
        return state_->cancelled_;
    }

}  // namespace netcall
