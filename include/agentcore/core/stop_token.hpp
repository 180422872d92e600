#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace agentcore::core {

namespace detail {
struct StopState {
    std::mutex mu;
    std::condition_variable cv;
    bool stop_requested{false};
};
} // namespace detail

// Read side of a stop request. Cheap to copy; all copies share one state.
class StopToken {
public:
    StopToken() = default;

    bool StopPossible() const noexcept { return state_ != nullptr; }

    bool StopRequested() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->stop_requested;
    }

    // Blocks for up to d. Returns true if a stop was requested before or during the wait.
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& d) const {
        if (!state_) return false;
        std::unique_lock<std::mutex> lk(state_->mu);
        return state_->cv.wait_for(lk, d, [this] { return state_->stop_requested; });
    }

private:
    friend class StopSource;
    explicit StopToken(std::shared_ptr<detail::StopState> s) : state_(std::move(s)) {}
    std::shared_ptr<detail::StopState> state_;
};

// Write side. Not async-signal-safe: signal handlers must forward through a thread.
class StopSource {
public:
    StopSource() : state_(std::make_shared<detail::StopState>()) {}

    // Returns true only for the call that actually flipped the flag
    bool RequestStop() {
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            if (state_->stop_requested) return false;
            state_->stop_requested = true;
        }
        state_->cv.notify_all();
        return true;
    }

    bool StopRequested() const {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->stop_requested;
    }

    StopToken Token() const { return StopToken(state_); }

private:
    std::shared_ptr<detail::StopState> state_;
};

} // namespace agentcore::core
