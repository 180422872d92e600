#pragma once
#include <csignal>
#include <functional>
#include <initializer_list>
#include <atomic>
#include <thread>

namespace agentcore::em {

// Turns asynchronous signals into a plain callback on a dedicated thread, so
// the callback may lock mutexes and notify condition variables.
// Construct before any other thread starts: the signals are blocked in the
// calling thread and every thread spawned afterwards inherits that mask.
class SignalForwarder {
public:
    using Handler = std::function<void(int signo)>;

    SignalForwarder(std::initializer_list<int> signals, Handler handler);
    ~SignalForwarder();

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

    int ForwardedCount() const noexcept { return forwarded_.load(std::memory_order_relaxed); }

private:
    void Loop();

    sigset_t set_{};
    int wake_signal_{0};
    Handler handler_;
    std::atomic<bool> done_{false};
    std::atomic<int> forwarded_{0};
    std::thread thread_;
};

} // namespace agentcore::em
