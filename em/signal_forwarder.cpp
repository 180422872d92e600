#include "signal_forwarder.hpp"
#include <pthread.h>
#include <cstring>
#include <iostream>
#include <system_error>

namespace agentcore::em {

SignalForwarder::SignalForwarder(std::initializer_list<int> signals, Handler handler)
    : handler_(std::move(handler)) {
    sigemptyset(&set_);
    for (int s : signals) {
        sigaddset(&set_, s);
        if (wake_signal_ == 0) wake_signal_ = s;
    }
    if (int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr); rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
    thread_ = std::thread([this] { Loop(); });
}

SignalForwarder::~SignalForwarder() {
    done_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
        // The signal is blocked everywhere, so it stays pending until sigwait picks it up
        if (wake_signal_ != 0) pthread_kill(thread_.native_handle(), wake_signal_);
        thread_.join();
    }
}

void SignalForwarder::Loop() {
    for (;;) {
        int signo = 0;
        const int rc = sigwait(&set_, &signo);
        if (done_.load(std::memory_order_acquire)) return;
        if (rc != 0) {
            std::cerr << "[EM] sigwait failed: " << std::strerror(rc) << "\n";
            return;
        }
        forwarded_.fetch_add(1, std::memory_order_relaxed);
        if (handler_) handler_(signo);
    }
}

} // namespace agentcore::em
