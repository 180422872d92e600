#include <supervisor/heartbeat_supervisor.hpp>
#include <exception>
#include <string>

namespace agentcore::supervisor {

using agentcore::core::AgentErrc;
using agentcore::core::ErrorCode;
using agentcore::core::Result;

std::string_view ToString(LifecycleState s) {
    switch (s) {
        case LifecycleState::kCreated:  return "CREATED";
        case LifecycleState::kRunning:  return "RUNNING";
        case LifecycleState::kStopping: return "STOPPING";
        case LifecycleState::kStopped:  return "STOPPED";
    }
    return "UNKNOWN";
}

HeartbeatSupervisor::HeartbeatSupervisor(const Config& cfg)
    : HeartbeatSupervisor(cfg, std::make_shared<SystemTimebase>()) {}

HeartbeatSupervisor::HeartbeatSupervisor(const Config& cfg, std::shared_ptr<ITimebase> timebase)
    : cfg_(cfg),
      timebase_(timebase ? std::move(timebase) : std::shared_ptr<ITimebase>(std::make_shared<SystemTimebase>())),
      log_(agentcore::log::Logger::CreateLogger(kSource, "Heartbeat Supervisor")) {
    snapshot_.interval = cfg_.interval;
    snapshot_.error_backoff = cfg_.error_backoff;
}

Result<void> HeartbeatSupervisor::Validate(const Config& cfg) {
    if (cfg.interval.count() <= 0)
        return ErrorCode(AgentErrc::kInvalidInterval, std::to_string(cfg.interval.count()) + "ms");
    if (cfg.error_backoff.count() <= 0)
        return ErrorCode(AgentErrc::kInvalidBackoff, std::to_string(cfg.error_backoff.count()) + "ms");
    return {};
}

Result<void> HeartbeatSupervisor::Run() {
    if (auto valid = Validate(cfg_); !valid) return valid;

    auto expected = LifecycleState::kCreated;
    if (!state_.compare_exchange_strong(expected, LifecycleState::kRunning, std::memory_order_acq_rel)) {
        return expected == LifecycleState::kRunning ? AgentErrc::kAlreadyRunning
                                                    : AgentErrc::kAlreadyStopped;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot_.running = true;
        snapshot_.state = LifecycleState::kRunning;
    }
    AGENTCORE_LOGINFO(log_, "Agent Core started");
    AGENTCORE_LOGDEBUG(log_, "interval={}ms error_backoff={}ms",
                       cfg_.interval.count(), cfg_.error_backoff.count());

    for (;;) {
        if (!SleepInterruptible(cfg_.interval)) break;
        if (RunTick()) continue;
        if (!SleepInterruptible(cfg_.error_backoff)) break;
    }

    FinishStopping();
    return {};
}

bool HeartbeatSupervisor::Stop() {
    if (State() == LifecycleState::kStopped) return false;
    return stop_.RequestStop();
}

SupervisorState HeartbeatSupervisor::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    SupervisorState s = snapshot_;
    s.state = State();
    return s;
}

bool HeartbeatSupervisor::SleepInterruptible(std::chrono::milliseconds d) {
    if (stop_.StopRequested()) return false;
    return timebase_->SleepFor(d, stop_.Token());
}

bool HeartbeatSupervisor::RunTick() {
    std::optional<std::string> failure;
    try {
        if (tick_) {
            auto r = tick_();
            if (!r) failure = r.Error().Message();
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (failure) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++snapshot_.error_count;
        }
        AGENTCORE_LOGERROR(log_, "Error in agent loop: {}", *failure);
        return false;
    }

    const auto now = timebase_->Now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot_.last_heartbeat_at = now;
        ++snapshot_.heartbeat_count;
    }
    AGENTCORE_LOGINFO(log_, "Agent heartbeat");
    return true;
}

void HeartbeatSupervisor::FinishStopping() {
    state_.store(LifecycleState::kStopping, std::memory_order_release);
    AGENTCORE_LOGINFO(log_, "Agent stopping");
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot_.running = false;
        snapshot_.state = LifecycleState::kStopped;
    }
    state_.store(LifecycleState::kStopped, std::memory_order_release);
}

} // namespace agentcore::supervisor
