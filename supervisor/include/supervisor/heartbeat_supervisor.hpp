#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <log.hpp>
#include <agentcore/core/result.hpp>
#include <agentcore/core/stop_token.hpp>
#include <supervisor/timebase.hpp>

namespace agentcore::supervisor {

// CREATED -> RUNNING -(stop)-> STOPPING -> STOPPED. STOPPED is terminal.
enum class LifecycleState : std::uint8_t { kCreated, kRunning, kStopping, kStopped };

std::string_view ToString(LifecycleState s);

struct SupervisorState {
    bool running{false};
    std::chrono::milliseconds interval{};
    std::chrono::milliseconds error_backoff{};
    std::optional<ITimebase::TimePoint> last_heartbeat_at{};
    LifecycleState state{LifecycleState::kCreated};
    std::uint64_t heartbeat_count{0};
    std::uint64_t error_count{0};
};

class HeartbeatSupervisor {
public:
    struct Config {
        std::chrono::milliseconds interval{10000};
        std::chrono::milliseconds error_backoff{5000};
    };

    // One unit of per-tick work. Errors (returned or thrown) are logged, never propagated.
    using TickFn = std::function<agentcore::core::Result<void>()>;

    static constexpr const char* kSource = "AgentCore";

    explicit HeartbeatSupervisor(const Config& cfg);
    HeartbeatSupervisor(const Config& cfg, std::shared_ptr<ITimebase> timebase);

    HeartbeatSupervisor(const HeartbeatSupervisor&) = delete;
    HeartbeatSupervisor& operator=(const HeartbeatSupervisor&) = delete;

    static agentcore::core::Result<void> Validate(const Config& cfg);

    // Replaces the default no-op tick. Call before Run().
    void SetTick(TickFn fn) { tick_ = std::move(fn); }

    // Blocks until Stop() is called. Fails without emitting anything on invalid config.
    agentcore::core::Result<void> Run();

    // Safe from any thread. Returns false if a stop was already requested or the loop is done.
    bool Stop();

    LifecycleState State() const noexcept { return state_.load(std::memory_order_acquire); }
    SupervisorState Snapshot() const;
    const Config& GetConfig() const noexcept { return cfg_; }

private:
    bool SleepInterruptible(std::chrono::milliseconds d);
    bool RunTick();
    void FinishStopping();

    const Config cfg_;
    std::shared_ptr<ITimebase> timebase_;
    agentcore::log::Logger log_;
    agentcore::core::StopSource stop_;
    TickFn tick_{};

    std::atomic<LifecycleState> state_{LifecycleState::kCreated};
    mutable std::mutex mu_;
    SupervisorState snapshot_{};
};

} // namespace agentcore::supervisor
