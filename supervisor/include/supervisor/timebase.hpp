#pragma once
#include <chrono>
#include <agentcore/core/stop_token.hpp>

namespace agentcore::supervisor {

// Source of "now" plus the only place the supervisor is allowed to block.
class ITimebase {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~ITimebase() = default;
    virtual TimePoint Now() const = 0;
    // Sleeps for d unless stop is requested. Returns false when interrupted.
    virtual bool SleepFor(std::chrono::milliseconds d, const agentcore::core::StopToken& stop) = 0;
};

// Wall clock; sleeps wait on the token's condition variable.
class SystemTimebase : public ITimebase {
public:
    TimePoint Now() const override;
    bool SleepFor(std::chrono::milliseconds d, const agentcore::core::StopToken& stop) override;
};

} // namespace agentcore::supervisor
