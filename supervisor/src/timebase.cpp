#include <supervisor/timebase.hpp>
#include <thread>

namespace agentcore::supervisor {

ITimebase::TimePoint SystemTimebase::Now() const {
    return std::chrono::system_clock::now();
}

bool SystemTimebase::SleepFor(std::chrono::milliseconds d, const agentcore::core::StopToken& stop) {
    if (!stop.StopPossible()) {
        std::this_thread::sleep_for(d);
        return true;
    }
    return !stop.WaitFor(d);
}

} // namespace agentcore::supervisor
