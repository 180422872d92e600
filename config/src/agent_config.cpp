#include <config/agent_config.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;
using agentcore::core::AgentErrc;
using agentcore::core::ErrorCode;
using agentcore::core::Result;

namespace agentcore::config {

namespace {

// Largest timing accepted. Half the nanosecond range, so now() + interval
// still fits in the clocks the sleeps are measured against.
constexpr double kMaxMilliseconds =
    static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::nanoseconds::max()).count() / 2);

// Seconds may be fractional. Any positive value keeps at least 1 ms so it stays valid.
Result<std::chrono::milliseconds> ReadSeconds(const json& obj, const char* key,
                                              std::chrono::milliseconds def,
                                              AgentErrc non_positive) {
    if (!obj.contains(key)) return def;
    const auto& v = obj.at(key);
    if (!v.is_number())
        return ErrorCode(AgentErrc::kConfigCorrupt, std::string(key) + " must be a number");
    const double s = v.get<double>();
    if (!std::isfinite(s))
        return ErrorCode(AgentErrc::kConfigCorrupt, std::string(key) + " must be finite");
    if (s <= 0.0)
        return ErrorCode(non_positive, std::string(key) + " = " + v.dump());

    const double ms = s * 1000.0;
    if (!(ms <= kMaxMilliseconds))
        return ErrorCode(AgentErrc::kConfigCorrupt, std::string(key) + " out of range");
    return std::chrono::milliseconds(std::max<long long>(1, std::llround(ms)));
}

Result<AgentConfig> FromJson(const json& j) {
    if (!j.is_object()) return ErrorCode(AgentErrc::kConfigCorrupt, "top level must be an object");

    AgentConfig cfg{};
    cfg.app_id = j.value("app_id", cfg.app_id);
    cfg.ecu_id = j.value("ecu_id", cfg.ecu_id);

    if (j.contains("supervisor")) {
        const auto& s = j.at("supervisor");
        if (!s.is_object()) return ErrorCode(AgentErrc::kConfigCorrupt, "supervisor must be an object");

        auto interval = ReadSeconds(s, "interval_seconds", cfg.supervisor.interval,
                                    AgentErrc::kInvalidInterval);
        if (!interval) return interval.Error();
        auto backoff = ReadSeconds(s, "error_backoff_seconds", cfg.supervisor.error_backoff,
                                   AgentErrc::kInvalidBackoff);
        if (!backoff) return backoff.Error();

        cfg.supervisor.interval = *interval;
        cfg.supervisor.error_backoff = *backoff;
    }

    if (j.contains("logging")) {
        const auto& l = j.at("logging");
        if (!l.is_object()) return ErrorCode(AgentErrc::kConfigCorrupt, "logging must be an object");

        const std::string level = l.value("level", std::string("info"));
        auto parsed = agentcore::log::ParseLogLevel(level);
        if (!parsed) return ErrorCode(AgentErrc::kConfigCorrupt, "unknown log level '" + level + "'");
        cfg.logging.level   = *parsed;
        cfg.logging.file    = l.value("file", cfg.logging.file);
        cfg.logging.console = l.value("console", cfg.logging.console);
        cfg.logging.dlt     = l.value("dlt", cfg.logging.dlt);
    }

    // Reject non-positive timings here so the launcher fails before any tick
    if (auto valid = agentcore::supervisor::HeartbeatSupervisor::Validate(cfg.supervisor); !valid)
        return valid.Error();

    return cfg;
}

} // namespace

Result<AgentConfig> ParseAgentConfig(const std::string& text) noexcept {
    try {
        return FromJson(json::parse(text));
    } catch (const json::exception& e) {
        return ErrorCode(AgentErrc::kConfigCorrupt, e.what());
    } catch (const std::exception& e) {
        return ErrorCode(AgentErrc::kUnknown, e.what());
    }
}

Result<AgentConfig> LoadAgentConfig(const std::string& path) noexcept {
    std::ifstream in(path);
    if (!in) return ErrorCode(AgentErrc::kConfigNotFound, path);

    std::ostringstream buf;
    buf << in.rdbuf();
    return ParseAgentConfig(buf.str());
}

} // namespace agentcore::config
