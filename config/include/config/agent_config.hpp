#pragma once
#include <string>
#include <log.hpp>
#include <agentcore/core/result.hpp>
#include <supervisor/heartbeat_supervisor.hpp>

namespace agentcore::config {

struct LoggingConfig {
    agentcore::log::LogLevel level{agentcore::log::LogLevel::kInfo};
    std::string file{"agent_core.log"};   // empty disables the file sink
    bool console{true};
    bool dlt{false};
};

struct AgentConfig {
    std::string app_id{"AgentCore"};
    std::string ecu_id{"HOST"};
    agentcore::supervisor::HeartbeatSupervisor::Config supervisor{};
    LoggingConfig logging{};
};

// Reads a JSON manifest. Missing keys keep their defaults.
agentcore::core::Result<AgentConfig> LoadAgentConfig(const std::string& path) noexcept;

// Same rules as LoadAgentConfig, for manifests already in memory
agentcore::core::Result<AgentConfig> ParseAgentConfig(const std::string& text) noexcept;

} // namespace agentcore::config
