#pragma once
#include <string>

#include <agentcore/core/result.hpp>
#include <config/agent_config.hpp>

namespace agentcore::em {

// Process exit codes of agent_core
constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitSinkError = 2;
constexpr int kExitRunError = 3;

// argv[1] wins over AGENT_CORE_CONFIG; neither means built-in defaults ("")
std::string ResolveConfigPath(int argc, char** argv);

// Applies ids, level and sinks from cfg to the LogManager.
// kSinkUnavailable if the log file cannot be opened; no sink is added then.
agentcore::core::Result<void> SetupLogging(const agentcore::config::AgentConfig& cfg);

// Whole launcher: config, logging, signal forwarding, supervisor run.
// Returns one of the kExit* codes.
int RunAgentCore(int argc, char** argv);

} // namespace agentcore::em
