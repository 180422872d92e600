#include "launcher.hpp"
#include "signal_forwarder.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <log.hpp>
#include <sinks_console.hpp>
#include <sinks_file.hpp>
#ifdef AGENTCORE_HAVE_DLT
#include <sinks_dlt.hpp>
#endif
#include <supervisor/heartbeat_supervisor.hpp>

using namespace agentcore::log;
using agentcore::config::AgentConfig;
using agentcore::core::Result;
using agentcore::supervisor::HeartbeatSupervisor;

namespace agentcore::em {

std::string ResolveConfigPath(int argc, char** argv) {
    if (argc > 1 && argv[1] && *argv[1]) return argv[1];
    const char* env = std::getenv("AGENT_CORE_CONFIG");
    return env ? env : "";
}

Result<void> SetupLogging(const AgentConfig& cfg) {
    std::vector<SinkPtr> sinks;
    if (cfg.logging.console) sinks.push_back(std::make_shared<ConsoleSink>());

    if (!cfg.logging.file.empty()) {
        auto file = std::make_shared<FileSink>(cfg.logging.file);
        if (auto r = file->Open(); !r) return r;
        sinks.push_back(file);
    }

    if (cfg.logging.dlt) {
#ifdef AGENTCORE_HAVE_DLT
        sinks.push_back(std::make_shared<DltSink>("Agent Core"));
#else
        std::cerr << "[EM] DLT requested but agent_core was built without libdlt; ignoring\n";
#endif
    }

    auto& lm = LogManager::Instance();
    lm.SetGlobalIds(cfg.ecu_id, cfg.app_id);
    lm.SetDefaultLevel(cfg.logging.level);
    for (auto& s : sinks) lm.AddSink(s);
    return {};
}

int RunAgentCore(int argc, char** argv) {
    AgentConfig cfg{};
    const std::string config_path = ResolveConfigPath(argc, argv);
    if (!config_path.empty()) {
        auto loaded = agentcore::config::LoadAgentConfig(config_path);
        if (!loaded) {
            std::cerr << "[EM] Failed to load configuration from " << config_path
                      << ": " << loaded.Error().Message() << "\n";
            return kExitConfigError;
        }
        cfg = std::move(*loaded);
    }

    if (auto r = SetupLogging(cfg); !r) {
        std::cerr << "[EM] " << r.Error().Message() << "\n";
        return kExitSinkError;
    }

    auto log = Logger::CreateLogger("EM", "Agent launcher");
    AGENTCORE_LOGINFO(log, "Launching {} (config: {})", cfg.app_id,
                      config_path.empty() ? std::string("defaults") : config_path);

    HeartbeatSupervisor supervisor(cfg.supervisor);

    // From here on SIGINT/SIGTERM are only seen by the forwarder thread
    SignalForwarder forwarder({SIGINT, SIGTERM}, [&](int signo) {
        AGENTCORE_LOGINFO(log, "Caught signal {}: requesting stop", signo);
        supervisor.Stop();
    });

    auto r = supervisor.Run();
    if (!r) {
        AGENTCORE_LOGERROR(log, "Supervisor did not run: {}", r.Error().Message());
        return agentcore::core::IsConfigError(r.Error().value) ? kExitConfigError : kExitRunError;
    }

    const auto final_state = supervisor.Snapshot();
    AGENTCORE_LOGINFO(log, "Supervisor stopped after {} heartbeats, {} errors",
                      final_state.heartbeat_count, final_state.error_count);
    return kExitOk;
}

} // namespace agentcore::em
