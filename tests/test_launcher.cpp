#include <gtest/gtest.h>
#include "launcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <log.hpp>

using agentcore::config::AgentConfig;
using agentcore::core::AgentErrc;
using agentcore::em::ResolveConfigPath;
using agentcore::em::SetupLogging;
using agentcore::log::LogManager;
using agentcore::log::SinkPtr;

namespace fs = std::filesystem;

namespace {

// Restores AGENT_CORE_CONFIG after each test
class ConfigPath : public ::testing::Test {
protected:
  void SetUp() override {
    if (const char* v = std::getenv("AGENT_CORE_CONFIG")) saved_ = v;
    ::unsetenv("AGENT_CORE_CONFIG");
  }
  void TearDown() override {
    if (saved_.empty()) ::unsetenv("AGENT_CORE_CONFIG");
    else ::setenv("AGENT_CORE_CONFIG", saved_.c_str(), 1);
  }
  std::string saved_;
};

class LauncherLogging : public ::testing::Test {
protected:
  void SetUp() override { LogManager::Instance().ClearSinks(); }
  void TearDown() override { LogManager::Instance().ClearSinks(); }

  static std::size_t SinkCount() {
    std::vector<SinkPtr> sinks;
    std::string ecu, app;
    agentcore::log::LogLevel def{};
    LogManager::Instance().Snapshot(sinks, ecu, app, def);
    return sinks.size();
  }
};

} // namespace

TEST_F(ConfigPath, ArgumentWinsOverEnvironment) {
  ::setenv("AGENT_CORE_CONFIG", "/from/env.json", 1);
  char prog[] = "agent_core";
  char arg[] = "/from/argv.json";
  char* argv[] = {prog, arg, nullptr};
  EXPECT_EQ(ResolveConfigPath(2, argv), "/from/argv.json");
}

TEST_F(ConfigPath, EnvironmentUsedWithoutArgument) {
  ::setenv("AGENT_CORE_CONFIG", "/from/env.json", 1);
  char prog[] = "agent_core";
  char* argv[] = {prog, nullptr};
  EXPECT_EQ(ResolveConfigPath(1, argv), "/from/env.json");
}

TEST_F(ConfigPath, EmptyArgumentFallsBackToEnvironment) {
  ::setenv("AGENT_CORE_CONFIG", "/from/env.json", 1);
  char prog[] = "agent_core";
  char empty[] = "";
  char* argv[] = {prog, empty, nullptr};
  EXPECT_EQ(ResolveConfigPath(2, argv), "/from/env.json");
}

TEST_F(ConfigPath, NeitherMeansDefaults) {
  char prog[] = "agent_core";
  char* argv[] = {prog, nullptr};
  EXPECT_TRUE(ResolveConfigPath(1, argv).empty());
}

TEST_F(LauncherLogging, UnwritableLogFileIsSinkUnavailable) {
  const fs::path dir = fs::temp_directory_path() / "agentcore_launcher_missing";
  fs::remove_all(dir);

  AgentConfig cfg{};
  cfg.logging.console = true;
  cfg.logging.file = (dir / "nested" / "agent_core.log").string();

  auto r = SetupLogging(cfg);
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, AgentErrc::kSinkUnavailable);
  EXPECT_EQ(SinkCount(), 0u);
}

TEST_F(LauncherLogging, ConfiguredSinksAreInstalled) {
  const fs::path dir = fs::temp_directory_path() / "agentcore_launcher_ok";
  fs::remove_all(dir);
  fs::create_directories(dir);

  AgentConfig cfg{};
  cfg.ecu_id = "MAC1";
  cfg.logging.console = true;
  cfg.logging.file = (dir / "agent_core.log").string();

  auto r = SetupLogging(cfg);
  ASSERT_TRUE(r.HasValue()) << r.Error().Message();
  EXPECT_EQ(SinkCount(), 2u);
  EXPECT_TRUE(fs::exists(dir / "agent_core.log"));

  LogManager::Instance().ClearSinks();
  fs::remove_all(dir);
}
