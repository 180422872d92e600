#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef AGENTCORE_BINARY
#  define AGENTCORE_BINARY "agent_core"
#endif

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Runs the agent_core binary in a scratch directory with its own manifest
class AgentCoreProcess : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / (std::string("agentcore_proc_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    manifest_ = dir_ / "agent_core.json";
    log_ = dir_ / "agent_core.log";
  }
  void TearDown() override {
    if (pid_ > 0) {
      ::kill(pid_, SIGKILL);
      ::waitpid(pid_, nullptr, 0);
    }
    fs::remove_all(dir_);
  }

  void WriteManifest(const std::string& supervisor, const std::string& log_file) {
    std::ofstream out(manifest_);
    out << R"({"supervisor": )" << supervisor
        << R"(, "logging": {"console": false, "file": ")" << log_file << R"("}})";
  }

  void Launch() {
    pid_ = ::fork();
    ASSERT_GE(pid_, 0) << "fork failed";
    if (pid_ == 0) {
      ::execl(AGENTCORE_BINARY, AGENTCORE_BINARY, manifest_.c_str(), static_cast<char*>(nullptr));
      ::_exit(127);
    }
  }

  // Exit status, or -1 if the child did not exit normally in time
  int WaitExit(std::chrono::milliseconds limit = 10000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
      pid_t r = ::waitpid(pid_, &status, WNOHANG);
      if (r == pid_) {
        pid_ = -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
      }
      std::this_thread::sleep_for(10ms);
    }
    return -1;
  }

  std::string ReadLog() const {
    std::ifstream in(log_);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
  }

  static int CountOf(const std::string& text, const std::string& needle) {
    int n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++n;
    return n;
  }

  fs::path dir_, manifest_, log_;
  pid_t pid_{-1};
};

} // namespace

TEST_F(AgentCoreProcess, InvalidIntervalExitsWithConfigError) {
  WriteManifest(R"({"interval_seconds": 0})", log_.string());
  Launch();
  EXPECT_EQ(WaitExit(), 1);
  EXPECT_EQ(CountOf(ReadLog(), "Agent Core started"), 0);
}

TEST_F(AgentCoreProcess, UnopenableLogFileExitsWithSinkError) {
  WriteManifest(R"({"interval_seconds": 60})", (dir_ / "missing" / "agent_core.log").string());
  Launch();
  EXPECT_EQ(WaitExit(), 2);
}

TEST_F(AgentCoreProcess, SigtermStopsCleanly) {
  WriteManifest(R"({"interval_seconds": 60, "error_backoff_seconds": 5})", log_.string());
  Launch();

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (CountOf(ReadLog(), "Agent Core started") == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(CountOf(ReadLog(), "Agent Core started"), 1);

  ASSERT_EQ(::kill(pid_, SIGTERM), 0);
  EXPECT_EQ(WaitExit(5000ms), 0);

  const std::string log = ReadLog();
  EXPECT_EQ(CountOf(log, "Agent stopping"), 1);
  EXPECT_EQ(CountOf(log, "Agent heartbeat"), 0);
}
