#pragma once
#include "log.hpp"
#include <agentcore/core/result.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace agentcore::log {

// Appends "2026-01-02 03:04:05,678 - AgentCore - INFO - message" lines.
class FileSink : public ISink {
public:
  explicit FileSink(std::string path);
  ~FileSink() override;

  // Must succeed before the sink is registered; write() drops records otherwise
  agentcore::core::Result<void> Open();
  bool IsOpen() const;
  const std::string& Path() const noexcept { return path_; }

  void write(const LogRecord& r) noexcept override;

  static std::string FormatLine(const LogRecord& r);

private:
  std::string path_;
  mutable std::mutex mu_;
  std::ofstream out_;
};

} // namespace agentcore::log
