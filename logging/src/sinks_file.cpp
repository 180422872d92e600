#include "sinks_file.hpp"
#include <atomic>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <sstream>

namespace agentcore::log {

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

FileSink::~FileSink() {
  std::scoped_lock lk(mu_);
  if (out_.is_open()) out_.close();
}

agentcore::core::Result<void> FileSink::Open() {
  std::scoped_lock lk(mu_);
  if (out_.is_open()) return {};
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    return agentcore::core::ErrorCode(agentcore::core::AgentErrc::kSinkUnavailable, path_);
  }
  return {};
}

bool FileSink::IsOpen() const {
  std::scoped_lock lk(mu_);
  return out_.is_open();
}

std::string FileSink::FormatLine(const LogRecord& r) {
  const std::time_t secs = static_cast<std::time_t>(r.ts_ns / 1000000000ULL);
  const unsigned millis = static_cast<unsigned>((r.ts_ns / 1000000ULL) % 1000ULL);

  std::tm tm{};
  localtime_r(&secs, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
  char ms[8];
  std::snprintf(ms, sizeof(ms), ",%03u", millis);

  std::ostringstream oss;
  oss << stamp << ms << " - " << r.ctx_id << " - " << ToString(r.level) << " - " << r.message;
  return oss.str();
}

void FileSink::write(const LogRecord& r) noexcept {
  try {
    const std::string line = FormatLine(r);
    std::scoped_lock lk(mu_);
    if (!out_.is_open()) return;
    out_ << line << '\n';
    out_.flush();
  } catch (const std::exception& e) {
    // Sinks must not throw into the logger; report once and keep going
    static std::atomic<bool> warned{false};
    if (!warned.exchange(true)) {
      std::cerr << "[LOG] File sink " << path_ << " failed: " << e.what() << "\n";
    }
  }
}

} // namespace agentcore::log
