#pragma once
#include "log.hpp"
#include <iostream>
#include <mutex>

namespace agentcore::log {

// Errors go to stderr so they survive stdout redirection
struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    std::scoped_lock lk(mu_);
    auto& out = (r.level == LogLevel::kError || r.level == LogLevel::kFatal) ? std::cerr : std::cout;
    out << "[" << ToString(r.level) << "] "
        << r.ctx_id << ": " << r.message << std::endl;
  }

private:
  std::mutex mu_;
};

} // namespace agentcore::log
