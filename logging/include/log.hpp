// logging/include/log.hpp
#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <utility>
#include <sstream>
#include <optional>

namespace agentcore::log {

// ---------- Log levels ----------
enum class LogLevel : uint8_t { kOff, kFatal, kError, kWarn, kInfo, kDebug, kVerbose };

inline constexpr std::string_view ToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kFatal:   return "FATAL";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kWarn:    return "WARN";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kVerbose: return "VERBOSE";
    default:                 return "OFF";
  }
}

// Accepts the lower-case names used in manifests ("info", "debug", ...)
inline std::optional<LogLevel> ParseLogLevel(std::string_view s) {
  if (s == "off")     return LogLevel::kOff;
  if (s == "fatal")   return LogLevel::kFatal;
  if (s == "error")   return LogLevel::kError;
  if (s == "warn")    return LogLevel::kWarn;
  if (s == "info")    return LogLevel::kInfo;
  if (s == "debug")   return LogLevel::kDebug;
  if (s == "verbose") return LogLevel::kVerbose;
  return std::nullopt;
}

// ---------- Record & sink ----------
struct LogRecord {
  std::string ecu_id;  // host / device id, e.g. "HOST"
  std::string app_id;  // process id, e.g. "AgentCore"
  std::string ctx_id;  // emitting component, e.g. "AgentCore"
  LogLevel    level;
  std::string message;
  // wall-clock timestamp in ns since epoch
  uint64_t    ts_ns;
  const char* file = nullptr;
  uint32_t    line = 0;
};

struct ISink {
  virtual ~ISink() = default;
  virtual void write(const LogRecord& rec) noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;

// ---------- Manager (global config & sinks) ----------
class LogManager {
public:
  static LogManager& Instance() {
    static LogManager g;
    return g;
  }

  void SetGlobalIds(std::string ecu, std::string app) {
    std::scoped_lock lk(mu_);
    ecu_id_ = std::move(ecu);
    app_id_ = std::move(app);
  }

  void SetDefaultLevel(LogLevel lvl) {
    std::scoped_lock lk(mu_);
    default_level_ = lvl;
  }

  void AddSink(SinkPtr s) {
    std::scoped_lock lk(mu_);
    sinks_.push_back(std::move(s));
  }

  void RemoveSink(const SinkPtr& s) {
    std::scoped_lock lk(mu_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end());
  }

  // Loggers created earlier keep their own snapshot
  void ClearSinks() {
    std::scoped_lock lk(mu_);
    sinks_.clear();
  }

  // Snapshot sinks/ids for fast use in Logger
  void Snapshot(std::vector<SinkPtr>& out, std::string& ecu, std::string& app, LogLevel& def) const {
    std::scoped_lock lk(mu_);
    out = sinks_; ecu = ecu_id_; app = app_id_; def = default_level_;
  }

private:
  LogManager() = default;
  mutable std::mutex mu_;
  std::vector<SinkPtr> sinks_;
  std::string ecu_id_{"HOST"};
  std::string app_id_{"AgentCore"};
  LogLevel default_level_{LogLevel::kInfo};
};

// ---------- Logger (per-context) ----------
class Logger {
public:
  // ctxDesc is only consumed by sinks that register contexts (DLT)
  static Logger CreateLogger(std::string ctxId, std::string /*ctxDesc*/ = "", std::optional<LogLevel> level = std::nullopt) {
    std::vector<SinkPtr> sinks; std::string ecu, app; LogLevel def{};
    LogManager::Instance().Snapshot(sinks, ecu, app, def);
    return Logger(std::move(ctxId), std::move(ecu), std::move(app), std::move(sinks), level.value_or(def));
  }

  LogLevel Level() const noexcept { return level_; }
  void SetLevel(LogLevel lvl) noexcept { level_ = lvl; }

  void Log(LogLevel lvl, std::string_view msg, const char* file = nullptr, uint32_t line = 0) {
    if (!ShouldLog(lvl)) return;
    LogRecord r;
    r.ecu_id = ecu_id_;
    r.app_id = app_id_;
    r.ctx_id = ctx_id_;
    r.level  = lvl;
    r.message = std::string(msg);
    r.file = file;
    r.line = line;
    r.ts_ns = NowNs();
    for (const auto& s : sinks_) if (s) s->write(r);
  }

  void Fatal (std::string_view m, const char* f=nullptr, uint32_t l=0){ Log(LogLevel::kFatal,   m,f,l); }
  void Error (std::string_view m, const char* f=nullptr, uint32_t l=0){ Log(LogLevel::kError,   m,f,l); }
  void Warn  (std::string_view m, const char* f=nullptr, uint32_t l=0){ Log(LogLevel::kWarn,    m,f,l); }
  void Info  (std::string_view m, const char* f=nullptr, uint32_t l=0){ Log(LogLevel::kInfo,    m,f,l); }
  void Debug (std::string_view m, const char* f=nullptr, uint32_t l=0){ Log(LogLevel::kDebug,   m,f,l); }

  // "{}" placeholders are replaced in order via operator<<
  template <typename... Args>
  void LogF(LogLevel lvl, const char* file, uint32_t line, std::string_view fmt, Args&&... args) {
    if (!ShouldLog(lvl)) return;
    std::ostringstream oss;
    FormatInto(oss, fmt, std::forward<Args>(args)...);
    Log(lvl, oss.str(), file, line);
  }

  template <typename... Args> void FatalF(const char* f, uint32_t l, std::string_view fmt, Args&&... a){ LogF(LogLevel::kFatal, f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void ErrorF(const char* f, uint32_t l, std::string_view fmt, Args&&... a){ LogF(LogLevel::kError, f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void WarnF (const char* f, uint32_t l, std::string_view fmt, Args&&... a){ LogF(LogLevel::kWarn,  f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void InfoF (const char* f, uint32_t l, std::string_view fmt, Args&&... a){ LogF(LogLevel::kInfo,  f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void DebugF(const char* f, uint32_t l, std::string_view fmt, Args&&... a){ LogF(LogLevel::kDebug, f,l,fmt,std::forward<Args>(a)...); }

  const std::string& ContextId() const noexcept { return ctx_id_; }

private:
  Logger(std::string ctx, std::string ecu, std::string app,
         std::vector<SinkPtr> sinks, LogLevel lvl)
      : ctx_id_(std::move(ctx)), ecu_id_(std::move(ecu)), app_id_(std::move(app)),
        sinks_(std::move(sinks)), level_(lvl) {}

  static uint64_t NowNs() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
  }

  bool ShouldLog(LogLevel lvl) const noexcept {
    if (level_ == LogLevel::kOff) return false;
    // FATAL(1) .. VERBOSE(6); anything <= current level logs
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level_);
  }

  static void ReplaceFirstBrace(std::ostringstream& oss, std::string_view& fmt) {
    auto pos = fmt.find("{}");
    if (pos == std::string_view::npos) { oss << fmt; fmt = {}; return; }
    oss << fmt.substr(0, pos);
    fmt.remove_prefix(pos + 2);
  }
  template <typename T, typename... Rest>
  static void FormatInto(std::ostringstream& oss, std::string_view fmt, T&& value, Rest&&... rest) {
    ReplaceFirstBrace(oss, fmt);
    oss << std::forward<T>(value);
    if constexpr (sizeof...(rest) == 0) { oss << fmt; }
    else { FormatInto(oss, fmt, std::forward<Rest>(rest)...); }
  }
  static void FormatInto(std::ostringstream& oss, std::string_view fmt) { oss << fmt; }

  std::string ctx_id_;
  std::string ecu_id_;
  std::string app_id_;
  std::vector<SinkPtr> sinks_;
  LogLevel level_;
};

// ---------- Convenience macros to capture file/line ----------
#define AGENTCORE_LOGFATAL(lg, fmt, ...) (lg).FatalF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define AGENTCORE_LOGERROR(lg, fmt, ...) (lg).ErrorF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define AGENTCORE_LOGWARN(lg,  fmt, ...) (lg).WarnF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define AGENTCORE_LOGINFO(lg,  fmt, ...) (lg).InfoF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define AGENTCORE_LOGDEBUG(lg, fmt, ...) (lg).DebugF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)

} // namespace agentcore::log
