#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>

namespace agentcore::core {

// Error domain shared by config loading, sinks and the supervisor
enum class AgentErrc {
    kSuccess = 0,
    kInvalidInterval,   // interval <= 0
    kInvalidBackoff,    // error backoff <= 0
    kConfigNotFound,
    kConfigCorrupt,
    kSinkUnavailable,
    kAlreadyRunning,
    kAlreadyStopped,    // Run() after STOPPED
    kTickFailed,
    kUnknown
};

inline constexpr std::string_view ToString(AgentErrc e) {
    switch (e) {
        case AgentErrc::kSuccess:         return "success";
        case AgentErrc::kInvalidInterval: return "interval must be positive";
        case AgentErrc::kInvalidBackoff:  return "error backoff must be positive";
        case AgentErrc::kConfigNotFound:  return "configuration not found";
        case AgentErrc::kConfigCorrupt:   return "configuration corrupt";
        case AgentErrc::kSinkUnavailable: return "log sink unavailable";
        case AgentErrc::kAlreadyRunning:  return "supervisor already running";
        case AgentErrc::kAlreadyStopped:  return "supervisor already stopped";
        case AgentErrc::kTickFailed:      return "tick failed";
        default:                          return "unknown error";
    }
}

// ConfigError covers everything that must stop the process before the first tick
inline constexpr bool IsConfigError(AgentErrc e) {
    return e == AgentErrc::kInvalidInterval || e == AgentErrc::kInvalidBackoff ||
           e == AgentErrc::kConfigNotFound  || e == AgentErrc::kConfigCorrupt;
}

class ErrorCode {
public:
    AgentErrc value;
    ErrorCode(AgentErrc v) : value(v) {}
    ErrorCode(AgentErrc v, std::string detail) : value(v), detail_(std::move(detail)) {}
    operator bool() const { return value != AgentErrc::kSuccess; }

    // Human-readable text; detail wins over the generic domain string
    std::string Message() const {
        if (detail_.empty()) return std::string(ToString(value));
        return std::string(ToString(value)) + ": " + detail_;
    }
    const std::string& Detail() const { return detail_; }

private:
    std::string detail_;
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    Result(AgentErrc e) : data_(ErrorCode(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(AgentErrc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}
    Result(AgentErrc e) : ok_(false), err_(e) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace agentcore::core
