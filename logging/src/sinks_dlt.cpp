#include "sinks_dlt.hpp"
#include <dlt/dlt_user.h>

namespace agentcore::log {

static DltLogLevelType to_dlt_level(LogLevel l) {
  switch (l) {
    case LogLevel::kFatal:   return DLT_LOG_FATAL;
    case LogLevel::kError:   return DLT_LOG_ERROR;
    case LogLevel::kWarn:    return DLT_LOG_WARN;
    case LogLevel::kInfo:    return DLT_LOG_INFO;
    case LogLevel::kDebug:   return DLT_LOG_DEBUG;
    case LogLevel::kVerbose: return DLT_LOG_VERBOSE;
    default:                 return DLT_LOG_INFO;
  }
}

DltSink::DltSink(std::string app_description)
  : app_desc_(std::move(app_description)) {}

DltSink::~DltSink() {
  std::scoped_lock lk(mu_);
  for (auto& [id, handle] : ctx_by_id_) {
    auto* ctx = static_cast<DltContext*>(handle.h);
    dlt_unregister_context(ctx);
    delete ctx;
  }
  ctx_by_id_.clear();
  if (!registered_app_id_.empty()) dlt_unregister_app();
}

void DltSink::ensureAppRegistered(const std::string& app_id) {
  if (registered_app_id_ == app_id) return;
  // DLT app ids are at most 4 chars; longer ids are truncated by libdlt
  dlt_register_app(app_id.c_str(), app_desc_.c_str());
  registered_app_id_ = app_id;
}

void DltSink::ensureCtxRegistered(const std::string& ctx_id, const std::string& ctx_desc) {
  if (ctx_by_id_.find(ctx_id) != ctx_by_id_.end()) return;
  auto* ctx = new DltContext{};
  dlt_register_context(ctx, ctx_id.c_str(), ctx_desc.c_str());
  ctx_by_id_[ctx_id] = CtxHandle{ctx};
}

void DltSink::write(const LogRecord& r) noexcept {
  std::scoped_lock lk(mu_);
  ensureAppRegistered(r.app_id);
  ensureCtxRegistered(r.ctx_id, r.ctx_id);

  auto it = ctx_by_id_.find(r.ctx_id);
  if (it == ctx_by_id_.end() || it->second.h == nullptr) return;
  auto* ctx = static_cast<DltContext*>(it->second.h);

  DLT_LOG(*ctx, to_dlt_level(r.level), DLT_STRING(r.message.c_str()));
}

} // namespace agentcore::log
