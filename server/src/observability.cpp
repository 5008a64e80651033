/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "collab/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace collab {

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementDropped() { messages_dropped_.fetch_add(1); }

void Observability::IncrementLockConflict() { lock_conflicts_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t active_locks) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.messages_dropped = messages_dropped_.load();
  snapshot.lock_conflicts = lock_conflicts_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.active_locks = active_locks;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (ctx.workflow_id) {
    log_json["workflowId"] = *ctx.workflow_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(out_mutex_);
  std::cout << line << std::endl;
}

}  // namespace collab
