/*
 * 설명: 구조화 로그와 협업 서버 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace collab {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string trace_id;
  std::optional<std::string> workflow_id;
  std::optional<std::string> user_id;
  std::optional<std::string> connection_id;
  nlohmann::json detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t messages_dropped{0};
  std::uint64_t lock_conflicts{0};
  std::uint64_t active_sessions{0};
  std::uint64_t active_locks{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementDropped();
  void IncrementLockConflict();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t active_locks) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> messages_dropped_{0};
  std::atomic<std::uint64_t> lock_conflicts_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex out_mutex_;
};

}  // namespace collab
