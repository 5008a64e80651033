/*
 * 설명: 협업 서버 환경설정 로딩과 기본값, 유효성 검사를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/collaboration_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace collab {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_max_message_bytes;
  std::size_t ws_read_timeout_seconds;
  std::size_t ws_write_timeout_seconds;
  std::size_t ws_ping_interval_seconds;
  std::size_t max_connections_per_workflow;
  std::size_t session_cleanup_interval_seconds;
  std::size_t session_max_idle_seconds;
  std::string gateway_token;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

// 값이 서로 모순되면 std::invalid_argument를 던진다.
void ValidateConfig(const AppConfig& config);

}  // namespace collab
