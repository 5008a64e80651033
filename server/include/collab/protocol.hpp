/*
 * 설명: 협업 WebSocket 엔벨로프와 메시지 유형, REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace collab {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

enum class MessageType {
  kJoin,
  kLeave,
  kPresence,
  kPresenceUpdate,
  kLockAcquire,
  kLockAcquired,
  kLockRelease,
  kLockReleased,
  kLockFailed,
  kChange,
  kChangeApplied,
  kUserJoined,
  kUserLeft,
  kError,
};

std::string_view ToString(MessageType type);
std::optional<MessageType> ParseMessageType(std::string_view value);

struct WsEnvelope {
  MessageType type;
  nlohmann::json payload;
  std::chrono::system_clock::time_point timestamp;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

// 현재 시각을 찍어 전송 가능한 텍스트 프레임으로 직렬화한다.
std::string SerializeMessage(MessageType type, const nlohmann::json& payload);

// 수신 엔벨로프. type은 아직 검증되지 않은 원문 문자열이다.
struct InboundEnvelope {
  std::string type;
  nlohmann::json payload;
};

std::optional<InboundEnvelope> ParseWsEnvelope(std::string_view raw, std::string& error_message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace collab
