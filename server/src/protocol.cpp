/*
 * 설명: JSON 응답 엔벨로프와 협업 WebSocket 엔벨로프를 생성/파싱한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_envelope_test.cpp
 */
#include "collab/protocol.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace collab {
namespace {
constexpr std::array<std::pair<MessageType, std::string_view>, 14> kMessageTypeNames{{
    {MessageType::kJoin, "join"},
    {MessageType::kLeave, "leave"},
    {MessageType::kPresence, "presence"},
    {MessageType::kPresenceUpdate, "presence_update"},
    {MessageType::kLockAcquire, "lock_acquire"},
    {MessageType::kLockAcquired, "lock_acquired"},
    {MessageType::kLockRelease, "lock_release"},
    {MessageType::kLockReleased, "lock_released"},
    {MessageType::kLockFailed, "lock_failed"},
    {MessageType::kChange, "change"},
    {MessageType::kChangeApplied, "change_applied"},
    {MessageType::kUserJoined, "user_joined"},
    {MessageType::kUserLeft, "user_left"},
    {MessageType::kError, "error"},
}};
}  // namespace

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

std::string_view ToString(MessageType type) {
  for (const auto& [value, name] : kMessageTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "error";
}

std::optional<MessageType> ParseMessageType(std::string_view value) {
  for (const auto& [type, name] : kMessageTypeNames) {
    if (name == value) {
      return type;
    }
  }
  return std::nullopt;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["type"] = ToString(env.type);
  j["payload"] = env.payload.is_null() ? nlohmann::json::object() : env.payload;
  j["timestamp"] = ToIsoString(env.timestamp);
  return j;
}

std::string SerializeMessage(MessageType type, const nlohmann::json& payload) {
  WsEnvelope env{.type = type, .payload = payload, .timestamp = std::chrono::system_clock::now()};
  // 헤더에서 온 사용자 이름 등 잘못된 UTF-8이 섞여도 직렬화가 실패하지 않게 한다.
  return ToWsJson(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<InboundEnvelope> ParseWsEnvelope(std::string_view raw, std::string& error_message) {
  auto message = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (message.is_discarded()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error_message = "엔벨로프는 객체여야 합니다";
    return std::nullopt;
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    error_message = "type 필드가 필요합니다";
    return std::nullopt;
  }
  InboundEnvelope envelope;
  envelope.type = type_it->get<std::string>();
  auto payload_it = message.find("payload");
  if (payload_it == message.end() || payload_it->is_null()) {
    envelope.payload = nlohmann::json::object();
  } else {
    envelope.payload = std::move(*payload_it);
  }
  return envelope;
}

}  // namespace collab
