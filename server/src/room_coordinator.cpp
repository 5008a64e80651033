/*
 * 설명: 협업 프로토콜 메시지를 서비스 호출로 변환하고 결과 이벤트를 워크플로 룸에 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp, server/tests/e2e/collaboration_flow_test.cpp
 */
#include "collab/room_coordinator.hpp"

#include <functional>
#include <utility>
#include <vector>

#include "collab/protocol.hpp"

namespace collab {
namespace {
constexpr std::size_t kMaxIdLength = 256;
constexpr std::string_view kRoomPrefix = "collaboration:";

std::optional<nlohmann::json> OptionalField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end()) {
    return std::nullopt;
  }
  return *it;
}

// 객체가 아니거나 문자열이 아니면 빈 문자열.
std::string StringField(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return {};
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

RoomCoordinator::RoomCoordinator(std::shared_ptr<TransportHub> hub, std::shared_ptr<CollaborationService> service,
                                 std::shared_ptr<Observability> observability,
                                 std::size_t max_connections_per_workflow)
    : hub_(std::move(hub)), service_(std::move(service)), observability_(std::move(observability)),
      max_connections_per_workflow_(max_connections_per_workflow) {}

bool RoomCoordinator::IsValidId(std::string_view id) {
  if (id.empty() || id.size() > kMaxIdLength) {
    return false;
  }
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string RoomCoordinator::RoomName(const std::string& workflow_id) {
  return std::string(kRoomPrefix) + workflow_id;
}

AdmissionStatus RoomCoordinator::Admit(const std::string& workflow_id) const {
  if (!IsValidId(workflow_id)) {
    return AdmissionStatus::kInvalidWorkflowId;
  }
  if (max_connections_per_workflow_ != 0 &&
      hub_->GetClientCount(RoomName(workflow_id)) >= max_connections_per_workflow_) {
    return AdmissionStatus::kRoomFull;
  }
  return AdmissionStatus::kAccepted;
}

bool RoomCoordinator::Attach(const std::shared_ptr<Connection>& connection) {
  const auto& identity = connection->Identity();
  if (!IsValidId(identity.workflow_id)) {
    Log(LogLevel::kWarn, "collab.attach_rejected", identity, {{"reason", "invalid_workflow_id"}});
    return false;
  }
  hub_->Register(connection);
  if (!hub_->Subscribe(connection, RoomName(identity.workflow_id), max_connections_per_workflow_)) {
    hub_->Unregister(*connection);
    Log(LogLevel::kWarn, "collab.attach_rejected", identity, {{"reason", "room_full"}});
    return false;
  }
  Log(LogLevel::kInfo, "collab.connected", identity, {{"connectionId", connection->Id()}});
  HandleJoin(connection);
  return true;
}

void RoomCoordinator::Detach(const std::shared_ptr<Connection>& connection) {
  if (!hub_->Unregister(*connection)) {
    return;
  }
  const auto& identity = connection->Identity();
  HandleLeave(identity);
  Log(LogLevel::kInfo, "collab.disconnected", identity,
      {{"connectionId", connection->Id()}, {"dropped", connection->DroppedCount()}});
}

void RoomCoordinator::HandleMessage(const std::shared_ptr<Connection>& connection, std::string_view data) {
  std::string error_message;
  const auto& identity = connection->Identity();
  service_->Touch(identity.workflow_id, identity.user_id);

  auto inbound = ParseWsEnvelope(data, error_message);
  if (!inbound) {
    SendError(connection, "bad_request", error_message);
    return;
  }
  auto type = ParseMessageType(inbound->type);
  if (!type) {
    SendError(connection, "unknown_type", "알 수 없는 메시지 유형: " + inbound->type);
    return;
  }

  switch (*type) {
    case MessageType::kJoin:
      HandleJoin(connection);
      return;
    case MessageType::kLeave:
      HandleLeave(connection->Identity());
      return;
    case MessageType::kPresence:
      HandlePresence(connection, inbound->payload);
      return;
    case MessageType::kLockAcquire:
      HandleLockAcquire(connection, inbound->payload);
      return;
    case MessageType::kLockRelease:
      HandleLockRelease(connection, inbound->payload);
      return;
    case MessageType::kChange:
      HandleChange(connection, inbound->payload);
      return;
    case MessageType::kPresenceUpdate:
    case MessageType::kLockAcquired:
    case MessageType::kLockReleased:
    case MessageType::kLockFailed:
    case MessageType::kChangeApplied:
    case MessageType::kUserJoined:
    case MessageType::kUserLeft:
    case MessageType::kError:
      break;
  }
  // 서버 전용 유형은 클라이언트가 보낼 수 없다.
  SendError(connection, "unknown_type", "클라이언트가 보낼 수 없는 메시지 유형: " + inbound->type);
}

void RoomCoordinator::HandleJoin(const std::shared_ptr<Connection>& connection) {
  const auto& identity = connection->Identity();
  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  auto presence = service_->JoinSession(identity.workflow_id, identity.user_id, identity.user_name);
  auto session = service_->GetSession(identity.workflow_id);
  if (session) {
    connection->Enqueue(SerializeMessage(MessageType::kUserJoined, {{"session", ToJson(*session)}}));
  }
  hub_->BroadcastToOthers(RoomName(identity.workflow_id), identity.user_id,
                          SerializeMessage(MessageType::kUserJoined, {{"user", ToJson(presence)}}));
  Log(LogLevel::kInfo, "collab.joined", identity, {{"color", presence.color}});
}

void RoomCoordinator::HandleLeave(const ClientIdentity& identity) {
  std::vector<EditLock> released;
  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  auto error = service_->LeaveSession(identity.workflow_id, identity.user_id, released);
  if (error != CollabError::kNone) {
    Log(LogLevel::kDebug, "collab.leave_ignored", identity, {{"reason", ToString(error)}});
    return;
  }
  const auto room = RoomName(identity.workflow_id);
  for (const auto& lock : released) {
    hub_->Broadcast(room, SerializeMessage(MessageType::kLockReleased, {{"elementId", lock.element_id}}));
  }
  hub_->BroadcastToOthers(room, identity.user_id,
                          SerializeMessage(MessageType::kUserLeft, {{"userId", identity.user_id}}));
  Log(LogLevel::kInfo, "collab.left", identity, {{"releasedLocks", released.size()}});
}

void RoomCoordinator::HandlePresence(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload) {
  const auto& identity = connection->Identity();
  if (!payload.is_object()) {
    SendError(connection, "bad_request", "presence payload는 객체여야 합니다");
    return;
  }
  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  auto error = service_->UpdatePresence(identity.workflow_id, identity.user_id, OptionalField(payload, "cursor"),
                                        OptionalField(payload, "selection"));
  if (error != CollabError::kNone) {
    Log(LogLevel::kDebug, "collab.presence_ignored", identity, {{"reason", ToString(error)}});
    return;
  }
  nlohmann::json update = payload;
  update["userId"] = identity.user_id;
  hub_->BroadcastToOthers(RoomName(identity.workflow_id), identity.user_id,
                          SerializeMessage(MessageType::kPresenceUpdate, update));
}

void RoomCoordinator::HandleLockAcquire(const std::shared_ptr<Connection>& connection,
                                        const nlohmann::json& payload) {
  const auto& identity = connection->Identity();
  auto element_id = StringField(payload, "elementId");
  auto element_type_raw = StringField(payload, "elementType");
  auto element_type = ParseElementType(element_type_raw);
  if (!IsValidId(element_id) || !element_type) {
    Log(LogLevel::kWarn, "collab.lock_invalid", identity,
        {{"elementId", element_id}, {"elementType", element_type_raw}});
    return;
  }

  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  auto result = service_->AcquireLock(identity.workflow_id, identity.user_id, element_id, *element_type);
  if (result.ok()) {
    hub_->Broadcast(RoomName(identity.workflow_id), SerializeMessage(MessageType::kLockAcquired, ToJson(*result.lock)));
    Log(LogLevel::kDebug, "collab.lock_acquired", identity, {{"elementId", element_id}});
    return;
  }

  if (result.error == CollabError::kAlreadyLocked && observability_) {
    observability_->IncrementLockConflict();
  }
  nlohmann::json failed = {{"elementId", element_id},
                           {"reason", ToString(result.error)},
                           {"currentLock", result.lock ? ToJson(*result.lock) : nlohmann::json()}};
  connection->Enqueue(SerializeMessage(MessageType::kLockFailed, failed));
  Log(LogLevel::kInfo, "collab.lock_failed", identity,
      {{"elementId", element_id}, {"reason", ToString(result.error)}});
}

void RoomCoordinator::HandleLockRelease(const std::shared_ptr<Connection>& connection,
                                        const nlohmann::json& payload) {
  const auto& identity = connection->Identity();
  auto element_id = StringField(payload, "elementId");
  if (!IsValidId(element_id)) {
    Log(LogLevel::kWarn, "collab.lock_invalid", identity, {{"elementId", element_id}});
    return;
  }

  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  auto error = service_->ReleaseLock(identity.workflow_id, identity.user_id, element_id);
  switch (error) {
    case CollabError::kNone:
      hub_->Broadcast(RoomName(identity.workflow_id),
                      SerializeMessage(MessageType::kLockReleased, {{"elementId", element_id}}));
      return;
    case CollabError::kNotOwner:
      SendError(connection, "not_lock_owner", "다른 사용자가 보유한 락입니다");
      return;
    default:
      Log(LogLevel::kDebug, "collab.release_ignored", identity,
          {{"elementId", element_id}, {"reason", ToString(error)}});
      return;
  }
}

void RoomCoordinator::HandleChange(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload) {
  const auto& identity = connection->Identity();
  std::lock_guard<std::mutex> room_lock(RoomMutex(identity.workflow_id));
  hub_->BroadcastToOthers(RoomName(identity.workflow_id), identity.user_id,
                          SerializeMessage(MessageType::kChangeApplied, payload));
}

std::size_t RoomCoordinator::CleanupInactiveSessions(std::chrono::seconds max_idle) {
  std::size_t removed = 0;
  for (const auto& workflow_id : service_->IdleSessionIds(max_idle)) {
    std::lock_guard<std::mutex> room_lock(RoomMutex(workflow_id));
    const auto room = RoomName(workflow_id);
    if (hub_->GetClientCount(room) != 0) {
      continue;
    }
    auto session = service_->RemoveIdleSession(workflow_id, max_idle);
    if (!session) {
      continue;
    }
    for (const auto& [element_id, lock] : session->locks) {
      hub_->Broadcast(room, SerializeMessage(MessageType::kLockReleased, {{"elementId", element_id}}));
    }
    ++removed;
    if (observability_ && observability_->Enabled(LogLevel::kInfo)) {
      observability_->Log(LogContext{.level = LogLevel::kInfo,
                                     .name = "collab.session_expired",
                                     .workflow_id = workflow_id,
                                     .detail = {{"participants", session->participants.size()},
                                                {"releasedLocks", session->locks.size()}}});
    }
  }
  return removed;
}

std::mutex& RoomCoordinator::RoomMutex(const std::string& workflow_id) {
  return room_mutexes_[std::hash<std::string>{}(workflow_id) % room_mutexes_.size()];
}

void RoomCoordinator::SendError(const std::shared_ptr<Connection>& connection, std::string_view code,
                                std::string_view message) {
  connection->Enqueue(SerializeMessage(MessageType::kError, {{"code", code}, {"message", message}}));
  Log(LogLevel::kDebug, "collab.error_sent", connection->Identity(), {{"code", code}});
}

void RoomCoordinator::Log(LogLevel level, std::string name, const ClientIdentity& identity,
                          nlohmann::json detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  observability_->Log(LogContext{.level = level,
                                 .name = std::move(name),
                                 .workflow_id = identity.workflow_id,
                                 .user_id = identity.user_id,
                                 .detail = std::move(detail)});
}

}  // namespace collab
