/*
 * 설명: 협업 세션의 참가/이탈, 프레즌스 갱신, 요소 락 획득/해제와 비활성 세션 정리를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_service_test.cpp, server/tests/it/concurrent_lock_it_test.cpp
 */
#include "collab/collaboration_service.hpp"

#include <iterator>
#include <utility>

#include "collab/protocol.hpp"
#include "collab/random.hpp"

namespace collab {
namespace {
std::string PickColor() {
  constexpr auto kColorCount = std::size(kParticipantColors);
  return std::string(kParticipantColors[RandomIndex(kColorCount)]);
}
}  // namespace

std::string_view ToString(ElementType type) {
  switch (type) {
    case ElementType::kNode:
      return "node";
    case ElementType::kEdge:
      return "edge";
  }
  return "node";
}

std::optional<ElementType> ParseElementType(std::string_view value) {
  if (value == "node") {
    return ElementType::kNode;
  }
  if (value == "edge") {
    return ElementType::kEdge;
  }
  return std::nullopt;
}

std::string_view ToString(CollabError error) {
  switch (error) {
    case CollabError::kNone:
      return "none";
    case CollabError::kSessionNotFound:
      return "session_not_found";
    case CollabError::kParticipantNotFound:
      return "participant_not_found";
    case CollabError::kAlreadyLocked:
      return "already_locked";
    case CollabError::kNotOwner:
      return "not_lock_owner";
    case CollabError::kLockNotFound:
      return "lock_not_found";
  }
  return "none";
}

nlohmann::json ToJson(const Presence& presence) {
  return {{"userId", presence.user_id},
          {"userName", presence.user_name},
          {"color", presence.color},
          {"cursor", presence.cursor},
          {"selection", presence.selection},
          {"joinedAt", ToIsoString(presence.joined_at)},
          {"lastSeen", ToIsoString(presence.last_seen)}};
}

nlohmann::json ToJson(const EditLock& lock) {
  return {{"elementId", lock.element_id},
          {"elementType", ToString(lock.element_type)},
          {"userId", lock.user_id},
          {"userName", lock.user_name},
          {"acquiredAt", ToIsoString(lock.acquired_at)}};
}

nlohmann::json ToJson(const SessionState& state) {
  nlohmann::json participants = nlohmann::json::object();
  for (const auto& [user_id, presence] : state.participants) {
    participants[user_id] = ToJson(presence);
  }
  nlohmann::json locks = nlohmann::json::object();
  for (const auto& [element_id, lock] : state.locks) {
    locks[element_id] = ToJson(lock);
  }
  return {{"workflowId", state.workflow_id},
          {"participants", participants},
          {"locks", locks},
          {"createdAt", ToIsoString(state.created_at)},
          {"updatedAt", ToIsoString(state.updated_at)}};
}

CollaborationService::CollaborationService() : CollaborationService(&std::chrono::system_clock::now) {}

CollaborationService::CollaborationService(Clock clock) : clock_(std::move(clock)) {}

Presence CollaborationService::JoinSession(const std::string& workflow_id, const std::string& user_id,
                                           const std::string& user_name) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, created] = sessions_.try_emplace(workflow_id);
  auto& session = it->second;
  if (created) {
    session.workflow_id = workflow_id;
    session.created_at = now;
  }
  session.updated_at = now;

  auto [participant_it, inserted] = session.participants.try_emplace(user_id);
  auto& presence = participant_it->second;
  if (inserted) {
    presence.user_id = user_id;
    presence.color = PickColor();
    presence.joined_at = now;
  }
  presence.user_name = user_name;
  presence.last_seen = now;
  return presence;
}

CollabError CollaborationService::LeaveSession(const std::string& workflow_id, const std::string& user_id,
                                               std::vector<EditLock>& released_locks) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return CollabError::kSessionNotFound;
  }
  auto& session = it->second;
  if (session.participants.erase(user_id) == 0) {
    return CollabError::kParticipantNotFound;
  }
  for (auto lock_it = session.locks.begin(); lock_it != session.locks.end();) {
    if (lock_it->second.user_id == user_id) {
      released_locks.push_back(std::move(lock_it->second));
      lock_it = session.locks.erase(lock_it);
    } else {
      ++lock_it;
    }
  }
  session.updated_at = now;
  if (session.participants.empty()) {
    sessions_.erase(it);
  }
  return CollabError::kNone;
}

std::optional<SessionState> CollaborationService::GetSession(const std::string& workflow_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CollabError CollaborationService::UpdatePresence(const std::string& workflow_id, const std::string& user_id,
                                                 const std::optional<nlohmann::json>& cursor,
                                                 const std::optional<nlohmann::json>& selection) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return CollabError::kSessionNotFound;
  }
  auto participant_it = it->second.participants.find(user_id);
  if (participant_it == it->second.participants.end()) {
    return CollabError::kParticipantNotFound;
  }
  auto& presence = participant_it->second;
  if (cursor) {
    presence.cursor = *cursor;
  }
  if (selection) {
    presence.selection = *selection;
  }
  presence.last_seen = now;
  it->second.updated_at = now;
  return CollabError::kNone;
}

LockResult CollaborationService::AcquireLock(const std::string& workflow_id, const std::string& user_id,
                                             const std::string& element_id, ElementType element_type) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return LockResult{CollabError::kSessionNotFound, std::nullopt};
  }
  auto& session = it->second;
  auto participant_it = session.participants.find(user_id);
  if (participant_it == session.participants.end()) {
    return LockResult{CollabError::kParticipantNotFound, std::nullopt};
  }

  auto lock_it = session.locks.find(element_id);
  if (lock_it != session.locks.end() && lock_it->second.user_id != user_id) {
    return LockResult{CollabError::kAlreadyLocked, lock_it->second};
  }

  // 같은 소유자의 재획득은 소유권을 유지한 채 시각만 갱신한다.
  EditLock& held = session.locks[element_id];
  held.element_id = element_id;
  held.element_type = element_type;
  held.user_id = user_id;
  held.user_name = participant_it->second.user_name;
  held.acquired_at = now;
  participant_it->second.last_seen = now;
  session.updated_at = now;
  return LockResult{CollabError::kNone, held};
}

CollabError CollaborationService::ReleaseLock(const std::string& workflow_id, const std::string& user_id,
                                              const std::string& element_id) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return CollabError::kSessionNotFound;
  }
  auto& session = it->second;
  auto lock_it = session.locks.find(element_id);
  if (lock_it == session.locks.end()) {
    return CollabError::kLockNotFound;
  }
  if (lock_it->second.user_id != user_id) {
    return CollabError::kNotOwner;
  }
  session.locks.erase(lock_it);
  session.updated_at = now;
  return CollabError::kNone;
}

std::vector<Presence> CollaborationService::GetActiveUsers(const std::string& workflow_id) const {
  std::vector<Presence> users;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return users;
  }
  users.reserve(it->second.participants.size());
  for (const auto& [user_id, presence] : it->second.participants) {
    users.push_back(presence);
  }
  return users;
}

std::vector<EditLock> CollaborationService::GetActiveLocks(const std::string& workflow_id) const {
  std::vector<EditLock> locks;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return locks;
  }
  locks.reserve(it->second.locks.size());
  for (const auto& [element_id, edit_lock] : it->second.locks) {
    locks.push_back(edit_lock);
  }
  return locks;
}

void CollaborationService::Touch(const std::string& workflow_id, const std::string& user_id) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end()) {
    return;
  }
  auto participant_it = it->second.participants.find(user_id);
  if (participant_it == it->second.participants.end()) {
    return;
  }
  participant_it->second.last_seen = now;
  it->second.updated_at = now;
}

std::vector<std::string> CollaborationService::IdleSessionIds(std::chrono::seconds max_idle) const {
  const auto cutoff = clock_() - max_idle;
  std::vector<std::string> ids;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [workflow_id, session] : sessions_) {
    if (session.updated_at < cutoff) {
      ids.push_back(workflow_id);
    }
  }
  return ids;
}

std::optional<SessionState> CollaborationService::RemoveIdleSession(const std::string& workflow_id,
                                                                    std::chrono::seconds max_idle) {
  const auto cutoff = clock_() - max_idle;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end() || !(it->second.updated_at < cutoff)) {
    return std::nullopt;
  }
  SessionState removed = std::move(it->second);
  sessions_.erase(it);
  return removed;
}

std::size_t CollaborationService::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::size_t CollaborationService::ActiveLockCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [workflow_id, session] : sessions_) {
    count += session.locks.size();
  }
  return count;
}

}  // namespace collab
