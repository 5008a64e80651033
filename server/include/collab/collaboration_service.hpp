/*
 * 설명: 워크플로별 협업 세션(참가자 프레즌스, 요소 편집 락)의 상태 전이를 관리한다. I/O는 하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_service_test.cpp, server/tests/it/concurrent_lock_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace collab {

enum class ElementType { kNode, kEdge };

std::string_view ToString(ElementType type);
std::optional<ElementType> ParseElementType(std::string_view value);

enum class CollabError {
  kNone,
  kSessionNotFound,
  kParticipantNotFound,
  kAlreadyLocked,
  kNotOwner,
  kLockNotFound,
};

std::string_view ToString(CollabError error);

struct Presence {
  std::string user_id;
  std::string user_name;
  std::string color;
  // 서비스는 내용을 해석하지 않는다. 설정되기 전에는 null.
  nlohmann::json cursor;
  nlohmann::json selection;
  std::chrono::system_clock::time_point joined_at;
  std::chrono::system_clock::time_point last_seen;
};

struct EditLock {
  std::string element_id;
  ElementType element_type{ElementType::kNode};
  std::string user_id;
  std::string user_name;
  std::chrono::system_clock::time_point acquired_at;
};

struct SessionState {
  std::string workflow_id;
  std::map<std::string, Presence> participants;
  std::map<std::string, EditLock> locks;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct LockResult {
  CollabError error{CollabError::kNone};
  // 성공 시 획득한 락, kAlreadyLocked일 때는 현재 소유자의 락.
  std::optional<EditLock> lock;

  bool ok() const { return error == CollabError::kNone; }
};

nlohmann::json ToJson(const Presence& presence);
nlohmann::json ToJson(const EditLock& lock);
nlohmann::json ToJson(const SessionState& state);

inline constexpr std::string_view kParticipantColors[] = {
    "#3B82F6", "#10B981", "#F59E0B", "#EF4444", "#8B5CF6",
    "#EC4899", "#14B8A6", "#F97316", "#6366F1", "#84CC16",
};

class CollaborationService {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  CollaborationService();
  explicit CollaborationService(Clock clock);

  // 멱등. 세션이 없으면 만들고 참가자 프레즌스를 갱신해 돌려준다.
  Presence JoinSession(const std::string& workflow_id, const std::string& user_id, const std::string& user_name);

  // 참가자를 제거하고 그가 가진 락을 모두 해제한다. 해제된 락은 released_locks에 담긴다.
  // 마지막 참가자가 나가면 세션도 제거된다.
  CollabError LeaveSession(const std::string& workflow_id, const std::string& user_id,
                           std::vector<EditLock>& released_locks);

  std::optional<SessionState> GetSession(const std::string& workflow_id) const;

  // 값이 주어진 필드만 덮어쓴다.
  CollabError UpdatePresence(const std::string& workflow_id, const std::string& user_id,
                             const std::optional<nlohmann::json>& cursor,
                             const std::optional<nlohmann::json>& selection);

  LockResult AcquireLock(const std::string& workflow_id, const std::string& user_id, const std::string& element_id,
                         ElementType element_type);
  CollabError ReleaseLock(const std::string& workflow_id, const std::string& user_id, const std::string& element_id);

  std::vector<Presence> GetActiveUsers(const std::string& workflow_id) const;
  std::vector<EditLock> GetActiveLocks(const std::string& workflow_id) const;

  // 참가자의 마지막 활동 시각만 갱신한다. 세션이나 참가자가 없으면 아무것도 하지 않는다.
  void Touch(const std::string& workflow_id, const std::string& user_id);

  // 마지막 활동이 max_idle보다 오래된 세션 ID 목록.
  std::vector<std::string> IdleSessionIds(std::chrono::seconds max_idle) const;

  // 잠금 안에서 유휴 여부를 다시 확인하고 제거한다. 제거된 세션(락 포함)을 돌려준다.
  std::optional<SessionState> RemoveIdleSession(const std::string& workflow_id, std::chrono::seconds max_idle);

  std::size_t ActiveSessionCount() const;
  std::size_t ActiveLockCount() const;

 private:
  Clock clock_;
  std::unordered_map<std::string, SessionState> sessions_;
  mutable std::mutex mutex_;
};

}  // namespace collab
