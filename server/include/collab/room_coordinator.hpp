/*
 * 설명: 협업 프로토콜 메시지를 서비스 호출로 변환하고 결과 이벤트를 룸에 브로드캐스트한다.
 *       입장 제한과 입력 검증도 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp, server/tests/e2e/collaboration_flow_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "collab/collaboration_service.hpp"
#include "collab/connection.hpp"
#include "collab/observability.hpp"
#include "collab/transport_hub.hpp"

namespace collab {

enum class AdmissionStatus { kAccepted, kInvalidWorkflowId, kRoomFull };

class RoomCoordinator {
 public:
  RoomCoordinator(std::shared_ptr<TransportHub> hub, std::shared_ptr<CollaborationService> service,
                  std::shared_ptr<Observability> observability, std::size_t max_connections_per_workflow);

  // 허브 등록 전에 호출한다. 거부 시 아무 상태도 남기지 않는다.
  AdmissionStatus Admit(const std::string& workflow_id) const;

  // 허브 등록, 룸 구독, 세션 입장까지 수행한다. 정원 초과 경합에서 지면 등록을 되돌리고 false.
  bool Attach(const std::shared_ptr<Connection>& connection);

  // 수신 텍스트 프레임 하나를 처리한다.
  void HandleMessage(const std::shared_ptr<Connection>& connection, std::string_view data);

  // 멱등. 두 번째 이후 호출은 아무것도 하지 않는다.
  void Detach(const std::shared_ptr<Connection>& connection);

  // 유휴 세션 중 룸에 연결이 하나도 없는 것만 제거하고 그 수를 반환한다.
  std::size_t CleanupInactiveSessions(std::chrono::seconds max_idle);

  static bool IsValidId(std::string_view id);
  static std::string RoomName(const std::string& workflow_id);

 private:
  void HandleJoin(const std::shared_ptr<Connection>& connection);
  void HandleLeave(const ClientIdentity& identity);
  void HandlePresence(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload);
  void HandleLockAcquire(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload);
  void HandleLockRelease(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload);
  void HandleChange(const std::shared_ptr<Connection>& connection, const nlohmann::json& payload);
  void SendError(const std::shared_ptr<Connection>& connection, std::string_view code, std::string_view message);
  void Log(LogLevel level, std::string name, const ClientIdentity& identity, nlohmann::json detail = nullptr) const;
  std::mutex& RoomMutex(const std::string& workflow_id);

  std::shared_ptr<TransportHub> hub_;
  std::shared_ptr<CollaborationService> service_;
  std::shared_ptr<Observability> observability_;
  std::size_t max_connections_per_workflow_;
  // 같은 워크플로의 상태 변경과 그 브로드캐스트는 이 잠금 안에서 함께 일어난다.
  std::array<std::mutex, 64> room_mutexes_;
};

}  // namespace collab
