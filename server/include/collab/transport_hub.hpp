/*
 * 설명: 프로세스 전역 연결 레지스트리와 룸 단위 팬아웃을 제공한다. 협업 의미론과 무관하다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transport_hub_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "collab/connection.hpp"
#include "collab/observability.hpp"

namespace collab {

class TransportHub {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Register(const std::shared_ptr<Connection>& connection);

  // 모든 룸에서 빼고 레지스트리에서 제거한다. 등록되어 있지 않았으면 false.
  bool Unregister(const Connection& connection);

  // 멱등. max_subscribers가 0이 아니면 룸이 그 수에 도달했을 때 거부한다.
  // 등록되지 않은 연결도 거부한다.
  bool Subscribe(const std::shared_ptr<Connection>& connection, const std::string& room,
                 std::size_t max_subscribers = 0);
  void Unsubscribe(const Connection& connection, const std::string& room);

  // 전달에 성공한(큐에 들어간) 연결 수를 반환한다. 느린 연결은 메시지를 잃을 뿐 호출자를 막지 않는다.
  std::size_t Broadcast(const std::string& room, const std::string& message);
  std::size_t BroadcastToUser(const std::string& room, const std::string& user_id, const std::string& message);
  std::size_t BroadcastToOthers(const std::string& room, const std::string& exclude_user_id,
                                const std::string& message);

  // 등록된 모든 연결에 Close()를 요청하고 그 수를 반환한다. 실제 정리는 각 연결의 Detach로 이어진다.
  std::size_t CloseAll();

  std::size_t GetClientCount(const std::string& room) const;
  std::size_t ActiveConnections() const;
  std::size_t RoomCount() const;

 private:
  struct Entry {
    std::weak_ptr<Connection> connection;
    std::unordered_set<std::string> rooms;
  };

  std::size_t Deliver(const std::string& room, const std::string& message,
                      const std::function<bool(const Connection&)>& filter);
  void PublishActiveCount();

  // connection id -> entry
  std::unordered_map<std::string, Entry> connections_;
  // room -> connection id -> connection
  std::unordered_map<std::string, std::unordered_map<std::string, std::weak_ptr<Connection>>> rooms_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace collab
