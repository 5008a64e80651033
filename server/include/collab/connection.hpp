/*
 * 설명: 인증된 클라이언트 연결 하나의 식별 정보와 유한 송신 큐를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transport_hub_test.cpp, server/tests/unit/room_coordinator_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "collab/observability.hpp"

namespace collab {

// 게이트웨이가 인증을 마치고 넘겨주는 신원 정보.
struct ClientIdentity {
  std::string tenant_id;
  std::string user_id;
  std::string user_name;
  std::string workflow_id;
};

struct ConnectionLimits {
  std::size_t max_queue_messages{256};
  std::size_t max_message_bytes{512 * 1024};
  std::chrono::seconds read_timeout{60};
  std::chrono::seconds write_timeout{10};
  std::chrono::seconds ping_interval{54};
};

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(std::string id, ClientIdentity identity, std::size_t max_queue_messages,
             std::shared_ptr<Observability> observability);
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& Id() const { return id_; }
  const ClientIdentity& Identity() const { return identity_; }

  // 블로킹하지 않는다. 큐가 가득 찼거나 닫힌 연결이면 메시지를 버리고 false를 반환한다.
  bool Enqueue(std::string message);

  std::size_t QueuedCount() const;
  std::uint64_t DroppedCount() const { return dropped_.load(); }

  bool IsClosed() const { return closed_.load(); }

  // 연결을 닫는다. 구현체는 여러 번 호출되어도 안전해야 한다.
  virtual void Close() = 0;

 protected:
  // 최초 호출에서만 true를 반환한다. 종료 정리를 한 번만 실행하기 위한 관문이다.
  bool MarkClosed();

  // 큐에 쌓인 메시지를 모두 꺼낸다.
  std::vector<std::string> TakeQueued();

  // Enqueue 성공 직후 호출된다. 호출 스레드는 임의의 스레드일 수 있다.
  virtual void OnEnqueued() = 0;

  const std::shared_ptr<Observability>& GetObservability() const { return observability_; }

 private:
  std::string id_;
  ClientIdentity identity_;
  std::size_t max_queue_messages_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::deque<std::string> queue_;
  std::atomic<bool> closed_{false};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace collab
