/*
 * 설명: 연결별 유한 송신 큐. 가득 차면 느린 소비자 정책에 따라 메시지를 버린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transport_hub_test.cpp
 */
#include "collab/connection.hpp"

#include <iterator>
#include <utility>

namespace collab {

Connection::Connection(std::string id, ClientIdentity identity, std::size_t max_queue_messages,
                       std::shared_ptr<Observability> observability)
    : id_(std::move(id)), identity_(std::move(identity)), max_queue_messages_(max_queue_messages),
      observability_(std::move(observability)) {}

bool Connection::Enqueue(std::string message) {
  if (closed_.load()) {
    return false;
  }
  bool accepted = false;
  std::size_t queued = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queued = queue_.size();
    if (queued < max_queue_messages_) {
      queue_.push_back(std::move(message));
      accepted = true;
    }
  }
  if (!accepted) {
    dropped_.fetch_add(1);
    if (observability_) {
      observability_->IncrementDropped();
      observability_->Log(LogContext{.level = LogLevel::kWarn,
                                     .name = "ws.send_queue_full",
                                     .workflow_id = identity_.workflow_id,
                                     .user_id = identity_.user_id,
                                     .connection_id = id_,
                                     .detail = {{"queued", queued}}});
    }
    return false;
  }
  OnEnqueued();
  return true;
}

std::size_t Connection::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool Connection::MarkClosed() {
  bool expected = false;
  return closed_.compare_exchange_strong(expected, true);
}

std::vector<std::string> Connection::TakeQueued() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> drained(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return drained;
}

}  // namespace collab
