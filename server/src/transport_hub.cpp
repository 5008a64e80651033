/*
 * 설명: 연결 레지스트리와 룸 구독을 관리하고 룸 단위로 메시지를 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transport_hub_test.cpp
 */
#include "collab/transport_hub.hpp"

#include <vector>

namespace collab {

void TransportHub::Register(const std::shared_ptr<Connection>& connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = connections_[connection->Id()];
    entry.connection = connection;
  }
  PublishActiveCount();
}

bool TransportHub::Unregister(const Connection& connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection.Id());
    if (it == connections_.end()) {
      return false;
    }
    for (const auto& room : it->second.rooms) {
      auto room_it = rooms_.find(room);
      if (room_it == rooms_.end()) {
        continue;
      }
      room_it->second.erase(connection.Id());
      if (room_it->second.empty()) {
        rooms_.erase(room_it);
      }
    }
    connections_.erase(it);
  }
  PublishActiveCount();
  return true;
}

bool TransportHub::Subscribe(const std::shared_ptr<Connection>& connection, const std::string& room,
                             std::size_t max_subscribers) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection->Id());
  if (it == connections_.end()) {
    return false;
  }
  auto& members = rooms_[room];
  if (members.count(connection->Id()) > 0) {
    return true;
  }
  if (max_subscribers != 0 && members.size() >= max_subscribers) {
    if (members.empty()) {
      rooms_.erase(room);
    }
    return false;
  }
  members.emplace(connection->Id(), connection);
  it->second.rooms.insert(room);
  return true;
}

void TransportHub::Unsubscribe(const Connection& connection, const std::string& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection.Id());
  if (it != connections_.end()) {
    it->second.rooms.erase(room);
  }
  auto room_it = rooms_.find(room);
  if (room_it == rooms_.end()) {
    return;
  }
  room_it->second.erase(connection.Id());
  if (room_it->second.empty()) {
    rooms_.erase(room_it);
  }
}

std::size_t TransportHub::Broadcast(const std::string& room, const std::string& message) {
  return Deliver(room, message, [](const Connection&) { return true; });
}

std::size_t TransportHub::BroadcastToUser(const std::string& room, const std::string& user_id,
                                          const std::string& message) {
  return Deliver(room, message,
                 [&user_id](const Connection& connection) { return connection.Identity().user_id == user_id; });
}

std::size_t TransportHub::BroadcastToOthers(const std::string& room, const std::string& exclude_user_id,
                                            const std::string& message) {
  return Deliver(room, message, [&exclude_user_id](const Connection& connection) {
    return connection.Identity().user_id != exclude_user_id;
  });
}

std::size_t TransportHub::Deliver(const std::string& room, const std::string& message,
                                  const std::function<bool(const Connection&)>& filter) {
  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room);
    if (room_it == rooms_.end()) {
      return 0;
    }
    targets.reserve(room_it->second.size());
    for (const auto& [id, weak] : room_it->second) {
      auto connection = weak.lock();
      if (connection && filter(*connection)) {
        targets.push_back(std::move(connection));
      }
    }
  }
  // 연결 큐 락은 레지스트리 락을 놓은 뒤에만 잡는다.
  std::size_t delivered = 0;
  for (const auto& connection : targets) {
    if (connection->Enqueue(message)) {
      ++delivered;
    }
  }
  return delivered;
}

std::size_t TransportHub::GetClientCount(const std::string& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room);
  return room_it == rooms_.end() ? 0 : room_it->second.size();
}

std::size_t TransportHub::CloseAll() {
  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(connections_.size());
    for (const auto& [id, entry] : connections_) {
      if (auto conn = entry.connection.lock()) {
        targets.push_back(std::move(conn));
      }
    }
  }
  for (const auto& conn : targets) {
    conn->Close();
  }
  return targets.size();
}

std::size_t TransportHub::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t TransportHub::RoomCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

void TransportHub::PublishActiveCount() {
  if (observability_) {
    observability_->SetWebsocketActive(ActiveConnections());
  }
}

}  // namespace collab
