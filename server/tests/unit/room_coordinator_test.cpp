#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "collab/collaboration_service.hpp"
#include "collab/connection.hpp"
#include "collab/observability.hpp"
#include "collab/room_coordinator.hpp"
#include "collab/transport_hub.hpp"

namespace {

class RecordingConnection : public collab::Connection {
 public:
  RecordingConnection(std::string id, collab::ClientIdentity identity, std::size_t max_queue,
                      std::shared_ptr<collab::Observability> observability)
      : Connection(std::move(id), std::move(identity), max_queue, std::move(observability)) {}

  void Close() override { MarkClosed(); }

  std::vector<nlohmann::json> Received() {
    std::vector<nlohmann::json> messages;
    for (const auto& raw : TakeQueued()) {
      messages.push_back(nlohmann::json::parse(raw));
    }
    return messages;
  }

 protected:
  void OnEnqueued() override {}
};

using ConnectionPtr = std::shared_ptr<RecordingConnection>;

std::vector<std::string> Types(const std::vector<nlohmann::json>& messages) {
  std::vector<std::string> types;
  for (const auto& msg : messages) {
    types.push_back(msg["type"].get<std::string>());
  }
  return types;
}

void ExpectWsMessage(const nlohmann::json& msg, const std::string& type) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["type"], type);
  ASSERT_TRUE(msg.contains("payload"));
  EXPECT_TRUE(msg["payload"].is_object());
  EXPECT_TRUE(msg["timestamp"].is_string());
}

void ExpectWsError(const nlohmann::json& msg, const std::string& code) {
  ExpectWsMessage(msg, "error");
  EXPECT_EQ(msg["payload"]["code"], code);
  EXPECT_TRUE(msg["payload"]["message"].is_string());
}

class RoomCoordinatorFixture : public ::testing::Test {
 protected:
  void SetUp() override { Build(10); }

  void Build(std::size_t max_connections) {
    observability_ = std::make_shared<collab::Observability>(collab::LogLevel::kError);
    hub_ = std::make_shared<collab::TransportHub>();
    hub_->SetObservability(observability_);
    service_ = std::make_shared<collab::CollaborationService>([this]() { return now_; });
    coordinator_ = std::make_shared<collab::RoomCoordinator>(hub_, service_, observability_, max_connections);
  }

  ConnectionPtr MakeConnection(const std::string& user_id, const std::string& workflow_id = "wf-1",
                               std::size_t max_queue = 64) {
    auto id = "conn-" + std::to_string(++next_id_);
    return std::make_shared<RecordingConnection>(
        id, collab::ClientIdentity{"tenant-1", user_id, user_id + "-name", workflow_id}, max_queue, observability_);
  }

  ConnectionPtr Join(const std::string& user_id, std::size_t max_queue = 64) {
    auto conn = MakeConnection(user_id, "wf-1", max_queue);
    EXPECT_TRUE(coordinator_->Attach(conn));
    return conn;
  }

  void Send(const ConnectionPtr& conn, const std::string& type, const nlohmann::json& payload) {
    nlohmann::json envelope{{"type", type}, {"payload", payload}};
    coordinator_->HandleMessage(conn, envelope.dump());
  }

  void DrainAll(std::initializer_list<ConnectionPtr> connections) {
    for (const auto& conn : connections) {
      conn->Received();
    }
  }

  void Advance(std::chrono::seconds delta) { now_ += delta; }

  std::chrono::system_clock::time_point now_{std::chrono::system_clock::time_point{} +
                                             std::chrono::hours(24 * 365 * 50)};
  std::shared_ptr<collab::Observability> observability_;
  std::shared_ptr<collab::TransportHub> hub_;
  std::shared_ptr<collab::CollaborationService> service_;
  std::shared_ptr<collab::RoomCoordinator> coordinator_;
  int next_id_{0};
};

}  // namespace

TEST_F(RoomCoordinatorFixture, AttachSyncsJoinerAndAnnouncesToOthers) {
  auto alice = Join("alice");
  auto alice_msgs = alice->Received();
  ASSERT_EQ(alice_msgs.size(), 1u);
  ExpectWsMessage(alice_msgs[0], "user_joined");
  ASSERT_TRUE(alice_msgs[0]["payload"].contains("session"));
  EXPECT_EQ(alice_msgs[0]["payload"]["session"]["workflowId"], "wf-1");

  auto bob = Join("bob");
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  const auto& participants = bob_msgs[0]["payload"]["session"]["participants"];
  EXPECT_TRUE(participants.contains("alice"));
  EXPECT_TRUE(participants.contains("bob"));

  alice_msgs = alice->Received();
  ASSERT_EQ(alice_msgs.size(), 1u);
  ExpectWsMessage(alice_msgs[0], "user_joined");
  EXPECT_EQ(alice_msgs[0]["payload"]["user"]["userId"], "bob");
  EXPECT_EQ(alice_msgs[0]["payload"]["user"]["userName"], "bob-name");
  EXPECT_EQ(hub_->GetClientCount(collab::RoomCoordinator::RoomName("wf-1")), 2u);
}

TEST_F(RoomCoordinatorFixture, ExplicitJoinResyncsSession) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  Send(alice, "join", nlohmann::json::object());
  auto alice_msgs = alice->Received();
  ASSERT_EQ(alice_msgs.size(), 1u);
  EXPECT_TRUE(alice_msgs[0]["payload"].contains("session"));
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  EXPECT_EQ(bob_msgs[0]["payload"]["user"]["userId"], "alice");
  EXPECT_EQ(service_->GetActiveUsers("wf-1").size(), 2u);
}

TEST_F(RoomCoordinatorFixture, LockContentionScenario) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  Send(alice, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  for (const auto& conn : {alice, bob}) {
    auto msgs = conn->Received();
    ASSERT_EQ(msgs.size(), 1u);
    ExpectWsMessage(msgs[0], "lock_acquired");
    EXPECT_EQ(msgs[0]["payload"]["elementId"], "n1");
    EXPECT_EQ(msgs[0]["payload"]["elementType"], "node");
    EXPECT_EQ(msgs[0]["payload"]["userId"], "alice");
  }

  Send(bob, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  ExpectWsMessage(bob_msgs[0], "lock_failed");
  EXPECT_EQ(bob_msgs[0]["payload"]["elementId"], "n1");
  EXPECT_EQ(bob_msgs[0]["payload"]["reason"], "already_locked");
  EXPECT_EQ(bob_msgs[0]["payload"]["currentLock"]["userId"], "alice");
  EXPECT_TRUE(alice->Received().empty());
  EXPECT_EQ(observability_->Snapshot(0, 0).lock_conflicts, 1u);

  Send(alice, "lock_release", {{"elementId", "n1"}, {"elementType", "node"}});
  for (const auto& conn : {alice, bob}) {
    auto msgs = conn->Received();
    ASSERT_EQ(msgs.size(), 1u);
    ExpectWsMessage(msgs[0], "lock_released");
    EXPECT_EQ(msgs[0]["payload"]["elementId"], "n1");
  }

  Send(bob, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  for (const auto& conn : {alice, bob}) {
    auto msgs = conn->Received();
    ASSERT_EQ(msgs.size(), 1u);
    ExpectWsMessage(msgs[0], "lock_acquired");
    EXPECT_EQ(msgs[0]["payload"]["userId"], "bob");
  }
}

TEST_F(RoomCoordinatorFixture, NonOwnerReleaseIsReportedToRequesterOnly) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Send(alice, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  DrainAll({alice, bob});

  Send(bob, "lock_release", {{"elementId", "n1"}});
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  ExpectWsError(bob_msgs[0], "not_lock_owner");
  EXPECT_TRUE(alice->Received().empty());
  EXPECT_EQ(service_->ActiveLockCount(), 1u);

  // 잠기지 않은 요소 해제는 조용히 무시된다.
  Send(bob, "lock_release", {{"elementId", "n2"}});
  EXPECT_TRUE(bob->Received().empty());
  EXPECT_TRUE(alice->Received().empty());
}

TEST_F(RoomCoordinatorFixture, InvalidLockInputIsDropped) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  Send(alice, "lock_acquire", {{"elementId", "n1"}, {"elementType", "group"}});
  Send(alice, "lock_acquire", {{"elementId", "n1; DROP"}, {"elementType", "node"}});
  Send(alice, "lock_acquire", {{"elementId", std::string(257, 'a')}, {"elementType", "node"}});
  Send(alice, "lock_acquire", {{"elementType", "node"}});
  Send(alice, "lock_release", {{"elementId", ""}});
  Send(alice, "lock_acquire", nlohmann::json::array({1, 2}));

  EXPECT_TRUE(alice->Received().empty());
  EXPECT_TRUE(bob->Received().empty());
  EXPECT_EQ(service_->ActiveLockCount(), 0u);
}

TEST_F(RoomCoordinatorFixture, ChangeIsNeverEchoedToSender) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  DrainAll({alice, bob, carol});

  nlohmann::json change{{"op", "move_node"}, {"nodeId", "n1"}, {"position", {{"x", 5}, {"y", 7}}}};
  Send(alice, "change", change);

  EXPECT_TRUE(alice->Received().empty());
  for (const auto& conn : {bob, carol}) {
    auto msgs = conn->Received();
    ASSERT_EQ(msgs.size(), 1u);
    ExpectWsMessage(msgs[0], "change_applied");
    EXPECT_EQ(msgs[0]["payload"], change);
  }
}

TEST_F(RoomCoordinatorFixture, PresenceGoesToOthersWithSenderId) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  Send(alice, "presence", {{"cursor", {{"x", 1}, {"y", 2}}}, {"userId", "spoofed"}});
  EXPECT_TRUE(alice->Received().empty());
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  ExpectWsMessage(bob_msgs[0], "presence_update");
  EXPECT_EQ(bob_msgs[0]["payload"]["userId"], "alice");
  EXPECT_EQ(bob_msgs[0]["payload"]["cursor"]["x"], 1);

  auto users = service_->GetActiveUsers("wf-1");
  ASSERT_EQ(users.size(), 2u);
  EXPECT_EQ(users[0].cursor["y"], 2);
}

TEST_F(RoomCoordinatorFixture, ProtocolErrorsGoOnlyToSender) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  coordinator_->HandleMessage(alice, "{broken");
  Send(alice, "teleport", nlohmann::json::object());
  Send(alice, "lock_acquired", {{"elementId", "n1"}});
  Send(alice, "presence", "not-an-object");

  auto alice_msgs = alice->Received();
  ASSERT_EQ(alice_msgs.size(), 4u);
  ExpectWsError(alice_msgs[0], "bad_request");
  ExpectWsError(alice_msgs[1], "unknown_type");
  ExpectWsError(alice_msgs[2], "unknown_type");
  ExpectWsError(alice_msgs[3], "bad_request");
  EXPECT_TRUE(bob->Received().empty());
}

TEST_F(RoomCoordinatorFixture, DisconnectMatchesExplicitLeave) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Send(alice, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  Send(bob, "lock_acquire", {{"elementId", "e1"}, {"elementType", "edge"}});
  DrainAll({alice, bob, carol});

  Send(alice, "leave", nlohmann::json::object());
  auto after_leave = carol->Received();

  coordinator_->Detach(bob);
  auto after_disconnect = carol->Received();

  EXPECT_EQ(Types(after_leave), Types(after_disconnect));
  ASSERT_EQ(after_leave.size(), 2u);
  EXPECT_EQ(after_leave[0]["type"], "lock_released");
  EXPECT_EQ(after_leave[0]["payload"]["elementId"], "n1");
  EXPECT_EQ(after_leave[1]["type"], "user_left");
  EXPECT_EQ(after_leave[1]["payload"]["userId"], "alice");
  EXPECT_EQ(after_disconnect[0]["payload"]["elementId"], "e1");
  EXPECT_EQ(after_disconnect[1]["payload"]["userId"], "bob");
  EXPECT_EQ(service_->ActiveLockCount(), 0u);

  // leave 뒤의 연결 종료는 두 번째 user_left를 만들지 않는다.
  coordinator_->Detach(alice);
  EXPECT_TRUE(carol->Received().empty());
  EXPECT_EQ(hub_->GetClientCount(collab::RoomCoordinator::RoomName("wf-1")), 1u);
}

TEST_F(RoomCoordinatorFixture, DetachIsIdempotent) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  DrainAll({alice, bob});

  coordinator_->Detach(alice);
  coordinator_->Detach(alice);
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  EXPECT_EQ(bob_msgs[0]["type"], "user_left");

  coordinator_->Detach(bob);
  EXPECT_EQ(service_->ActiveSessionCount(), 0u);
  EXPECT_EQ(hub_->RoomCount(), 0u);
  EXPECT_EQ(hub_->ActiveConnections(), 0u);
}

TEST_F(RoomCoordinatorFixture, CeilingRejectsBeforeRegistration) {
  Build(2);
  auto alice = Join("alice");
  auto bob = Join("bob");
  EXPECT_EQ(coordinator_->Admit("wf-1"), collab::AdmissionStatus::kRoomFull);
  EXPECT_EQ(coordinator_->Admit("wf-2"), collab::AdmissionStatus::kAccepted);

  auto carol = MakeConnection("carol");
  EXPECT_FALSE(coordinator_->Attach(carol));
  EXPECT_EQ(hub_->ActiveConnections(), 2u);
  EXPECT_EQ(hub_->GetClientCount(collab::RoomCoordinator::RoomName("wf-1")), 2u);
  EXPECT_EQ(service_->GetActiveUsers("wf-1").size(), 2u);
  EXPECT_TRUE(carol->Received().empty());

  // 자리가 나면 다시 들어올 수 있다.
  coordinator_->Detach(bob);
  EXPECT_EQ(coordinator_->Admit("wf-1"), collab::AdmissionStatus::kAccepted);
  EXPECT_TRUE(coordinator_->Attach(carol));
}

TEST_F(RoomCoordinatorFixture, InvalidWorkflowIdIsRejected) {
  EXPECT_EQ(coordinator_->Admit("wf/../etc"), collab::AdmissionStatus::kInvalidWorkflowId);
  EXPECT_EQ(coordinator_->Admit(""), collab::AdmissionStatus::kInvalidWorkflowId);
  auto conn = MakeConnection("alice", "bad id");
  EXPECT_FALSE(coordinator_->Attach(conn));
  EXPECT_EQ(hub_->ActiveConnections(), 0u);
  EXPECT_EQ(service_->ActiveSessionCount(), 0u);
}

TEST_F(RoomCoordinatorFixture, SlowConsumerDoesNotBlockOthers) {
  auto alice = Join("alice");
  auto slow = Join("bob", 3);
  auto fast = Join("carol");
  DrainAll({alice, slow, fast});

  for (int i = 0; i < 10; ++i) {
    Send(alice, "change", {{"seq", i}});
  }

  EXPECT_EQ(slow->Received().size(), 3u);
  EXPECT_EQ(slow->DroppedCount(), 7u);
  auto fast_msgs = fast->Received();
  ASSERT_EQ(fast_msgs.size(), 10u);
  EXPECT_EQ(fast_msgs[9]["payload"]["seq"], 9);
  EXPECT_EQ(observability_->Snapshot(0, 0).messages_dropped, 7u);
}

TEST(RoomCoordinatorValidationTest, IdAllowList) {
  EXPECT_TRUE(collab::RoomCoordinator::IsValidId("node_1-A"));
  EXPECT_TRUE(collab::RoomCoordinator::IsValidId(std::string(256, 'x')));
  EXPECT_FALSE(collab::RoomCoordinator::IsValidId(std::string(257, 'x')));
  EXPECT_FALSE(collab::RoomCoordinator::IsValidId(""));
  EXPECT_FALSE(collab::RoomCoordinator::IsValidId("n 1"));
  EXPECT_FALSE(collab::RoomCoordinator::IsValidId("n1<script>"));
  EXPECT_FALSE(collab::RoomCoordinator::IsValidId("노드"));
  EXPECT_EQ(collab::RoomCoordinator::RoomName("wf-9"), "collaboration:wf-9");
}

TEST_F(RoomCoordinatorFixture, CleanupKeepsRoomsWithConnectedClients) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Send(alice, "lock_acquire", {{"elementId", "n1"}, {"elementType", "node"}});
  DrainAll({alice, bob});

  // 편집만 오가는 31분 동안에도 세션은 살아 있어야 한다.
  for (int minute = 0; minute < 31; ++minute) {
    Advance(std::chrono::minutes(1));
    Send(alice, "change", {{"minute", minute}});
    Send(bob, "change", {{"minute", minute}});
  }
  DrainAll({alice, bob});
  EXPECT_EQ(coordinator_->CleanupInactiveSessions(std::chrono::minutes(30)), 0u);

  // 아무 메시지가 없어도 연결이 남아 있으면 제거하지 않는다.
  Advance(std::chrono::hours(2));
  EXPECT_EQ(coordinator_->CleanupInactiveSessions(std::chrono::minutes(30)), 0u);
  EXPECT_EQ(service_->ActiveLockCount(), 1u);
  EXPECT_TRUE(bob->Received().empty());

  Send(bob, "lock_acquire", {{"elementId", "n2"}, {"elementType", "edge"}});
  auto bob_msgs = bob->Received();
  ASSERT_EQ(bob_msgs.size(), 1u);
  ExpectWsMessage(bob_msgs[0], "lock_acquired");
  EXPECT_EQ(bob_msgs[0]["payload"]["userId"], "bob");

  Send(alice, "lock_release", {{"elementId", "n1"}});
  auto released = bob->Received();
  ASSERT_EQ(released.size(), 1u);
  ExpectWsMessage(released[0], "lock_released");
  EXPECT_EQ(released[0]["payload"]["elementId"], "n1");
}

TEST_F(RoomCoordinatorFixture, CleanupRemovesIdleSessionsWithoutConnections) {
  auto alice = Join("alice");
  service_->JoinSession("wf-orphan", "ghost", "Ghost");
  ASSERT_TRUE(service_->AcquireLock("wf-orphan", "ghost", "n1", collab::ElementType::kNode).ok());

  Advance(std::chrono::minutes(31));
  EXPECT_EQ(coordinator_->CleanupInactiveSessions(std::chrono::minutes(30)), 1u);
  EXPECT_FALSE(service_->GetSession("wf-orphan").has_value());
  EXPECT_TRUE(service_->GetSession("wf-1").has_value());
  EXPECT_EQ(service_->ActiveSessionCount(), 1u);
  EXPECT_EQ(coordinator_->CleanupInactiveSessions(std::chrono::minutes(30)), 0u);
}
