/*
 * 설명: 협업 서버 전체 수명주기(리스너, 워커 스레드, 비활성 세션 정리 타이머)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "collab/collaboration_service.hpp"
#include "collab/config.hpp"
#include "collab/observability.hpp"
#include "collab/room_coordinator.hpp"
#include "collab/transport_hub.hpp"

namespace collab {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<TransportHub> GetHub() { return hub_; }
  std::shared_ptr<CollaborationService> GetService() { return service_; }
  std::shared_ptr<RoomCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void ScheduleCleanup();
  void OnCleanupTick(const boost::system::error_code& ec);
  void Shutdown();
  void WaitForDrain(std::chrono::steady_clock::time_point deadline);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer cleanup_timer_;
  boost::asio::steady_timer drain_timer_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TransportHub> hub_;
  std::shared_ptr<CollaborationService> service_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
};

}  // namespace collab
