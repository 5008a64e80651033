/*
 * 설명: 게이트웨이가 넘겨준 HTTP 연결을 처리한다. 상태/메트릭 엔드포인트와 협업 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/collaboration_service.hpp"
#include "collab/config.hpp"
#include "collab/connection.hpp"
#include "collab/observability.hpp"
#include "collab/room_coordinator.hpp"
#include "collab/transport_hub.hpp"

namespace collab {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<RoomCoordinator> coordinator,
              std::shared_ptr<TransportHub> hub,
              std::shared_ptr<CollaborationService> service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void HandleWebSocket();
  std::optional<ClientIdentity> ExtractIdentity(const std::string& workflow_id);
  nlohmann::json MetricsJson();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::shared_ptr<TransportHub> hub_;
  std::shared_ptr<CollaborationService> service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

// "/api/v1/workflows/{id}/collaborate" 형태면 id를 돌려준다. 형식 검증은 하지 않는다.
std::optional<std::string> ExtractCollaborationWorkflowId(const std::string& path);

}  // namespace collab
