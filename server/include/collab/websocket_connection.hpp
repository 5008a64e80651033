/*
 * 설명: Beast WebSocket 스트림 위에서 읽기/쓰기 루프, 핑, 읽기/쓰기 데드라인을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/connection.hpp"
#include "collab/observability.hpp"

namespace collab {

class RoomCoordinator;

class WebSocketConnection : public Connection {
 public:
  WebSocketConnection(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string id,
                      ClientIdentity identity, const ConnectionLimits& limits,
                      std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<Observability> observability);

  // 업그레이드가 끝난 스트림의 스트랜드 위에서 호출해야 한다.
  void Run();
  void Close() override;

 protected:
  void OnEnqueued() override;

 private:
  std::shared_ptr<WebSocketConnection> Self();

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void WriteNext();
  void SendPing();
  void OnWrite(boost::beast::error_code ec);
  void ArmReadDeadline();
  void ArmWriteDeadline();
  void SchedulePing();
  void Reject();
  void Teardown(std::string_view reason, boost::beast::error_code ec);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ConnectionLimits limits_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  boost::asio::steady_timer read_deadline_;
  boost::asio::steady_timer write_deadline_;
  boost::asio::steady_timer ping_timer_;
  std::string in_flight_;
  bool writing_{false};
  bool ping_pending_{false};
};

}  // namespace collab
