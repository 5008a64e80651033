/*
 * 설명: WebSocket 연결 하나의 읽기 루프, 묶음 쓰기, 핑과 데드라인, 종료 정리를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp
 */
#include "collab/websocket_connection.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "collab/room_coordinator.hpp"

namespace collab {
namespace websocket = boost::beast::websocket;

WebSocketConnection::WebSocketConnection(websocket::stream<boost::beast::tcp_stream> ws, std::string id,
                                         ClientIdentity identity, const ConnectionLimits& limits,
                                         std::shared_ptr<RoomCoordinator> coordinator,
                                         std::shared_ptr<Observability> observability)
    : Connection(std::move(id), std::move(identity), limits.max_queue_messages, std::move(observability)),
      ws_(std::move(ws)), limits_(limits), coordinator_(std::move(coordinator)),
      read_deadline_(ws_.get_executor()), write_deadline_(ws_.get_executor()), ping_timer_(ws_.get_executor()) {}

std::shared_ptr<WebSocketConnection> WebSocketConnection::Self() {
  return std::static_pointer_cast<WebSocketConnection>(shared_from_this());
}

void WebSocketConnection::Run() {
  // 데드라인과 핑은 직접 관리한다.
  boost::beast::get_lowest_layer(ws_).expires_never();
  websocket::stream_base::timeout opt{};
  opt.handshake_timeout = websocket::stream_base::none();
  opt.idle_timeout = websocket::stream_base::none();
  opt.keep_alive_pings = false;
  ws_.set_option(opt);
  ws_.read_message_max(limits_.max_message_bytes);
  ws_.control_callback([this](websocket::frame_type kind, boost::beast::string_view) {
    if (kind != websocket::frame_type::close) {
      ArmReadDeadline();
    }
  });

  if (!coordinator_->Attach(Self())) {
    Reject();
    return;
  }
  ArmReadDeadline();
  SchedulePing();
  DoRead();
}

void WebSocketConnection::Close() {
  auto self = Self();
  boost::asio::post(ws_.get_executor(), [self]() { self->Teardown("server_close", {}); });
}

void WebSocketConnection::OnEnqueued() {
  auto self = Self();
  boost::asio::post(ws_.get_executor(), [self]() { self->WriteNext(); });
}

void WebSocketConnection::DoRead() {
  if (IsClosed()) {
    return;
  }
  auto self = Self();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketConnection::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    Teardown(ec == websocket::error::closed ? "peer_closed" : "read_error", ec);
    return;
  }
  if (IsClosed()) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  ArmReadDeadline();
  try {
    coordinator_->HandleMessage(Self(), data);
  } catch (const std::exception& ex) {
    if (const auto& observability = GetObservability()) {
      observability->Log(LogContext{.level = LogLevel::kError,
                                    .name = "ws.handle_failed",
                                    .workflow_id = Identity().workflow_id,
                                    .user_id = Identity().user_id,
                                    .connection_id = Id(),
                                    .detail = {{"error", ex.what()}}});
    }
  }
  DoRead();
}

void WebSocketConnection::WriteNext() {
  if (writing_ || IsClosed()) {
    return;
  }
  auto batch = TakeQueued();
  if (batch.empty()) {
    return;
  }
  // 한 프레임에 대기 메시지를 줄바꿈으로 이어 보낸다.
  in_flight_.clear();
  for (std::size_t i = 0; i < batch.size(); ++i) {
    if (i > 0) {
      in_flight_.push_back('\n');
    }
    in_flight_ += batch[i];
  }
  writing_ = true;
  ws_.text(true);
  ArmWriteDeadline();
  auto self = Self();
  ws_.async_write(boost::asio::buffer(in_flight_),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketConnection::SendPing() {
  writing_ = true;
  ArmWriteDeadline();
  auto self = Self();
  ws_.async_ping({}, [self](boost::beast::error_code ec) { self->OnWrite(ec); });
}

void WebSocketConnection::OnWrite(boost::beast::error_code ec) {
  write_deadline_.cancel();
  in_flight_.clear();
  if (ec) {
    Teardown("write_error", ec);
    return;
  }
  writing_ = false;
  if (IsClosed()) {
    return;
  }
  if (ping_pending_) {
    ping_pending_ = false;
    SendPing();
    return;
  }
  WriteNext();
}

void WebSocketConnection::ArmReadDeadline() {
  read_deadline_.expires_after(limits_.read_timeout);
  auto self = Self();
  read_deadline_.async_wait([self](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->Teardown("read_timeout", boost::beast::error::timeout);
  });
}

void WebSocketConnection::ArmWriteDeadline() {
  write_deadline_.expires_after(limits_.write_timeout);
  auto self = Self();
  write_deadline_.async_wait([self](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->Teardown("write_timeout", boost::beast::error::timeout);
  });
}

void WebSocketConnection::SchedulePing() {
  ping_timer_.expires_after(limits_.ping_interval);
  auto self = Self();
  ping_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || self->IsClosed()) {
      return;
    }
    if (self->writing_) {
      self->ping_pending_ = true;
    } else {
      self->SendPing();
    }
    self->SchedulePing();
  });
}

void WebSocketConnection::Reject() {
  MarkClosed();
  boost::beast::get_lowest_layer(ws_).expires_after(limits_.write_timeout);
  auto self = Self();
  ws_.async_close(websocket::close_reason{websocket::close_code::try_again_later},
                  [self](boost::beast::error_code) {
                    boost::beast::error_code ignored;
                    boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
                  });
}

void WebSocketConnection::Teardown(std::string_view reason, boost::beast::error_code ec) {
  if (!MarkClosed()) {
    return;
  }
  read_deadline_.cancel();
  write_deadline_.cancel();
  ping_timer_.cancel();

  boost::beast::error_code ignored;
  auto& socket = boost::beast::get_lowest_layer(ws_).socket();
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);

  if (const auto& observability = GetObservability()) {
    observability->Log(LogContext{.level = LogLevel::kInfo,
                                  .name = "ws.closed",
                                  .workflow_id = Identity().workflow_id,
                                  .user_id = Identity().user_id,
                                  .connection_id = Id(),
                                  .detail = {{"reason", reason}, {"error", ec ? ec.message() : std::string()}}});
  }
  coordinator_->Detach(Self());
}

}  // namespace collab
