/*
 * 설명: HTTP 요청을 처리하고 상태/메트릭 조회와 협업 WS 업그레이드(신원 확인, 입장 제한)를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "collab/http_session.hpp"

#include <chrono>
#include <utility>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "collab/protocol.hpp"
#include "collab/random.hpp"
#include "collab/websocket_connection.hpp"

namespace collab {

namespace {
constexpr char kServerName[] = "collab-server";
constexpr std::string_view kWorkflowPrefix = "/api/v1/workflows/";
constexpr std::string_view kCollaborateSuffix = "/collaborate";
constexpr std::size_t kConnectionIdBytes = 16;

std::string HeaderValue(const boost::beast::http::request<boost::beast::http::string_body>& req,
                        std::string_view name) {
  auto it = req.base().find(boost::beast::string_view(name.data(), name.size()));
  return it == req.base().end() ? std::string() : std::string(it->value());
}
}  // namespace

std::optional<std::string> ExtractCollaborationWorkflowId(const std::string& path) {
  if (path.size() <= kWorkflowPrefix.size() + kCollaborateSuffix.size()) {
    return std::nullopt;
  }
  if (path.compare(0, kWorkflowPrefix.size(), kWorkflowPrefix) != 0) {
    return std::nullopt;
  }
  if (path.compare(path.size() - kCollaborateSuffix.size(), kCollaborateSuffix.size(), kCollaborateSuffix) != 0) {
    return std::nullopt;
  }
  return path.substr(kWorkflowPrefix.size(), path.size() - kWorkflowPrefix.size() - kCollaborateSuffix.size());
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RoomCoordinator> coordinator,
                         std::shared_ptr<TransportHub> hub,
                         std::shared_ptr<CollaborationService> service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)), hub_(std::move(hub)),
      service_(std::move(service)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

nlohmann::json HttpSession::MetricsJson() {
  auto snapshot = observability_->Snapshot(service_->ActiveSessionCount(), service_->ActiveLockCount());
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"connections", {{"websocket", snapshot.websocket_active}, {"rooms", hub_->RoomCount()}}},
          {"messages", {{"dropped", snapshot.messages_dropped}}},
          {"sessions", {{"active", snapshot.active_sessions}}},
          {"locks", {{"active", snapshot.active_locks}, {"conflicts", snapshot.lock_conflicts}}}};
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    auto body = MakeSuccessEnvelope(payload).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto body = MakeSuccessEnvelope(MetricsJson()).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_token = HeaderValue(req_, "X-Ops-Token");
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return SendError(http::status::unauthorized, "unauthorized", "운영 토큰이 올바르지 않습니다");
    }
    auto snapshot = observability_->Snapshot(service_->ActiveSessionCount(), service_->ActiveLockCount());
    nlohmann::json data{{"activeSessions", snapshot.active_sessions},
                        {"activeLocks", snapshot.active_locks},
                        {"activeWebsocket", snapshot.websocket_active},
                        {"droppedMessages", snapshot.messages_dropped},
                        {"lockConflicts", snapshot.lock_conflicts},
                        {"errorCount", snapshot.request_errors}};
    auto body = MakeSuccessEnvelope(data).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (ExtractCollaborationWorkflowId(path)) {
    return SendError(http::status::bad_request, "bad_request", "WebSocket 업그레이드 요청이 필요합니다");
  }

  SendError(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  auto body = MakeErrorEnvelope(code, message).dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    const auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo,
                                   .name = "http.request",
                                   .trace_id = trace_id_,
                                   .detail = {{"target", std::string(req_.target())}, {"status", status}},
                                   .latency_ms = static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

std::optional<ClientIdentity> HttpSession::ExtractIdentity(const std::string& workflow_id) {
  if (!config_.gateway_token.empty() && HeaderValue(req_, "X-Gateway-Token") != config_.gateway_token) {
    return std::nullopt;
  }
  auto user_id = HeaderValue(req_, "X-User-ID");
  if (user_id.empty()) {
    return std::nullopt;
  }
  auto user_name = HeaderValue(req_, "X-User-Name");
  if (user_name.empty()) {
    user_name = user_id;
  }
  return ClientIdentity{HeaderValue(req_, "X-Tenant-ID"), std::move(user_id), std::move(user_name), workflow_id};
}

void HttpSession::HandleWebSocket() {
  namespace http = boost::beast::http;
  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));
  auto workflow_id = ExtractCollaborationWorkflowId(path);
  if (!workflow_id) {
    return SendError(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
  }
  auto identity = ExtractIdentity(*workflow_id);
  if (!identity) {
    return SendError(http::status::unauthorized, "unauthorized", "게이트웨이 인증 정보가 없습니다");
  }
  switch (coordinator_->Admit(*workflow_id)) {
    case AdmissionStatus::kInvalidWorkflowId:
      return SendError(http::status::bad_request, "invalid_workflow_id", "워크플로 ID 형식이 올바르지 않습니다");
    case AdmissionStatus::kRoomFull:
      return SendError(http::status::too_many_requests, "room_full", "워크플로 협업 정원이 가득 찼습니다");
    case AdmissionStatus::kAccepted:
      break;
  }

  ConnectionLimits limits{.max_queue_messages = config_.ws_queue_limit_messages,
                          .max_message_bytes = config_.ws_max_message_bytes,
                          .read_timeout = std::chrono::seconds(config_.ws_read_timeout_seconds),
                          .write_timeout = std::chrono::seconds(config_.ws_write_timeout_seconds),
                          .ping_interval = std::chrono::seconds(config_.ws_ping_interval_seconds)};
  std::string connection_id;
  try {
    connection_id = RandomHex(kConnectionIdBytes);
  } catch (const std::runtime_error&) {
    return SendError(http::status::internal_server_error, "internal_error", "연결 ID를 만들 수 없습니다");
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
  } catch (const boost::system::system_error& ex) {
    if (observability_) {
      observability_->Log(LogContext{.level = LogLevel::kWarn,
                                     .name = "ws.upgrade_failed",
                                     .trace_id = trace_id_,
                                     .workflow_id = identity->workflow_id,
                                     .user_id = identity->user_id,
                                     .detail = {{"error", ex.what()}}});
    }
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketConnection>(std::move(ws), std::move(connection_id), *identity, limits, coordinator_,
                                        observability_)
      ->Run();
}

}  // namespace collab
