/*
 * 설명: 서버 수명주기, 리스닝 스레드, 비활성 세션 정리 타이머와 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collaboration_flow_test.cpp, server/tests/e2e/metrics_ops_test.cpp,
 *         server/tests/unit/config_test.cpp
 */
#include "collab/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "collab/http_session.hpp"

namespace collab {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<TransportHub> hub,
           std::shared_ptr<CollaborationService> service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        hub_(std::move(hub)), service_(std::move(service)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_, self->hub_,
                                          self->service_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::shared_ptr<TransportHub> hub_;
  std::shared_ptr<CollaborationService> service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), cleanup_timer_(ioc_),
      drain_timer_(ioc_), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  hub_ = std::make_shared<TransportHub>();
  hub_->SetObservability(observability_);
  service_ = std::make_shared<CollaborationService>();
  coordinator_ =
      std::make_shared<RoomCoordinator>(hub_, service_, observability_, config.max_connections_per_workflow);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, hub_, service_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{.level = LogLevel::kInfo,
                                     .name = "server.signal",
                                     .detail = {{"signal", signal_number}}});
      Shutdown();
    });
    ScheduleCleanup();
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "server.started",
                                   .detail = {{"port", config_.port},
                                              {"maxConnectionsPerWorkflow", config_.max_connections_per_workflow}}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{.level = LogLevel::kError,
                                   .name = "server.run_failed",
                                   .detail = {{"error", ex.what()}}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::ScheduleCleanup() {
  cleanup_timer_.expires_after(std::chrono::seconds(config_.session_cleanup_interval_seconds));
  cleanup_timer_.async_wait([this](const boost::system::error_code& ec) { OnCleanupTick(ec); });
}

void ServerApp::OnCleanupTick(const boost::system::error_code& ec) {
  if (ec || stopping_) {
    return;
  }
  auto removed = coordinator_->CleanupInactiveSessions(std::chrono::seconds(config_.session_max_idle_seconds));
  if (removed > 0) {
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "collab.sessions_cleaned",
                                   .detail = {{"removed", removed},
                                              {"remaining", service_->ActiveSessionCount()}}});
  }
  ScheduleCleanup();
}

// ioc 스레드에서만 호출한다. 열린 연결에 닫기를 요청하고 모두 정리되거나 쓰기 제한 시간이 지나면 멈춘다.
void ServerApp::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  if (listener_) {
    listener_->Stop();
  }
  cleanup_timer_.cancel();
  auto closing = hub_->CloseAll();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "server.shutdown",
                                 .detail = {{"closingConnections", closing}}});
  work_guard_.reset();
  WaitForDrain(std::chrono::steady_clock::now() + std::chrono::seconds(config_.ws_write_timeout_seconds));
}

void ServerApp::WaitForDrain(std::chrono::steady_clock::time_point deadline) {
  if (hub_->ActiveConnections() == 0 || std::chrono::steady_clock::now() >= deadline) {
    ioc_.stop();
    return;
  }
  drain_timer_.expires_after(std::chrono::milliseconds(50));
  drain_timer_.async_wait([this, deadline](const boost::system::error_code& ec) {
    if (ec) {
      ioc_.stop();
      return;
    }
    WaitForDrain(deadline);
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  boost::asio::post(ioc_, [this]() { Shutdown(); });
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&get_env](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  auto port = std::stoul(get_env("SERVER_PORT", "8080"));
  if (port == 0 || port > 65535) {
    throw std::invalid_argument("SERVER_PORT must be between 1 and 65535");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_max_message_bytes = get_size("WS_MAX_MESSAGE_BYTES", "524288");
  cfg.ws_read_timeout_seconds = get_size("WS_READ_TIMEOUT_SECONDS", "60");
  cfg.ws_write_timeout_seconds = get_size("WS_WRITE_TIMEOUT_SECONDS", "10");
  cfg.ws_ping_interval_seconds = get_size("WS_PING_INTERVAL_SECONDS", "54");
  cfg.max_connections_per_workflow = get_size("MAX_CONNECTIONS_PER_WORKFLOW", "50");
  cfg.session_cleanup_interval_seconds = get_size("SESSION_CLEANUP_INTERVAL_SECONDS", "300");
  cfg.session_max_idle_seconds = get_size("SESSION_MAX_IDLE_SECONDS", "1800");
  cfg.gateway_token = get_env("GATEWAY_TOKEN", "");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  auto require_positive = [](std::size_t value, const char* name) {
    if (value == 0) {
      throw std::invalid_argument(std::string(name) + " must be greater than zero");
    }
  };
  require_positive(config.port, "SERVER_PORT");
  require_positive(config.ws_queue_limit_messages, "WS_QUEUE_LIMIT_MESSAGES");
  require_positive(config.ws_max_message_bytes, "WS_MAX_MESSAGE_BYTES");
  require_positive(config.ws_read_timeout_seconds, "WS_READ_TIMEOUT_SECONDS");
  require_positive(config.ws_write_timeout_seconds, "WS_WRITE_TIMEOUT_SECONDS");
  require_positive(config.ws_ping_interval_seconds, "WS_PING_INTERVAL_SECONDS");
  require_positive(config.max_connections_per_workflow, "MAX_CONNECTIONS_PER_WORKFLOW");
  require_positive(config.session_cleanup_interval_seconds, "SESSION_CLEANUP_INTERVAL_SECONDS");
  require_positive(config.session_max_idle_seconds, "SESSION_MAX_IDLE_SECONDS");
  if (config.ws_ping_interval_seconds >= config.ws_read_timeout_seconds) {
    throw std::invalid_argument("WS_PING_INTERVAL_SECONDS must be shorter than WS_READ_TIMEOUT_SECONDS");
  }
}

}  // namespace collab
