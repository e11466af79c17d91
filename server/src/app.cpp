/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "chatsync/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chatsync/http_session.hpp"
#include "chatsync/mariadb_message_store.hpp"

namespace chatsync {

namespace {
// 바인드 단계의 오류는 기동 실패이므로 예외로 main까지 올린다.
void ThrowIf(const boost::beast::error_code& ec, const char* step) {
  if (ec) {
    throw boost::beast::system_error{ec, step};
  }
}
}  // namespace

// TCP 연결을 받아 HttpSession에 넘긴다. WebSocket 업그레이드는 HttpSession이 판단한다.
class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    ThrowIf(ec, "open");
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    ThrowIf(ec, "reuse_address");
    acceptor_.bind(endpoint, ec);
    ThrowIf(ec, "bind");
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    ThrowIf(ec, "listen");
  }

  void Run() { AcceptNext(); }

  void Stop() {
    boost::beast::error_code ignored;
    acceptor_.close(ignored);
  }

 private:
  void AcceptNext() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
                           [self = shared_from_this()](boost::beast::error_code ec,
                                                       boost::asio::ip::tcp::socket peer) {
                             self->OnAccept(ec, std::move(peer));
                           });
  }

  void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket peer) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      observability_->Event(LogLevel::kWarn, "listener.accept_failed", std::nullopt, ec.message());
    } else {
      std::make_shared<HttpSession>(std::move(peer), config_, coordinator_, observability_)->Run();
    }
    if (acceptor_.is_open()) {
      AcceptNext();
    }
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  const std::chrono::seconds edit_cooldown{config.edit_cooldown_seconds};
  if (config.store_backend == "memory") {
    store_ = std::make_shared<InMemoryMessageStore>(edit_cooldown);
  } else if (config.store_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    auto mariadb_store = std::make_shared<MariaDbMessageStore>(db_client_, observability_, edit_cooldown);
    mariadb_store->EnsureSchema();
    store_ = mariadb_store;
  } else {
    throw std::invalid_argument("알 수 없는 STORE_BACKEND: " + config.store_backend);
  }
  registry_ = std::make_shared<ConnectionRegistry>();
  dispatcher_ = std::make_shared<BroadcastDispatcher>();
  dispatcher_->SetObservability(observability_);
  CoordinatorOptions options;
  options.history_limit = config.history_limit;
  options.notify_denials = config.notify_denials;
  coordinator_ = std::make_shared<SessionCoordinator>(store_, registry_, dispatcher_, observability_, options);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  running_ = true;
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, observability_);
  listener_->Run();

  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Event(LogLevel::kInfo, "server.signal", std::nullopt, std::to_string(signal_number));
    work_guard_.reset();
    listener_->Stop();
    ioc_.stop();
  });

  observability_->Event(LogLevel::kInfo, "server.start", std::nullopt,
                        "port=" + std::to_string(config_.port) + " store=" + config_.store_backend);
  RunWorkers();
  ioc_.run();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t ParseSize(const char* key, const char* def) {
  auto text = GetEnv(key, def);
  std::size_t idx = 0;
  auto value = std::stoul(text, &idx);
  if (idx != text.size()) {
    throw std::invalid_argument(std::string(key) + " 값이 숫자가 아닙니다: " + text);
  }
  return static_cast<std::size_t>(value);
}

unsigned short ParsePort(const char* key, const char* def) {
  auto value = ParseSize(key, def);
  if (value == 0 || value > 65535) {
    throw std::invalid_argument(std::string(key) + " 포트 범위를 벗어났습니다");
  }
  return static_cast<unsigned short>(value);
}

bool ParseBool(const char* key, const char* def) {
  auto text = GetEnv(key, def);
  if (text == "true" || text == "1" || text == "yes") {
    return true;
  }
  if (text == "false" || text == "0" || text == "no") {
    return false;
  }
  throw std::invalid_argument(std::string(key) + " 값이 불리언이 아닙니다: " + text);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.port = ParsePort("SERVER_PORT", "5000");
  cfg.store_backend = GetEnv("STORE_BACKEND", "mariadb");
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = ParsePort("DB_PORT", "3306");
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "chat_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = ParseSize("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_queue_limit_bytes = ParseSize("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.history_limit = ParseSize("HISTORY_LIMIT", "500");
  cfg.edit_cooldown_seconds = ParseSize("EDIT_COOLDOWN_SECONDS", "300");
  cfg.notify_denials = ParseBool("NOTIFY_DENIALS", "true");
  return cfg;
}

}  // namespace chatsync
