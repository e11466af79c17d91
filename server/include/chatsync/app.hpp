/*
 * 설명: 서버 전체 수명주기(저장소 선택, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "chatsync/broadcast_dispatcher.hpp"
#include "chatsync/config.hpp"
#include "chatsync/connection_registry.hpp"
#include "chatsync/db_client.hpp"
#include "chatsync/message_store.hpp"
#include "chatsync/observability.hpp"
#include "chatsync/session_coordinator.hpp"

namespace chatsync {

class Listener;

class ServerApp {
 public:
  // 저장소 초기화 실패(DbException)나 잘못된 백엔드 이름은 예외로 전파한다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace chatsync
