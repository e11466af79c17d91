/*
 * 설명: 연결 수명주기(connecting -> active -> closed)와 수신 이벤트 라우팅을 담당한다.
 *       저장소/명단 변경이 성공한 경우에만 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chatsync/broadcast_dispatcher.hpp"
#include "chatsync/connection_registry.hpp"
#include "chatsync/message_store.hpp"
#include "chatsync/observability.hpp"

namespace chatsync {

struct CoordinatorOptions {
  std::size_t history_limit{kDefaultHistoryLimit};
  // 거부/없음/레이트리밋을 요청자에게만 message-error로 알린다.
  bool notify_denials{true};
};

class SessionCoordinator {
 public:
  using ClockFn = std::function<TimePoint()>;

  SessionCoordinator(std::shared_ptr<MessageStore> store, std::shared_ptr<ConnectionRegistry> registry,
                     std::shared_ptr<BroadcastDispatcher> dispatcher, std::shared_ptr<Observability> observability,
                     CoordinatorOptions options = {}, ClockFn clock = {});

  ConnectionId NextConnectionId() { return next_connection_id_.fetch_add(1); }

  void OnConnect(ConnectionId id, const std::shared_ptr<EventSink>& sink);
  void OnEvent(ConnectionId id, const std::string& event, const nlohmann::json& payload);
  void OnDisconnect(ConnectionId id, const EventSink* sink);

  // REST 일회성 조회용. 실패 시 status=kUnavailable
  ListResult History();

  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<BroadcastDispatcher> GetDispatcher() { return dispatcher_; }

 private:
  void HandleSetUsername(ConnectionId id, const nlohmann::json& payload);
  void HandleSendMessage(ConnectionId id, const nlohmann::json& payload);
  void HandleDeleteMessage(ConnectionId id, const nlohmann::json& payload);
  void HandleEditMessage(ConnectionId id, const nlohmann::json& payload);
  void HandleMessageRead(ConnectionId id, const nlohmann::json& payload);
  void HandleTyping(ConnectionId id, const nlohmann::json& payload);

  void BroadcastRoster();
  void ReportRejection(ConnectionId id, const char* operation, MutationStatus status, const std::string& message_id);
  void SendMessageError(ConnectionId id, std::string_view code, std::string_view reason,
                        const std::optional<std::string>& message_id);
  std::string RequesterName(ConnectionId id) const;
  TimePoint Now() const;

  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  CoordinatorOptions options_;
  ClockFn clock_;
  std::atomic<ConnectionId> next_connection_id_{1};
  // history 스냅샷 전송과 append+message 브로드캐스트를 직렬화한다.
  std::mutex append_mutex_;
};

}  // namespace chatsync
