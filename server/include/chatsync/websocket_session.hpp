/*
 * 설명: WebSocket 연결 하나의 읽기 루프, 순서 보장 송신 큐, 백프레셔를 관리하고
 *       수신 이벤트를 SessionCoordinator로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chatsync/api_response.hpp"
#include "chatsync/broadcast_dispatcher.hpp"
#include "chatsync/observability.hpp"
#include "chatsync/session_coordinator.hpp"

namespace chatsync {

class WebSocketSession : public EventSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;

  // 핸드셰이크가 끝난 뒤 호출한다. connecting -> active
  void Run();

  // 임의 스레드에서 호출 가능. 실제 송신은 연결 strand에서 순서대로 이뤄진다.
  void SendEvent(const std::string& event, const nlohmann::json& payload) override;
  void SendError(const std::string& code, const std::string& message) override;

  ConnectionId Id() const { return id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec);
  void HandleFrame(const std::string& data);
  void Post(std::string message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  // 송신 큐를 비우고 closing 상태로 전환한다.
  void DropOutbox();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  // active -> closed. 여러 번 호출되어도 한 번만 처리한다.
  void Close();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer inbound_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  ConnectionId id_;
  std::deque<std::string> outbox_;
  std::size_t outbox_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool closed_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace chatsync
