/*
 * 설명: 채팅 서버와의 WebSocket 세션 하나를 소유하고, 수신 이벤트를 재조정기로 넘기며
 *       연결이 끊기면 일정 시간 뒤 다시 연결한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chatsync/api_response.hpp"
#include "chatsync/client/reconciler.hpp"
#include "chatsync/client/scheduler.hpp"
#include "chatsync/client/typing_tracker.hpp"

namespace chatsync::client {

struct ClientOptions {
  std::string host{"127.0.0.1"};
  std::string port{"5000"};
  std::string target{"/"};
  std::string display_name;
  std::chrono::milliseconds reconnect_delay{3000};
  std::chrono::milliseconds typing_throttle{0};
};

struct ClientListeners {
  std::function<void(const ChatReconciler&)> on_view_changed;
  std::function<void(bool online)> on_connection_changed;
  std::function<void(const std::set<std::string>&)> on_typing_changed;
  std::function<void(const std::string& code, const std::string& message)> on_error;
};

// 모든 상태는 내부 strand에서만 바뀐다. 공개 메서드는 어느 스레드에서 호출해도 된다.
// 리스너 역시 strand 위에서 호출된다.
class ChatClient : public OutboundChannel, public std::enable_shared_from_this<ChatClient> {
 public:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  static std::shared_ptr<ChatClient> Create(boost::asio::io_context& ioc, ClientOptions options);
  ~ChatClient() override;

  ChatClient(const ChatClient&) = delete;
  ChatClient& operator=(const ChatClient&) = delete;

  void Start();
  // 타이머 취소, 리스너 해제, 소켓 종료. 이후 재연결하지 않는다.
  void Stop();
  void SetListeners(ClientListeners listeners);

  void SetName(const std::string& name);
  void SendText(const std::string& text);
  void Compose(const std::string& text);
  void Edit(const std::string& id, const std::string& new_text);
  void Delete(const std::string& id);
  void MarkRead(const std::string& id);
  void JumpToNewest();
  void UpdateScroll(double scroll_top, double viewport_height, double content_height);

  bool IsConnected() const override { return connected_.load(); }
  void Emit(std::string_view event, const nlohmann::json& payload) override;

 private:
  ChatClient(boost::asio::io_context& ioc, ClientOptions options);

  void DoResolve();
  void OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
  void OnConnect(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec,
                 boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint);
  void OnHandshake(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec);
  void DoRead(std::shared_ptr<WebSocket> ws);
  void HandleFrame(const std::string& data);
  // strand 위에서만 호출한다. 연결이 없으면 버린다.
  void SendEnvelope(WsEnvelope env);
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec);
  void HandleDisconnect(const std::shared_ptr<WebSocket>& ws, const std::string& reason);
  void ScheduleReconnect();
  void ReportError(const std::string& code, const std::string& message);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::resolver resolver_;
  ClientOptions options_;
  AsioScheduler scheduler_;
  TypingAggregator typing_;
  TypingEmitter emitter_;
  ChatReconciler reconciler_;
  ClientListeners listeners_;

  std::shared_ptr<WebSocket> ws_;
  std::shared_ptr<boost::beast::flat_buffer> read_buffer_;
  std::deque<std::string> send_queue_;
  bool writing_{false};
  bool stopping_{false};
  std::atomic<bool> connected_{false};
  std::uint64_t seq_{0};
  std::string name_;
};

}  // namespace chatsync::client
