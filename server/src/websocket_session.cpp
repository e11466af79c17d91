/*
 * 설명: WebSocket 프레임을 읽어 코디네이터로 전달하고, 서버 이벤트를 strand에서 순서대로 송신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "chatsync/websocket_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace chatsync {
namespace {
std::string Serialize(const WsEnvelope& env) {
  return ToWsJson(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<SessionCoordinator> coordinator,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), observability_(std::move(observability)),
      id_(coordinator_->NextConnectionId()), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  // Close()를 거치지 않은 경우(예: Run 이전 실패)에도 명단이 남지 않게 한다.
  if (!closed_) {
    coordinator_->OnDisconnect(id_, this);
  }
}

void WebSocketSession::Run() {
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
    self->coordinator_->OnConnect(self->id_, self);
    self->DoRead();
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  ws_.async_read(inbound_, [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
    self->OnRead(ec);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed && observability_) {
      observability_->Event(LogLevel::kDebug, "ws.read_error", id_, ec.message());
    }
    return Close();
  }
  if (closing_) {
    return Close();
  }

  std::string text = boost::beast::buffers_to_string(inbound_.cdata());
  inbound_.clear();
  HandleFrame(text);
  DoRead();
}

void WebSocketSession::HandleFrame(const std::string& data) {
  std::string reject_code;
  std::string reject_reason;
  auto frame = ParseWsFrame(data, reject_code, reject_reason);
  if (!frame) {
    EnqueueMessage(Serialize(MakeErrorFrame(reject_code, reject_reason)));
    return;
  }
  if (frame->type != "event") {
    EnqueueMessage(Serialize(MakeErrorFrame("bad_request", "클라이언트는 event 프레임만 보낼 수 있습니다", frame->seq)));
    return;
  }
  try {
    coordinator_->OnEvent(id_, frame->event, frame->payload);
  } catch (const std::exception& handler_error) {
    // 한 이벤트의 처리 실패가 연결 전체를 끊지 않게 한다.
    if (auto* obs = observability_.get()) {
      obs->IncrementError();
      obs->Event(LogLevel::kError, "ws.handler_failed", id_, frame->event + ": " + handler_error.what());
    }
    EnqueueMessage(Serialize(MakeErrorFrame("internal_error", "이벤트 처리 중 오류가 발생했습니다", frame->seq)));
  }
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload) {
  Post(Serialize(MakeEventEnvelope(event, payload)));
}

void WebSocketSession::SendError(const std::string& code, const std::string& message) {
  Post(Serialize(MakeErrorFrame(code, message)));
}

void WebSocketSession::Post(std::string message) {
  // post는 같은 strand에 대해 FIFO를 보장하므로 호출 순서대로 송신된다.
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const bool over_count = outbox_.size() + 1 > max_queue_messages_;
  const bool over_bytes = outbox_bytes_ + message.size() > max_queue_bytes_;
  if (over_count || over_bytes) {
    TriggerBackpressureClose();
    return;
  }
  outbox_bytes_ += message.size();
  outbox_.push_back(std::move(message));
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::DropOutbox() {
  closing_ = true;
  outbox_.clear();
  outbox_bytes_ = 0;
}

void WebSocketSession::WriteNext() {
  if (closing_ || outbox_.empty()) {
    writing_ = false;
    return;
  }
  writing_ = true;
  ws_.text(true);
  // 큐 앞 원소는 쓰기가 끝날 때까지 제거하지 않으므로 버퍼가 유효하다.
  ws_.async_write(boost::asio::buffer(outbox_.front()),
                  [self = shared_from_this()](boost::beast::error_code ec, std::size_t) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (ec) {
    writing_ = false;
    DropOutbox();
    if (observability_) {
      observability_->IncrementDeliveryFailure();
      observability_->Event(LogLevel::kWarn, "ws.write_failed", id_, ec.message());
    }
    return;
  }
  outbox_bytes_ -= outbox_.front().size();
  outbox_.pop_front();
  WriteNext();
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  DropOutbox();
  if (observability_) {
    observability_->Event(LogLevel::kWarn, "ws.backpressure_close", id_);
  }
  namespace websocket = boost::beast::websocket;
  websocket::close_reason policy{websocket::close_code::policy_error, "backpressure_exceeded"};
  ws_.async_close(policy, [self = shared_from_this()](boost::beast::error_code) {});
}

void WebSocketSession::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  closing_ = true;
  coordinator_->OnDisconnect(id_, this);
}

}  // namespace chatsync
