/*
 * 설명: Beast 기반 채팅 클라이언트 세션(연결, 읽기 루프, 순서 보장 송신, 재연결)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/chat_client_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "chatsync/client/chat_client.hpp"

#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "chatsync/api_response.hpp"
#include "chatsync/events.hpp"

namespace chatsync::client {

std::shared_ptr<ChatClient> ChatClient::Create(boost::asio::io_context& ioc, ClientOptions options) {
  return std::shared_ptr<ChatClient>(new ChatClient(ioc, std::move(options)));
}

ChatClient::ChatClient(boost::asio::io_context& ioc, ClientOptions options)
    : strand_(boost::asio::make_strand(ioc)),
      resolver_(strand_),
      options_(std::move(options)),
      scheduler_(strand_),
      typing_(scheduler_),
      emitter_(scheduler_, [this](const std::string& name) { Emit(events::kTyping, {{"user", name}}); },
               options_.typing_throttle),
      reconciler_(*this, typing_),
      name_(options_.display_name.empty() ? std::string{kAnonymousName} : options_.display_name) {
  typing_.SetSelfName(name_);
  typing_.SetChangeHandler([this](const std::set<std::string>& subjects) {
    if (listeners_.on_typing_changed) {
      listeners_.on_typing_changed(subjects);
    }
  });
  reconciler_.SetChangeListener([this]() {
    if (listeners_.on_view_changed) {
      listeners_.on_view_changed(reconciler_);
    }
  });
}

ChatClient::~ChatClient() {
  reconciler_.DetachListeners();
  typing_.SetChangeHandler(nullptr);
  scheduler_.CancelAll();
}

void ChatClient::Start() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->stopping_ = false;
    self->DoResolve();
  });
}

void ChatClient::Stop() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->stopping_ = true;
    self->listeners_ = ClientListeners{};
    self->reconciler_.DetachListeners();
    self->typing_.SetChangeHandler(nullptr);
    self->typing_.Clear();
    self->scheduler_.CancelAll();
    self->resolver_.cancel();
    self->send_queue_.clear();
    self->connected_ = false;
    if (auto ws = std::exchange(self->ws_, nullptr)) {
      ws->async_close(boost::beast::websocket::close_code::normal,
                      boost::asio::bind_executor(self->strand_, [ws](boost::beast::error_code) {}));
    }
  });
}

void ChatClient::SetListeners(ClientListeners listeners) {
  boost::asio::post(strand_, [self = shared_from_this(), listeners = std::move(listeners)]() mutable {
    self->listeners_ = std::move(listeners);
    if (self->listeners_.on_view_changed) {
      self->listeners_.on_view_changed(self->reconciler_);
    }
  });
}

void ChatClient::SetName(const std::string& name) {
  boost::asio::post(strand_, [self = shared_from_this(), name]() {
    self->name_ = name.empty() ? std::string{kAnonymousName} : name;
    self->typing_.SetSelfName(self->name_);
    if (self->connected_) {
      self->Emit(events::kSetUsername, {{"name", self->name_}});
    }
  });
}

void ChatClient::SendText(const std::string& text) {
  boost::asio::post(strand_, [self = shared_from_this(), text]() {
    self->reconciler_.Send(self->name_, text);
    self->emitter_.Reset();
  });
}

void ChatClient::Compose(const std::string& text) {
  boost::asio::post(strand_, [self = shared_from_this(), text]() {
    self->emitter_.OnComposeChanged(text, self->name_, self->connected_);
  });
}

void ChatClient::Edit(const std::string& id, const std::string& new_text) {
  Emit(events::kEditMessage, {{"id", id}, {"newText", new_text}});
}

void ChatClient::Delete(const std::string& id) { Emit(events::kDeleteMessage, {{"id", id}}); }

void ChatClient::MarkRead(const std::string& id) { Emit(events::kMessageRead, {{"id", id}}); }

void ChatClient::JumpToNewest() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->reconciler_.JumpToNewest(); });
}

void ChatClient::UpdateScroll(double scroll_top, double viewport_height, double content_height) {
  boost::asio::post(strand_, [self = shared_from_this(), scroll_top, viewport_height, content_height]() {
    self->reconciler_.OnScroll(scroll_top, viewport_height, content_height);
  });
}

void ChatClient::Emit(std::string_view event, const nlohmann::json& payload) {
  auto env = MakeEventEnvelope(event, payload);
  // strand 위(예: SendText)에서는 연결 확인과 큐 적재를 같은 단계에서 처리한다.
  // 다시 post하면 그 사이에 끊김이 처리되어 프레임이 조용히 사라질 수 있다.
  if (strand_.running_in_this_thread()) {
    return SendEnvelope(std::move(env));
  }
  boost::asio::post(strand_, [self = shared_from_this(), env = std::move(env)]() mutable {
    self->SendEnvelope(std::move(env));
  });
}

void ChatClient::SendEnvelope(WsEnvelope env) {
  if (!connected_) {
    return;
  }
  env.seq = ++seq_;
  EnqueueFrame(ToWsJson(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void ChatClient::DoResolve() {
  if (stopping_) {
    return;
  }
  resolver_.async_resolve(
      options_.host, options_.port,
      boost::asio::bind_executor(strand_, [self = shared_from_this()](
                                              boost::beast::error_code ec,
                                              boost::asio::ip::tcp::resolver::results_type results) {
        self->OnResolve(ec, std::move(results));
      }));
}

void ChatClient::OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
  if (ec) {
    ReportError("resolve_failed", ec.message());
    return ScheduleReconnect();
  }
  auto ws = std::make_shared<WebSocket>(strand_);
  ws_ = ws;
  boost::beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(30));
  boost::beast::get_lowest_layer(*ws).async_connect(
      results, boost::asio::bind_executor(
                   strand_, [self = shared_from_this(), ws](
                                boost::beast::error_code ec,
                                boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint) {
                     self->OnConnect(ws, ec, endpoint);
                   }));
}

void ChatClient::OnConnect(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec,
                           boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint) {
  if (ws != ws_) {
    return;
  }
  if (ec) {
    return HandleDisconnect(ws, ec.message());
  }
  boost::beast::get_lowest_layer(*ws).expires_never();
  ws->set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
  auto host = options_.host + ":" + std::to_string(endpoint.port());
  ws->async_handshake(host, options_.target,
                      boost::asio::bind_executor(strand_, [self = shared_from_this(), ws](boost::beast::error_code ec) {
                        self->OnHandshake(ws, ec);
                      }));
}

void ChatClient::OnHandshake(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec) {
  if (ws != ws_) {
    return;
  }
  if (ec) {
    return HandleDisconnect(ws, ec.message());
  }
  connected_ = true;
  if (listeners_.on_connection_changed) {
    listeners_.on_connection_changed(true);
  }
  // 서버는 접속 시 Anonymous로 등록하므로 선언된 이름을 바로 알린다.
  if (name_ != kAnonymousName) {
    Emit(events::kSetUsername, {{"name", name_}});
  }
  read_buffer_ = std::make_shared<boost::beast::flat_buffer>();
  DoRead(ws);
}

void ChatClient::DoRead(std::shared_ptr<WebSocket> ws) {
  auto buffer = read_buffer_;
  ws->async_read(*buffer, boost::asio::bind_executor(
                              strand_, [self = shared_from_this(), ws, buffer](boost::beast::error_code ec,
                                                                               std::size_t /*bytes_transferred*/) {
                                if (ws != self->ws_) {
                                  return;
                                }
                                if (ec) {
                                  return self->HandleDisconnect(ws, ec.message());
                                }
                                auto data = boost::beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                self->HandleFrame(data);
                                self->DoRead(ws);
                              }));
}

void ChatClient::HandleFrame(const std::string& data) {
  std::string error_code;
  std::string error_message;
  auto frame = ParseWsFrame(data, error_code, error_message);
  if (!frame) {
    return ReportError(error_code, error_message);
  }
  if (frame->type == "error") {
    return ReportError(frame->payload.value("code", std::string{"unknown"}),
                       frame->payload.value("message", std::string{}));
  }
  if (frame->event == events::kMessageError) {
    return ReportError(frame->payload.value("code", std::string{"store_unavailable"}),
                       frame->payload.value("reason", std::string{}));
  }
  try {
    if (!reconciler_.HandleEvent(frame->event, frame->payload)) {
      ReportError("unknown_event", frame->event);
    }
  } catch (const nlohmann::json::exception& ex) {
    ReportError("bad_payload", frame->event + ": " + ex.what());
  }
}

void ChatClient::EnqueueFrame(std::string frame) {
  send_queue_.push_back(std::move(frame));
  if (!writing_) {
    WriteNext();
  }
}

void ChatClient::WriteNext() {
  if (send_queue_.empty() || !ws_) {
    return;
  }
  writing_ = true;
  // 쓰는 중인 프레임은 핸들러가 소유한다. 큐를 비워도 버퍼가 살아 있다.
  auto frame = std::make_shared<std::string>(std::move(send_queue_.front()));
  send_queue_.pop_front();
  auto ws = ws_;
  ws->text(true);
  ws->async_write(boost::asio::buffer(*frame),
                  boost::asio::bind_executor(strand_, [self = shared_from_this(), ws, frame](
                                                          boost::beast::error_code ec, std::size_t /*bytes*/) {
                    self->OnWrite(ws, ec);
                  }));
}

void ChatClient::OnWrite(std::shared_ptr<WebSocket> ws, boost::beast::error_code ec) {
  if (ws != ws_) {
    return;
  }
  writing_ = false;
  if (ec) {
    return HandleDisconnect(ws, ec.message());
  }
  WriteNext();
}

void ChatClient::HandleDisconnect(const std::shared_ptr<WebSocket>& ws, const std::string& reason) {
  if (ws != ws_) {
    return;
  }
  ws_.reset();
  read_buffer_.reset();
  send_queue_.clear();
  writing_ = false;
  boost::beast::error_code ignored;
  boost::beast::get_lowest_layer(*ws).socket().close(ignored);
  typing_.Clear();
  emitter_.Reset();
  if (connected_.exchange(false)) {
    if (listeners_.on_connection_changed) {
      listeners_.on_connection_changed(false);
    }
  }
  ReportError("disconnected", reason);
  ScheduleReconnect();
}

void ChatClient::ScheduleReconnect() {
  if (stopping_) {
    return;
  }
  std::weak_ptr<ChatClient> weak = weak_from_this();
  scheduler_.Schedule(options_.reconnect_delay, [weak]() {
    if (auto self = weak.lock()) {
      self->DoResolve();
    }
  });
}

void ChatClient::ReportError(const std::string& code, const std::string& message) {
  if (listeners_.on_error) {
    listeners_.on_error(code, message);
  }
}

}  // namespace chatsync::client
