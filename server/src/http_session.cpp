/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/메시지 조회/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "chatsync/http_session.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "chatsync/api_response.hpp"
#include "chatsync/message.hpp"
#include "chatsync/websocket_session.hpp"

namespace chatsync {

namespace {
constexpr const char* kServerName = "chatsync";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

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

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() != http::verb::get) {
    return Respond(res, http::status::method_not_allowed,
                   MakeErrorEnvelope("method_not_allowed", "GET만 지원합니다"));
  }

  if (path == "/api/health") {
    return Respond(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"messages", {{"appended", snapshot.messages_appended}}},
                        {"broadcasts", {{"total", snapshot.broadcasts},
                                        {"deliveryFailures", snapshot.delivery_failures}}},
                        {"store", {{"failures", snapshot.store_failures}}}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/api/messages" || path == "/messages") {
    auto history = coordinator_->History();
    if (history.status != MutationStatus::kApplied) {
      return Respond(res, http::status::internal_server_error,
                     MakeErrorEnvelope(ToErrorCode(history.status), "메시지를 불러오지 못했습니다"));
    }
    return Respond(res, http::status::ok, MakeSuccessEnvelope(MessagesToJson(history.messages)));
  }

  Respond(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::Respond(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                          const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = std::string(req_.target());
  ctx.latency_ms = static_cast<long>(latency);
  ctx.detail = std::to_string(res->result_int());
  observability_->Log(ctx);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::get_lowest_layer(stream_).expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), coordinator_, observability_, config_.ws_queue_limit_messages,
                                       config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "ws.accept_failed", std::nullopt, ex.what());
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

}  // namespace chatsync
