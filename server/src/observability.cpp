/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "chatsync/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "chatsync/message.hpp"

namespace chatsync {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* out)
    : min_level_(min_level), out_(out ? out : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementMessagesAppended() { messages_appended_.fetch_add(1); }

void Observability::IncrementBroadcast() { broadcasts_.fetch_add(1); }

void Observability::IncrementDeliveryFailure() { delivery_failures_.fetch_add(1); }

void Observability::IncrementStoreFailure() { store_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.messages_appended = messages_appended_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.delivery_failures = delivery_failures_.load();
  snapshot.store_failures = store_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // 사용자 입력이 섞일 수 있으므로 잘못된 UTF-8은 치환한다.
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(out_mutex_);
  *out_ << line << std::endl;
}

void Observability::Event(LogLevel level, std::string_view name, std::optional<std::uint64_t> connection_id,
                          std::string_view detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.name = std::string(name);
  ctx.level = level;
  ctx.connection_id = connection_id;
  ctx.detail = std::string(detail);
  Log(ctx);
}

}  // namespace chatsync
