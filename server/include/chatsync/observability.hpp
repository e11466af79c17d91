/*
 * 설명: 구조화 JSON 로그와 서버 메트릭 카운터를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatsync {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info로 본다.
LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::uint64_t> connection_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t messages_appended{0};
  std::uint64_t broadcasts{0};
  std::uint64_t delivery_failures{0};
  std::uint64_t store_failures{0};
};

class Observability {
 public:
  // out이 nullptr이면 표준출력에 쓴다.
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* out = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementMessagesAppended();
  void IncrementBroadcast();
  void IncrementDeliveryFailure();
  void IncrementStoreFailure();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return static_cast<int>(level) >= static_cast<int>(min_level_); }
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string_view name, std::optional<std::uint64_t> connection_id = std::nullopt,
             std::string_view detail = {}) const;

 private:
  LogLevel min_level_;
  std::ostream* out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> messages_appended_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> delivery_failures_{0};
  std::atomic<std::uint64_t> store_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace chatsync
