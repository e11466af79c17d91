/*
 * 설명: 채팅 메시지 레코드와 타임스탬프 직렬화 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: common/tests/unit/message_json_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatsync {

using TimePoint = std::chrono::system_clock::time_point;

inline constexpr std::string_view kAnonymousName = "Anonymous";

struct ChatMessage {
  std::string id;
  std::string author;
  std::string body;
  TimePoint created_at;
  bool deleted{false};
  bool edited{false};
  std::optional<TimePoint> last_edit_at;
  std::vector<std::string> read_by;

  bool HasReader(std::string_view name) const;
};

std::int64_t ToEpochMillis(TimePoint tp);
// TimePoint로 표현할 수 없는 값은 범위 끝으로 포화시킨다.
TimePoint FromEpochMillis(std::int64_t millis);
// 표현할 수 없는 값이면 nullopt
std::optional<TimePoint> TryFromEpochMillis(std::int64_t millis);

// 2024-05-01T12:30:45.123Z 형식 (UTC, 밀리초)
std::string ToIsoString(TimePoint tp);
std::optional<TimePoint> ParseIsoTimestamp(std::string_view text);

// ISO-8601 문자열 또는 epoch 밀리초 정수를 허용한다. 그 외는 nullopt.
std::optional<TimePoint> ParseTimestampField(const nlohmann::json& value);

nlohmann::json MessageToJson(const ChatMessage& message);
ChatMessage MessageFromJson(const nlohmann::json& value);
nlohmann::json MessagesToJson(const std::vector<ChatMessage>& messages);

}  // namespace chatsync
