/*
 * 설명: 메시지 JSON 변환과 ISO-8601 타임스탬프 파싱/포맷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: common/tests/unit/message_json_test.cpp
 */
#include "chatsync/message.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatsync {
namespace {
bool ReadDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

// TimePoint 해상도(libstdc++는 나노초)로 표현 가능한 밀리초 범위
constexpr std::int64_t kMinRepresentableMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::min()).count();
constexpr std::int64_t kMaxRepresentableMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count();

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}
}  // namespace

bool ChatMessage::HasReader(std::string_view name) const {
  return std::find(read_by.begin(), read_by.end(), name) != read_by.end();
}

std::int64_t ToEpochMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromEpochMillis(std::int64_t millis) {
  millis = std::clamp(millis, kMinRepresentableMillis, kMaxRepresentableMillis);
  return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis))};
}

std::optional<TimePoint> TryFromEpochMillis(std::int64_t millis) {
  if (millis < kMinRepresentableMillis || millis > kMaxRepresentableMillis) {
    return std::nullopt;
  }
  return FromEpochMillis(millis);
}

std::string ToIsoString(TimePoint tp) {
  auto millis = ToEpochMillis(tp);
  auto seconds = millis / 1000;
  auto remainder = millis % 1000;
  if (remainder < 0) {
    remainder += 1000;
    seconds -= 1;
  }
  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << remainder << 'Z';
  return oss.str();
}

std::optional<TimePoint> ParseIsoTimestamp(std::string_view text) {
  std::size_t pos = 0;
  std::tm tm{};
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) ||
      !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    ++pos;
    if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!ReadDigits(text, pos, 2, second)) {
        return std::nullopt;
      }
    }
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::int64_t millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  std::int64_t offset_minutes = 0;
  if (pos < text.size()) {
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int off_hour = 0;
      int off_minute = 0;
      if (!ReadDigits(text, pos, 2, off_hour)) {
        return std::nullopt;
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!ReadDigits(text, pos, 2, off_minute)) {
        return std::nullopt;
      }
      offset_minutes = off_hour * 60 + off_minute;
      if (zone == '-') {
        offset_minutes = -offset_minutes;
      }
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  std::int64_t epoch_millis = (static_cast<std::int64_t>(seconds) - offset_minutes * 60) * 1000 + millis;
  return TryFromEpochMillis(epoch_millis);
}

std::optional<TimePoint> ParseTimestampField(const nlohmann::json& value) {
  if (value.is_string()) {
    return ParseIsoTimestamp(value.get<std::string>());
  }
  if (value.is_number_unsigned()) {
    auto millis = value.get<std::uint64_t>();
    if (millis > static_cast<std::uint64_t>(kMaxRepresentableMillis)) {
      return std::nullopt;
    }
    return TryFromEpochMillis(static_cast<std::int64_t>(millis));
  }
  if (value.is_number_integer()) {
    return TryFromEpochMillis(value.get<std::int64_t>());
  }
  return std::nullopt;
}

nlohmann::json MessageToJson(const ChatMessage& message) {
  nlohmann::json j{{"id", message.id},
                   {"author", message.author},
                   {"body", message.body},
                   {"createdAt", ToIsoString(message.created_at)},
                   {"deleted", message.deleted},
                   {"edited", message.edited},
                   {"readBy", message.read_by}};
  j["lastEditAt"] = message.last_edit_at ? nlohmann::json(ToIsoString(*message.last_edit_at)) : nlohmann::json(nullptr);
  return j;
}

ChatMessage MessageFromJson(const nlohmann::json& value) {
  ChatMessage message;
  message.id = value.at("id").get<std::string>();
  message.author = value.value("author", std::string{kAnonymousName});
  message.body = value.value("body", std::string{});
  auto created = value.contains("createdAt") ? ParseTimestampField(value["createdAt"]) : std::nullopt;
  message.created_at = created.value_or(TimePoint{});
  message.deleted = value.value("deleted", false);
  message.edited = value.value("edited", false);
  if (value.contains("lastEditAt")) {
    message.last_edit_at = ParseTimestampField(value["lastEditAt"]);
  }
  if (value.contains("readBy") && value["readBy"].is_array()) {
    for (const auto& reader : value["readBy"]) {
      if (reader.is_string() && !message.HasReader(reader.get<std::string>())) {
        message.read_by.push_back(reader.get<std::string>());
      }
    }
  }
  return message;
}

nlohmann::json MessagesToJson(const std::vector<ChatMessage>& messages) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& message : messages) {
    list.push_back(MessageToJson(message));
  }
  return list;
}

}  // namespace chatsync
