/*
 * 설명: JSON 응답 엔벨로프와 WS 프레임을 생성하고 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: common/tests/unit/json_envelope_test.cpp
 */
#include "chatsync/api_response.hpp"

#include <chrono>

#include "chatsync/message.hpp"

namespace chatsync {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

WsEnvelope MakeEventEnvelope(std::string_view event, const nlohmann::json& payload, std::uint64_t seq) {
  return WsEnvelope{.type = "event", .event = std::string(event), .seq = seq, .payload = payload};
}

WsEnvelope MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq) {
  return WsEnvelope{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
}

std::optional<WsEnvelope> ParseWsFrame(std::string_view text, std::string& error_code, std::string& error_message) {
  auto frame = nlohmann::json::parse(text, nullptr, false);
  if (frame.is_discarded() || !frame.is_object()) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  WsEnvelope env{.type = "", .event = "", .seq = 0, .payload = nullptr};
  auto seq_it = frame.find("seq");
  if (seq_it != frame.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = frame.find("t");
  if (type_it == frame.end() || !type_it->is_string()) {
    error_code = "bad_request";
    error_message = "잘못된 메시지 형식";
    return std::nullopt;
  }
  env.type = type_it->get<std::string>();
  if (env.type == "event") {
    auto event_it = frame.find("event");
    if (event_it == frame.end() || !event_it->is_string()) {
      error_code = "bad_request";
      error_message = "event 필드가 필요합니다";
      return std::nullopt;
    }
    env.event = event_it->get<std::string>();
  } else if (env.type != "error") {
    error_code = "bad_request";
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }
  auto payload_it = frame.find("p");
  if (payload_it != frame.end()) {
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace chatsync
