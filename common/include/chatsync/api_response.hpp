/*
 * 설명: REST 응답 엔벨로프와 WS 프레임 엔벨로프의 생성/해석을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: common/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatsync {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

WsEnvelope MakeEventEnvelope(std::string_view event, const nlohmann::json& payload, std::uint64_t seq = 0);
WsEnvelope MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq = 0);

// 실패 시 nullopt를 반환하고 error_code/error_message를 채운다.
std::optional<WsEnvelope> ParseWsFrame(std::string_view text, std::string& error_code, std::string& error_message);

}  // namespace chatsync
