/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chatsync {

struct AppConfig {
  unsigned short port;
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t history_limit;
  std::size_t edit_cooldown_seconds;
  bool notify_denials;
};

// 숫자/불리언 형식이 잘못되면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace chatsync
