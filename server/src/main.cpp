/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "chatsync/app.hpp"

int main() {
  using namespace chatsync;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
