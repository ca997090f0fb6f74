/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/api_flow_test.cpp
 */
#include <csignal>
#include <iostream>
#include <stdexcept>

#include "wordle/app.hpp"

int main() {
  using namespace wordle;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
