/*
 * 설명: 서버 진입점으로 환경설정을 로드/검증해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include <exception>
#include <iostream>

#include "collab/app.hpp"

int main() {
  using namespace collab;
  AppConfig config{};
  try {
    config = LoadConfigFromEnv();
    ValidateConfig(config);
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  app.Run();
  return 0;
}
