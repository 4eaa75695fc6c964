/*
 * 설명: 만료 정리 데몬 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>

#include "tokenguard/app.hpp"

int main() {
  using namespace tokenguard;
  try {
    AppConfig config = LoadConfigFromEnv();
    SweeperApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "기동 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
