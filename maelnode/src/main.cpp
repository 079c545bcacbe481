/*
 * 설명: 노드 진입점으로 환경설정을 로드하고 표준 입출력에서 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/e2e/stdio_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include "maelnode/runtime.hpp"

int main() {
  using namespace maelnode;
  // 닫힌 파이프는 시그널 대신 쓰기 오류로 보고되어야 한다.
  std::signal(SIGPIPE, SIG_IGN);
  std::ios::sync_with_stdio(false);

  NodeConfig config = LoadConfigFromEnv();
  NodeRuntime runtime(config, std::cerr);
  RunOutcome outcome = runtime.Run(std::cin, std::cout);
  if (!outcome.ok) {
    std::cerr << FormatDiagnostic(outcome) << "\n";
    return 1;
  }
  return 0;
}
