/*
 * 설명: 노드 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/e2e/stdio_flow_test.cpp
 */
#pragma once

#include <string>

namespace maelnode {

struct NodeConfig {
  std::string log_level;
};

NodeConfig LoadConfigFromEnv();

}  // namespace maelnode
