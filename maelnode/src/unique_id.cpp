/*
 * 설명: 초 단위 타임스탬프 기반 고유 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/unique_id_test.cpp
 */
#include "maelnode/unique_id.hpp"

#include <chrono>
#include <sstream>

namespace maelnode {

UniqueIdGenerator::UniqueIdGenerator() : clock_(&UniqueIdGenerator::SystemSeconds) {}

std::int64_t UniqueIdGenerator::SystemSeconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::string UniqueIdGenerator::Generate(std::uint64_t node_numeric_id, std::string_view destination) const {
  std::ostringstream oss;
  oss << clock_() << "_" << destination << "_" << node_numeric_id;
  return oss.str();
}

void UniqueIdGenerator::SetClock(const Clock& clock) {
  clock_ = clock ? clock : Clock(&UniqueIdGenerator::SystemSeconds);
}

}  // namespace maelnode
