/*
 * 설명: 벽시계 초, 목적지 노드 id, 노드 카운터로 고유 식별자를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/unique_id_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace maelnode {

// 형식은 "{unix_seconds}_{destination}_{node_numeric_id}" 이며 자릿수 패딩이 없다.
// 고유성은 같은 초 안에서 (목적지, 카운터) 쌍이 겹치지 않을 때만 성립한다.
// 재시작으로 카운터가 0으로 돌아가거나 같은 id를 쓰는 노드가 둘이면 충돌한다.
// 카운터 폭이 고정되지 않아 같은 초 안의 사전순 정렬도 깨진다 ("_10" < "_9").
// 하위 소비자가 이 형식에 의존하므로 형식을 바꾸지 않는다.
class UniqueIdGenerator {
 public:
  using Clock = std::function<std::int64_t()>;

  UniqueIdGenerator();

  std::string Generate(std::uint64_t node_numeric_id, std::string_view destination) const;

  void SetClock(const Clock& clock);

  static std::int64_t SystemSeconds();

 private:
  Clock clock_;
};

}  // namespace maelnode
