/*
 * 설명: 노드 상태 머신으로 요청 하나를 처리해 상관된 응답 하나를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/node_step_test.cpp, maelnode/tests/e2e/stdio_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "maelnode/message.hpp"
#include "maelnode/unique_id.hpp"

namespace maelnode {

enum class NodeErrorKind { kDeserialization, kProtocolViolation, kWrite };

std::string_view ErrorKindName(NodeErrorKind kind);

struct NodeError {
  NodeErrorKind kind;
  std::string message;
};

struct StepResult {
  bool ok{false};
  std::optional<Message> reply;
  std::optional<NodeError> error;
};

// 단일 스레드 전용이다. 여러 스레드에서 Step을 호출하려면 numeric_id_ 증가를
// 하나의 소유자나 원자적 연산으로 직렬화해야 msg_id 고유성이 유지된다.
class Node {
 public:
  explicit Node(std::uint64_t initial_id = 0);

  // 응답 한 줄을 기록한 뒤에만 카운터를 1 증가시킨다. 실패 시 카운터는 그대로다.
  StepResult Step(const Message& input, std::ostream& out);

  std::uint64_t NumericId() const { return numeric_id_; }
  bool Initialized() const { return initialized_; }
  const std::string& NodeId() const { return node_id_; }
  const std::vector<std::string>& NodeIds() const { return node_ids_; }
  UniqueIdGenerator& IdGenerator() { return id_generator_; }

 private:
  Message BuildReply(const Message& input, Payload payload) const;
  StepResult Emit(Message reply, std::ostream& out);
  StepResult RejectUnexpected(const Message& input) const;

  std::uint64_t numeric_id_;
  bool initialized_{false};
  std::string node_id_;
  std::vector<std::string> node_ids_;
  UniqueIdGenerator id_generator_;
};

}  // namespace maelnode
