/*
 * 설명: 페이로드 유형별로 요청을 분기해 응답을 기록하고 메시지 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/node_step_test.cpp, maelnode/tests/e2e/stdio_flow_test.cpp
 */
#include "maelnode/node.hpp"

#include <utility>

namespace maelnode {
namespace {
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

StepResult Failure(NodeErrorKind kind, std::string message) {
  return StepResult{false, std::nullopt, NodeError{kind, std::move(message)}};
}
}  // namespace

std::string_view ErrorKindName(NodeErrorKind kind) {
  switch (kind) {
    case NodeErrorKind::kDeserialization:
      return "deserialization_error";
    case NodeErrorKind::kProtocolViolation:
      return "protocol_violation";
    case NodeErrorKind::kWrite:
      return "write_error";
  }
  return "unknown_error";
}

Node::Node(std::uint64_t initial_id) : numeric_id_(initial_id) {}

StepResult Node::Step(const Message& input, std::ostream& out) {
  return std::visit(
      Overloaded{
          [&](const Init& init) {
            auto result = Emit(BuildReply(input, InitOk{}), out);
            if (result.ok) {
              initialized_ = true;
              node_id_ = init.node_id;
              node_ids_ = init.node_ids;
            }
            return result;
          },
          [&](const Echo& echo) { return Emit(BuildReply(input, EchoOk{echo.echo}), out); },
          [&](const Generate&) {
            auto id = id_generator_.Generate(numeric_id_, input.dest);
            return Emit(BuildReply(input, GenerateOk{std::move(id)}), out);
          },
          [&](const InitOk&) { return RejectUnexpected(input); },
          [&](const EchoOk&) { return RejectUnexpected(input); },
          [&](const GenerateOk&) { return RejectUnexpected(input); },
      },
      input.body.payload);
}

Message Node::BuildReply(const Message& input, Payload payload) const {
  Message reply;
  reply.src = input.dest;
  reply.dest = input.src;
  reply.body.msg_id = numeric_id_;
  reply.body.in_reply_to = input.body.msg_id;
  reply.body.payload = std::move(payload);
  return reply;
}

StepResult Node::Emit(Message reply, std::ostream& out) {
  std::string line;
  try {
    line = SerializeMessage(reply);
  } catch (const nlohmann::json::exception& ex) {
    return Failure(NodeErrorKind::kWrite, std::string("응답 직렬화 실패: ") + ex.what());
  }
  line.push_back('\n');

  // 본문과 개행을 한 번에 기록해 다른 단계의 출력과 섞이지 않게 한다.
  out.write(line.data(), static_cast<std::streamsize>(line.size()));
  out.flush();
  if (!out) {
    return Failure(NodeErrorKind::kWrite, "출력 스트림에 응답을 기록하지 못했습니다");
  }

  ++numeric_id_;
  return StepResult{true, std::move(reply), std::nullopt};
}

StepResult Node::RejectUnexpected(const Message& input) const {
  std::string message = "예상하지 않은 ";
  message += PayloadTypeName(input.body.payload);
  message += " 메시지를 수신했습니다 (src=" + input.src + ")";
  return Failure(NodeErrorKind::kProtocolViolation, std::move(message));
}

}  // namespace maelnode
