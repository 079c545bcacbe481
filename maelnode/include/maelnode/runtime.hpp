/*
 * 설명: 입력 스트림의 메시지를 순서대로 노드에 전달하고 실패 시 진단을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/e2e/stdio_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "maelnode/config.hpp"
#include "maelnode/node.hpp"
#include "maelnode/observability.hpp"

namespace maelnode {

struct RunOutcome {
  bool ok{false};
  std::size_t processed{0};
  std::optional<NodeError> error;
};

std::string FormatDiagnostic(const RunOutcome& outcome);

class NodeRuntime {
 public:
  NodeRuntime(const NodeConfig& config, std::ostream& log_sink);

  // 입력이 끝나면 ok, 첫 번째 실패에서 즉시 중단한다.
  RunOutcome Run(std::istream& in, std::ostream& out);

  Node& GetNode() { return node_; }
  const NodeConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  enum class ReadStatus { kValue, kEnd, kError };

  ReadStatus ReadNext(std::istream& in, nlohmann::ordered_json& value, std::string& error_message);
  RunOutcome Fail(RunOutcome outcome, NodeError error, const std::string& trace_id);
  void LogShutdown(const std::string& trace_id) const;

  NodeConfig config_;
  std::shared_ptr<Observability> observability_;
  Node node_;
};

}  // namespace maelnode
