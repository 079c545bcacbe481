/*
 * 설명: 노드 실행 루프와 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/e2e/stdio_flow_test.cpp
 */
#include "maelnode/runtime.hpp"

#include <chrono>
#include <cstdlib>
#include <sstream>

namespace maelnode {

NodeRuntime::NodeRuntime(const NodeConfig& config, std::ostream& log_sink)
    : config_(config), observability_(std::make_shared<Observability>(log_sink, ParseLogLevel(config.log_level))) {}

RunOutcome NodeRuntime::Run(std::istream& in, std::ostream& out) {
  RunOutcome outcome;
  const auto run_trace = observability_->NextTraceId();
  observability_->Log(LogLevel::kInfo, LogContext{.trace_id = run_trace, .name = "node.start"});

  while (true) {
    nlohmann::ordered_json value;
    std::string error_message;
    auto status = ReadNext(in, value, error_message);
    if (status == ReadStatus::kEnd) {
      break;
    }

    const auto index = outcome.processed + 1;
    const auto trace_id = observability_->NextTraceId();
    const auto started = std::chrono::steady_clock::now();
    observability_->IncrementReceived();
    if (status == ReadStatus::kError) {
      return Fail(outcome, NodeError{NodeErrorKind::kDeserialization, error_message}, trace_id);
    }

    auto message = FromJson(value, error_message);
    if (!message) {
      return Fail(outcome, NodeError{NodeErrorKind::kDeserialization, "메시지 형식 오류: " + error_message},
                  trace_id);
    }

    auto result = node_.Step(*message, out);
    if (!result.ok) {
      return Fail(outcome, *result.error, trace_id);
    }
    observability_->IncrementReplied();
    outcome.processed = index;

    if (observability_->Enabled(LogLevel::kDebug)) {
      auto elapsed = std::chrono::steady_clock::now() - started;
      LogContext ctx;
      ctx.trace_id = trace_id;
      ctx.name = "message.replied";
      ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
      ctx.msg_id = result.reply->body.msg_id;
      ctx.type = std::string(PayloadTypeName(message->body.payload));
      observability_->Log(LogLevel::kDebug, ctx);
    }
  }

  outcome.ok = true;
  LogShutdown(run_trace);
  return outcome;
}

NodeRuntime::ReadStatus NodeRuntime::ReadNext(std::istream& in, nlohmann::ordered_json& value,
                                              std::string& error_message) {
  in >> std::ws;
  if (in.peek() == std::istream::traits_type::eof()) {
    return ReadStatus::kEnd;
  }
  try {
    in >> value;
  } catch (const nlohmann::json::exception& ex) {
    error_message = std::string("JSON 파싱 오류: ") + ex.what();
    return ReadStatus::kError;
  }
  return ReadStatus::kValue;
}

RunOutcome NodeRuntime::Fail(RunOutcome outcome, NodeError error, const std::string& trace_id) {
  observability_->IncrementError();
  LogContext ctx;
  ctx.trace_id = trace_id;
  ctx.name = "message.failed";
  ctx.type = std::string(ErrorKindName(error.kind));
  ctx.detail = error.message;
  observability_->Log(LogLevel::kError, ctx);

  outcome.ok = false;
  outcome.error = std::move(error);
  LogShutdown(trace_id);
  return outcome;
}

void NodeRuntime::LogShutdown(const std::string& trace_id) const {
  auto snapshot = observability_->Snapshot();
  std::ostringstream detail;
  detail << "received=" << snapshot.messages_received << " replied=" << snapshot.replies_sent
         << " errors=" << snapshot.errors << " next_msg_id=" << node_.NumericId();
  LogContext ctx;
  ctx.trace_id = trace_id;
  ctx.name = "node.shutdown";
  ctx.detail = detail.str();
  observability_->Log(LogLevel::kInfo, ctx);
}

std::string FormatDiagnostic(const RunOutcome& outcome) {
  if (outcome.ok || !outcome.error) {
    return {};
  }
  std::ostringstream oss;
  oss << "입력 #" << (outcome.processed + 1) << " 처리 실패 (" << ErrorKindName(outcome.error->kind)
      << "): " << outcome.error->message;
  return oss.str();
}

NodeConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  NodeConfig cfg;
  cfg.log_level = get_env("MAELNODE_LOG_LEVEL", "info");
  return cfg;
}

}  // namespace maelnode
