/*
 * 설명: 구조화 로그와 간단한 메시지 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/observability_test.cpp
 */
#include "maelnode/observability.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace maelnode {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kError:
      return "error";
    case LogLevel::kOff:
      return "off";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "off") {
    return LogLevel::kOff;
  }
  return LogLevel::kInfo;
}

Observability::Observability(std::ostream& sink, LogLevel level) : sink_(sink), level_(level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementReceived() { messages_received_.fetch_add(1); }

void Observability::IncrementReplied() { replies_sent_.fetch_add(1); }

void Observability::IncrementError() { errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.messages_received = messages_received_.load();
  snapshot.replies_sent = replies_sent_.load();
  snapshot.errors = errors_.load();
  return snapshot;
}

bool Observability::Enabled(LogLevel level) const {
  return level_ != LogLevel::kOff && level != LogLevel::kOff && level >= level_;
}

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.msg_id) {
    log_json["msgId"] = *ctx.msg_id;
  }
  if (ctx.type) {
    log_json["type"] = *ctx.type;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace maelnode
