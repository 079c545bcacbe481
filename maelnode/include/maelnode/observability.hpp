/*
 * 설명: 구조화 로그와 간단한 메시지 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace maelnode {

enum class LogLevel { kDebug, kInfo, kError, kOff };

LogLevel ParseLogLevel(std::string_view value);

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  std::optional<std::uint64_t> msg_id;
  std::optional<std::string> type;
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t messages_received{0};
  std::uint64_t replies_sent{0};
  std::uint64_t errors{0};
};

// stdout은 프로토콜 채널이므로 로그 싱크는 별도로 받는다.
class Observability {
 public:
  Observability(std::ostream& sink, LogLevel level);

  std::string NextTraceId();
  void IncrementReceived();
  void IncrementReplied();
  void IncrementError();
  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const;
  void Log(LogLevel level, const LogContext& ctx) const;

 private:
  std::ostream& sink_;
  LogLevel level_;
  std::atomic<std::uint64_t> messages_received_{0};
  std::atomic<std::uint64_t> replies_sent_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace maelnode
