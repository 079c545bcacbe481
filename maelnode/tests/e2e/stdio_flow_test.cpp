#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "maelnode/runtime.hpp"

namespace {

maelnode::NodeConfig TestConfig() {
  maelnode::NodeConfig cfg{};
  cfg.log_level = "debug";
  return cfg;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

class StdioFlowFixture : public ::testing::Test {
 protected:
  maelnode::RunOutcome RunWith(const std::string& input) {
    runtime_ = std::make_unique<maelnode::NodeRuntime>(TestConfig(), log_);
    std::istringstream in(input);
    return runtime_->Run(in, out_);
  }

  std::ostringstream out_;
  std::ostringstream log_;
  std::unique_ptr<maelnode::NodeRuntime> runtime_;
};

constexpr const char* kInitRequest =
    R"({"src":"c1","dest":"n1","body":{"msg_id":1,"type":"init","node_id":"n1","node_ids":["n1"]}})";
constexpr const char* kEchoRequest = R"({"src":"c1","dest":"n1","body":{"msg_id":2,"type":"echo","echo":"hello"}})";

}  // namespace

TEST_F(StdioFlowFixture, InitThenEchoProducesExpectedLines) {
  auto outcome = RunWith(std::string(kInitRequest) + "\n" + kEchoRequest + "\n");

  ASSERT_TRUE(outcome.ok) << maelnode::FormatDiagnostic(outcome);
  EXPECT_EQ(outcome.processed, 2u);
  auto lines = SplitLines(out_.str());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], R"({"src":"n1","dest":"c1","body":{"msg_id":0,"in_reply_to":1,"type":"init_ok"}})");
  EXPECT_EQ(lines[1], R"({"src":"n1","dest":"c1","body":{"msg_id":1,"in_reply_to":2,"type":"echo_ok","echo":"hello"}})");
  EXPECT_EQ(runtime_->GetNode().NumericId(), 2u);
  EXPECT_EQ(runtime_->GetNode().NodeId(), "n1");
}

TEST_F(StdioFlowFixture, InitAloneAdvancesCounterToOne) {
  auto outcome = RunWith(std::string(kInitRequest) + "\n");
  ASSERT_TRUE(outcome.ok);
  EXPECT_EQ(out_.str(), "{\"src\":\"n1\",\"dest\":\"c1\",\"body\":{\"msg_id\":0,\"in_reply_to\":1,\"type\":\"init_ok\"}}\n");
  EXPECT_EQ(runtime_->GetNode().NumericId(), 1u);
}

TEST_F(StdioFlowFixture, AcceptsWhitespaceSeparatedValuesWithoutTrailingNewline) {
  auto outcome = RunWith(std::string("  ") + kInitRequest + " \t " + kEchoRequest);
  ASSERT_TRUE(outcome.ok) << maelnode::FormatDiagnostic(outcome);
  EXPECT_EQ(SplitLines(out_.str()).size(), 2u);
}

TEST_F(StdioFlowFixture, EmptyInputExitsCleanly) {
  auto outcome = RunWith("\n\n  ");
  EXPECT_TRUE(outcome.ok);
  EXPECT_EQ(outcome.processed, 0u);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_TRUE(maelnode::FormatDiagnostic(outcome).empty());
}

TEST_F(StdioFlowFixture, GenerateRepliesCarryDistinctIds) {
  std::string input = std::string(kInitRequest) + "\n";
  for (int i = 0; i < 5; ++i) {
    input += R"({"src":"c1","dest":"n1","body":{"msg_id":)" + std::to_string(10 + i) + R"(,"type":"generate"}})" "\n";
  }
  auto outcome = RunWith(input);
  ASSERT_TRUE(outcome.ok) << maelnode::FormatDiagnostic(outcome);

  auto lines = SplitLines(out_.str());
  ASSERT_EQ(lines.size(), 6u);
  std::vector<std::string> ids;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    auto reply = nlohmann::json::parse(lines[i]);
    EXPECT_EQ(reply["body"]["type"], "generate_ok");
    EXPECT_EQ(reply["body"]["in_reply_to"].get<int>(), static_cast<int>(9 + i));
    auto id = reply["body"]["id"].get<std::string>();
    EXPECT_EQ(id.substr(id.find('_')), "_n1_" + std::to_string(i));
    for (const auto& seen : ids) {
      EXPECT_NE(seen, id);
    }
    ids.push_back(id);
  }
}

TEST_F(StdioFlowFixture, ReplyPayloadInputStopsWithoutOutput) {
  const std::vector<std::string> violations{
      R"({"src":"c1","dest":"n1","body":{"msg_id":1,"in_reply_to":0,"type":"init_ok"}})",
      R"({"src":"c1","dest":"n1","body":{"msg_id":1,"type":"echo_ok","echo":"x"}})",
      R"({"src":"c1","dest":"n1","body":{"msg_id":1,"type":"generate_ok","id":"1_n1_0"}})",
  };
  for (const auto& violation : violations) {
    out_.str("");
    auto outcome = RunWith(violation + "\n");
    EXPECT_FALSE(outcome.ok);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, maelnode::NodeErrorKind::kProtocolViolation);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(runtime_->GetNode().NumericId(), 0u);
    EXPECT_NE(maelnode::FormatDiagnostic(outcome).find("#1"), std::string::npos);
  }
}

TEST_F(StdioFlowFixture, ViolationAfterRepliesKeepsEarlierOutput) {
  auto outcome = RunWith(std::string(kInitRequest) + "\n" +
                         R"({"src":"c1","dest":"n1","body":{"type":"echo_ok","echo":"x"}})" + "\n" + kEchoRequest);
  EXPECT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.processed, 1u);
  EXPECT_EQ(SplitLines(out_.str()).size(), 1u);
  auto diagnostic = maelnode::FormatDiagnostic(outcome);
  EXPECT_NE(diagnostic.find("#2"), std::string::npos);
  EXPECT_NE(diagnostic.find("protocol_violation"), std::string::npos);
  EXPECT_NE(diagnostic.find("echo_ok"), std::string::npos);
}

TEST_F(StdioFlowFixture, MalformedJsonIsDeserializationError) {
  auto outcome = RunWith(std::string(kInitRequest) + "\n{\"src\":\"c1\",\n");
  EXPECT_FALSE(outcome.ok);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, maelnode::NodeErrorKind::kDeserialization);
  EXPECT_EQ(SplitLines(out_.str()).size(), 1u);
  EXPECT_NE(maelnode::FormatDiagnostic(outcome).find("deserialization_error"), std::string::npos);
}

TEST_F(StdioFlowFixture, UnknownTypeIsDeserializationError) {
  auto outcome = RunWith(R"({"src":"c1","dest":"n1","body":{"msg_id":1,"type":"broadcast","message":3}})");
  EXPECT_FALSE(outcome.ok);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, maelnode::NodeErrorKind::kDeserialization);
  EXPECT_NE(outcome.error->message.find("broadcast"), std::string::npos);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(StdioFlowFixture, ClosedOutputIsWriteError) {
  out_.setstate(std::ios::badbit);
  auto outcome = RunWith(std::string(kInitRequest) + "\n");
  EXPECT_FALSE(outcome.ok);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, maelnode::NodeErrorKind::kWrite);
  EXPECT_EQ(runtime_->GetNode().NumericId(), 0u);
}

TEST_F(StdioFlowFixture, LogsGoToLogSinkAsJson) {
  auto outcome = RunWith(std::string(kInitRequest) + "\n");
  ASSERT_TRUE(outcome.ok);
  auto records = SplitLines(log_.str());
  ASSERT_GE(records.size(), 3u);
  EXPECT_EQ(nlohmann::json::parse(records.front())["eventName"], "node.start");
  auto replied = nlohmann::json::parse(records[1]);
  EXPECT_EQ(replied["eventName"], "message.replied");
  EXPECT_EQ(replied["type"], "init");
  EXPECT_EQ(replied["msgId"], 0);
  auto shutdown = nlohmann::json::parse(records.back());
  EXPECT_EQ(shutdown["eventName"], "node.shutdown");
  EXPECT_NE(shutdown["detail"].get<std::string>().find("replied=1"), std::string::npos);
}

TEST(NodeConfigTest, LoadsLogLevelFromEnv) {
  ::setenv("MAELNODE_LOG_LEVEL", "error", 1);
  EXPECT_EQ(maelnode::LoadConfigFromEnv().log_level, "error");
  ::unsetenv("MAELNODE_LOG_LEVEL");
  EXPECT_EQ(maelnode::LoadConfigFromEnv().log_level, "info");
}
