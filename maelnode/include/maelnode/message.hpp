/*
 * 설명: 프로토콜 메시지 엔벨로프와 페이로드 모델, JSON 직렬화/역직렬화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/message_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace maelnode {

struct Init {
  std::string node_id;
  std::vector<std::string> node_ids;
};

struct InitOk {};

struct Echo {
  std::string echo;
};

struct EchoOk {
  std::string echo;
};

struct Generate {};

struct GenerateOk {
  std::string id;
};

// 직렬화 시 "type" 값은 snake_case 변형 이름이다.
using Payload = std::variant<Init, InitOk, Echo, EchoOk, Generate, GenerateOk>;

struct MessageBody {
  std::optional<std::uint64_t> msg_id;
  std::optional<std::uint64_t> in_reply_to;
  Payload payload;
};

struct Message {
  std::string src;
  std::string dest;
  MessageBody body;
};

bool operator==(const Init& lhs, const Init& rhs);
bool operator==(const InitOk& lhs, const InitOk& rhs);
bool operator==(const Echo& lhs, const Echo& rhs);
bool operator==(const EchoOk& lhs, const EchoOk& rhs);
bool operator==(const Generate& lhs, const Generate& rhs);
bool operator==(const GenerateOk& lhs, const GenerateOk& rhs);
bool operator==(const MessageBody& lhs, const MessageBody& rhs);
bool operator==(const Message& lhs, const Message& rhs);

std::string_view PayloadTypeName(const Payload& payload);
bool IsReplyPayload(const Payload& payload);

// 키 순서: src, dest, body / body 내부는 msg_id, in_reply_to, type, 페이로드 필드.
nlohmann::ordered_json ToJson(const Message& message);
std::string SerializeMessage(const Message& message);

std::optional<Message> FromJson(const nlohmann::ordered_json& json, std::string& error_message);
std::optional<Message> ParseMessage(std::string_view text, std::string& error_message);

}  // namespace maelnode
