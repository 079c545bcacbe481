/*
 * 설명: 평탄화된 body 형태로 메시지를 JSON과 상호 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: maelnode/tests/unit/message_codec_test.cpp
 */
#include "maelnode/message.hpp"

#include <type_traits>

namespace maelnode {
namespace {

template <typename T>
inline constexpr bool kAlwaysFalse = false;

bool ReadOptionalId(const nlohmann::ordered_json& body, const char* key, std::optional<std::uint64_t>& out,
                    std::string& error_message) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    out.reset();
    return true;
  }
  if (!it->is_number_unsigned()) {
    error_message = std::string(key) + " 필드는 0 이상의 정수여야 합니다";
    return false;
  }
  out = it->get<std::uint64_t>();
  return true;
}

bool ReadString(const nlohmann::ordered_json& object, const char* key, std::string& out,
                std::string& error_message) {
  auto it = object.find(key);
  if (it == object.end()) {
    error_message = std::string(key) + " 필드가 필요합니다";
    return false;
  }
  if (!it->is_string()) {
    error_message = std::string(key) + " 필드는 문자열이어야 합니다";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadStringList(const nlohmann::ordered_json& object, const char* key, std::vector<std::string>& out,
                    std::string& error_message) {
  auto it = object.find(key);
  if (it == object.end()) {
    error_message = std::string(key) + " 필드가 필요합니다";
    return false;
  }
  if (!it->is_array()) {
    error_message = std::string(key) + " 필드는 배열이어야 합니다";
    return false;
  }
  out.clear();
  out.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      error_message = std::string(key) + " 배열의 원소는 문자열이어야 합니다";
      return false;
    }
    out.push_back(item.get<std::string>());
  }
  return true;
}

std::optional<Payload> ReadPayload(const nlohmann::ordered_json& body, std::string& error_message) {
  std::string type;
  if (!ReadString(body, "type", type, error_message)) {
    return std::nullopt;
  }

  if (type == "init") {
    Init init;
    if (!ReadString(body, "node_id", init.node_id, error_message) ||
        !ReadStringList(body, "node_ids", init.node_ids, error_message)) {
      return std::nullopt;
    }
    return init;
  }
  if (type == "init_ok") {
    return InitOk{};
  }
  if (type == "echo") {
    Echo echo;
    if (!ReadString(body, "echo", echo.echo, error_message)) {
      return std::nullopt;
    }
    return echo;
  }
  if (type == "echo_ok") {
    EchoOk echo_ok;
    if (!ReadString(body, "echo", echo_ok.echo, error_message)) {
      return std::nullopt;
    }
    return echo_ok;
  }
  if (type == "generate") {
    return Generate{};
  }
  if (type == "generate_ok") {
    GenerateOk generate_ok;
    if (!ReadString(body, "id", generate_ok.id, error_message)) {
      return std::nullopt;
    }
    return generate_ok;
  }

  error_message = "알 수 없는 메시지 유형: " + type;
  return std::nullopt;
}

}  // namespace

bool operator==(const Init& lhs, const Init& rhs) {
  return lhs.node_id == rhs.node_id && lhs.node_ids == rhs.node_ids;
}
bool operator==(const InitOk&, const InitOk&) { return true; }
bool operator==(const Echo& lhs, const Echo& rhs) { return lhs.echo == rhs.echo; }
bool operator==(const EchoOk& lhs, const EchoOk& rhs) { return lhs.echo == rhs.echo; }
bool operator==(const Generate&, const Generate&) { return true; }
bool operator==(const GenerateOk& lhs, const GenerateOk& rhs) { return lhs.id == rhs.id; }

bool operator==(const MessageBody& lhs, const MessageBody& rhs) {
  return lhs.msg_id == rhs.msg_id && lhs.in_reply_to == rhs.in_reply_to && lhs.payload == rhs.payload;
}

bool operator==(const Message& lhs, const Message& rhs) {
  return lhs.src == rhs.src && lhs.dest == rhs.dest && lhs.body == rhs.body;
}

std::string_view PayloadTypeName(const Payload& payload) {
  return std::visit(
      [](const auto& value) -> std::string_view {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Init>) {
          return "init";
        } else if constexpr (std::is_same_v<T, InitOk>) {
          return "init_ok";
        } else if constexpr (std::is_same_v<T, Echo>) {
          return "echo";
        } else if constexpr (std::is_same_v<T, EchoOk>) {
          return "echo_ok";
        } else if constexpr (std::is_same_v<T, Generate>) {
          return "generate";
        } else if constexpr (std::is_same_v<T, GenerateOk>) {
          return "generate_ok";
        } else {
          static_assert(kAlwaysFalse<T>, "처리되지 않은 페이로드 유형");
        }
      },
      payload);
}

bool IsReplyPayload(const Payload& payload) {
  return std::holds_alternative<InitOk>(payload) || std::holds_alternative<EchoOk>(payload) ||
         std::holds_alternative<GenerateOk>(payload);
}

nlohmann::ordered_json ToJson(const Message& message) {
  nlohmann::ordered_json body = nlohmann::ordered_json::object();
  if (message.body.msg_id) {
    body["msg_id"] = *message.body.msg_id;
  }
  if (message.body.in_reply_to) {
    body["in_reply_to"] = *message.body.in_reply_to;
  }
  body["type"] = std::string(PayloadTypeName(message.body.payload));
  std::visit(
      [&body](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Init>) {
          body["node_id"] = value.node_id;
          body["node_ids"] = value.node_ids;
        } else if constexpr (std::is_same_v<T, Echo> || std::is_same_v<T, EchoOk>) {
          body["echo"] = value.echo;
        } else if constexpr (std::is_same_v<T, GenerateOk>) {
          body["id"] = value.id;
        }
      },
      message.body.payload);

  nlohmann::ordered_json j;
  j["src"] = message.src;
  j["dest"] = message.dest;
  j["body"] = std::move(body);
  return j;
}

std::string SerializeMessage(const Message& message) { return ToJson(message).dump(); }

std::optional<Message> FromJson(const nlohmann::ordered_json& json, std::string& error_message) {
  if (!json.is_object()) {
    error_message = "메시지는 JSON 객체여야 합니다";
    return std::nullopt;
  }

  Message message;
  if (!ReadString(json, "src", message.src, error_message) ||
      !ReadString(json, "dest", message.dest, error_message)) {
    return std::nullopt;
  }

  auto body_it = json.find("body");
  if (body_it == json.end() || !body_it->is_object()) {
    error_message = "body 객체가 필요합니다";
    return std::nullopt;
  }
  const auto& body = *body_it;
  if (!ReadOptionalId(body, "msg_id", message.body.msg_id, error_message) ||
      !ReadOptionalId(body, "in_reply_to", message.body.in_reply_to, error_message)) {
    return std::nullopt;
  }

  auto payload = ReadPayload(body, error_message);
  if (!payload) {
    return std::nullopt;
  }
  message.body.payload = std::move(*payload);
  return message;
}

std::optional<Message> ParseMessage(std::string_view text, std::string& error_message) {
  nlohmann::ordered_json json = nlohmann::ordered_json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  return FromJson(json, error_message);
}

}  // namespace maelnode
