#include "SessionCodec.hpp"

#include "TestHeaders.hpp"

using namespace scanlink;

namespace {
Message decodeOrFail(const string& frame) {
  auto result = SessionCodec::decode(frame);
  INFO(result.getDetail());
  REQUIRE(result.isOk());
  return result.getMessage();
}
}  // namespace

TEST_CASE("Encodes the hello frame", "[SessionCodec]") {
  auto frame = json::parse(SessionCodec::encode(Message::hello("abc123")));
  REQUIRE(frame["type"] == "hello");
  REQUIRE(frame["role"] == "device");
  REQUIRE(frame["token"] == "abc123");
}

TEST_CASE("Encodes control and text frames", "[SessionCodec]") {
  auto start =
      json::parse(SessionCodec::encode(Message::control(ControlAction::START)));
  REQUIRE(start["type"] == "control");
  REQUIRE(start["action"] == "start");

  auto status = json::parse(SessionCodec::encode(Message::status("Ready")));
  REQUIRE(status["type"] == "status");
  REQUIRE(status["text"] == "Ready");

  auto keepalive = json::parse(SessionCodec::encode(Message::keepalive()));
  REQUIRE(keepalive == json{{"type", "keepalive"}});
}

TEST_CASE("Encoded frames never contain a newline", "[SessionCodec]") {
  string frame = SessionCodec::encode(Message::instruction("line one\nline two"));
  REQUIRE(frame.find('\n') == string::npos);
  REQUIRE(decodeOrFail(frame).getText() == "line one\nline two");
}

TEST_CASE("Room updates carry any payload", "[SessionCodec]") {
  json stats = {{"walls", 4}, {"doors", 1}, {"progress", 0.5}};
  auto message = decodeOrFail(SessionCodec::encode(Message::roomUpdate(stats)));
  REQUIRE(message.getType() == MessageType::ROOM_UPDATE);
  REQUIRE(message.getPayload() == stats);

  auto wrapped = Message::roomUpdate(json(42));
  REQUIRE(wrapped.getPayload() == json{{"value", 42}});
}

TEST_CASE("Decodes console frames", "[SessionCodec]") {
  REQUIRE(decodeOrFail(R"({"type":"control","action":"stop"})") ==
          Message::control(ControlAction::STOP));
  REQUIRE(decodeOrFail(R"({"type":"hello_ack"})") == Message::helloAck());
  REQUIRE(decodeOrFail(R"({"type":"hello_reject","reason":"Invalid token"})") ==
          Message::helloReject("Invalid token"));
  REQUIRE(decodeOrFail(R"({"type":"instruction","text":"Turn left"})") ==
          Message::instruction("Turn left"));
  REQUIRE(decodeOrFail(R"({"type":"keepalive"})") == Message::keepalive());
}

TEST_CASE("Accepts alternate field names", "[SessionCodec]") {
  REQUIRE(decodeOrFail(R"({"type":"status","message":"Uploading"})") ==
          Message::status("Uploading"));
  REQUIRE(decodeOrFail(R"({"type":"instruction","value":"Slow down"})") ==
          Message::instruction("Slow down"));
  REQUIRE(decodeOrFail(R"({"type":"hello_reject","error":"Expired"})") ==
          Message::helloReject("Expired"));
  REQUIRE(decodeOrFail(R"({"type":"hello_reject"})") ==
          Message::helloReject(""));
}

TEST_CASE("Room updates without a payload field use the frame",
          "[SessionCodec]") {
  auto message =
      decodeOrFail(R"({"type":"room_update","token":"t","walls":3,"doors":2})");
  REQUIRE(message.getPayload() == json({{"walls", 3}, {"doors", 2}}));
}

TEST_CASE("Unknown types are reported as such", "[SessionCodec]") {
  auto result = SessionCodec::decode(R"({"type":"reboot"})");
  REQUIRE_FALSE(result.isOk());
  REQUIRE(result.getError() == DecodeError::UNKNOWN_TYPE);
}

TEST_CASE("Corrupt frames are malformed, never fatal", "[SessionCodec]") {
  const vector<string> frames = {
      "",
      "not json",
      "{\"type\":",
      "[1,2,3]",
      "\"hello\"",
      "{}",
      R"({"type":7})",
      R"({"type":"control"})",
      R"({"type":"control","action":"pause"})",
      R"({"type":"control","action":1})",
      R"({"type":"status"})",
      R"({"type":"status","text":5})",
      R"({"type":"room_update","payload":[1,2]})",
      R"({"type":"hello","token":"abc"})",
      R"({"type":"hello","role":"console","token":"abc"})",
      R"({"type":"hello","role":"device"})",
  };
  for (const auto& frame : frames) {
    INFO(frame);
    auto result = SessionCodec::decode(frame);
    REQUIRE_FALSE(result.isOk());
    REQUIRE(result.getError() == DecodeError::MALFORMED);
    REQUIRE_FALSE(result.getDetail().empty());
  }
}

TEST_CASE("Type names map both ways", "[SessionCodec]") {
  REQUIRE(string(SessionCodec::typeName(MessageType::HELLO_REJECT)) ==
          "hello_reject");
  REQUIRE(SessionCodec::typeFromName("room_update") == MessageType::ROOM_UPDATE);
  REQUIRE_FALSE(SessionCodec::typeFromName("Room_Update").has_value());
}
