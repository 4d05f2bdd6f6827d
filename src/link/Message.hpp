#ifndef __SCANLINK_MESSAGE__
#define __SCANLINK_MESSAGE__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace scanlink {
enum class MessageType {
  HELLO,
  HELLO_ACK,
  HELLO_REJECT,
  CONTROL,
  ROOM_UPDATE,
  INSTRUCTION,
  STATUS,
  KEEPALIVE,
};

enum class ControlAction {
  START,
  STOP,
};

/**
 * @brief One frame of the device/console protocol.
 *
 * Messages are only built through the named constructors, so an outbound
 * message is always one of the defined variants with its required fields.
 */
class Message {
 public:
  static Message hello(const string& token) {
    Message m(MessageType::HELLO);
    m.role = DEVICE_ROLE;
    m.token = token;
    return m;
  }
  static Message helloAck() { return Message(MessageType::HELLO_ACK); }
  static Message helloReject(const string& reason) {
    Message m(MessageType::HELLO_REJECT);
    m.text = reason;
    return m;
  }
  static Message control(ControlAction action) {
    Message m(MessageType::CONTROL);
    m.action = action;
    return m;
  }
  /** @brief The payload is owned by the capability provider and is never
   * inspected here. Anything that is not a JSON object is wrapped in one. */
  static Message roomUpdate(const json& payload) {
    Message m(MessageType::ROOM_UPDATE);
    if (payload.is_object()) {
      m.payload = payload;
    } else {
      m.payload = json::object();
      m.payload["value"] = payload;
    }
    return m;
  }
  static Message instruction(const string& text) {
    Message m(MessageType::INSTRUCTION);
    m.text = text;
    return m;
  }
  static Message status(const string& text) {
    Message m(MessageType::STATUS);
    m.text = text;
    return m;
  }
  static Message keepalive() { return Message(MessageType::KEEPALIVE); }

  MessageType getType() const { return type; }
  const string& getRole() const { return role; }
  const string& getToken() const { return token; }
  ControlAction getAction() const { return action; }
  const json& getPayload() const { return payload; }
  /** @brief Instruction/status text, or the reason of a rejection. */
  const string& getText() const { return text; }

  bool operator==(const Message& other) const {
    if (type != other.type) {
      return false;
    }
    switch (type) {
      case MessageType::HELLO:
        return role == other.role && token == other.token;
      case MessageType::CONTROL:
        return action == other.action;
      case MessageType::ROOM_UPDATE:
        return payload == other.payload;
      case MessageType::HELLO_REJECT:
      case MessageType::INSTRUCTION:
      case MessageType::STATUS:
        return text == other.text;
      case MessageType::HELLO_ACK:
      case MessageType::KEEPALIVE:
        return true;
    }
    return false;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }

 protected:
  explicit Message(MessageType _type)
      : type(_type), action(ControlAction::STOP), payload(json::object()) {}

  MessageType type;
  string role;
  string token;
  ControlAction action;
  json payload;
  string text;
};

inline const char* controlActionName(ControlAction action) {
  return action == ControlAction::START ? "start" : "stop";
}
}  // namespace scanlink

#endif  // __SCANLINK_MESSAGE__
