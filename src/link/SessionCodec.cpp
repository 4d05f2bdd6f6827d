#include "SessionCodec.hpp"

namespace scanlink {
namespace {
const char* TYPE_FIELD = "type";

// Returns the first string-valued field among the candidates
optional<string> firstString(const json& frame,
                             std::initializer_list<const char*> fields) {
  for (auto field : fields) {
    auto it = frame.find(field);
    if (it != frame.end() && it->is_string()) {
      return it->get<string>();
    }
  }
  return std::nullopt;
}

DecodeResult decodeObject(const json& frame) {
  auto typeIt = frame.find(TYPE_FIELD);
  if (typeIt == frame.end() || !typeIt->is_string()) {
    return DecodeResult::failure(DecodeError::MALFORMED,
                                 "Frame has no string type field");
  }
  string typeString = typeIt->get<string>();
  auto type = SessionCodec::typeFromName(typeString);
  if (!type) {
    return DecodeResult::failure(DecodeError::UNKNOWN_TYPE,
                                 "Unknown frame type: " + typeString);
  }

  switch (*type) {
    case MessageType::HELLO: {
      auto role = firstString(frame, {"role"});
      auto token = firstString(frame, {"token"});
      if (!role || *role != DEVICE_ROLE || !token) {
        return DecodeResult::failure(DecodeError::MALFORMED,
                                     "hello needs role device and a token");
      }
      return DecodeResult::ok(Message::hello(*token));
    }
    case MessageType::HELLO_ACK:
      return DecodeResult::ok(Message::helloAck());
    case MessageType::HELLO_REJECT: {
      auto reason = firstString(frame, {"reason", "error"});
      return DecodeResult::ok(Message::helloReject(reason ? *reason : ""));
    }
    case MessageType::CONTROL: {
      auto action = firstString(frame, {"action"});
      if (action && *action == "start") {
        return DecodeResult::ok(Message::control(ControlAction::START));
      }
      if (action && *action == "stop") {
        return DecodeResult::ok(Message::control(ControlAction::STOP));
      }
      return DecodeResult::failure(DecodeError::MALFORMED,
                                   "control action must be start or stop");
    }
    case MessageType::ROOM_UPDATE: {
      auto payloadIt = frame.find("payload");
      if (payloadIt != frame.end()) {
        if (!payloadIt->is_object()) {
          return DecodeResult::failure(DecodeError::MALFORMED,
                                       "room_update payload is not an object");
        }
        return DecodeResult::ok(Message::roomUpdate(*payloadIt));
      }
      // Older consoles put the room statistics next to the type field
      json payload = frame;
      payload.erase(TYPE_FIELD);
      payload.erase("token");
      return DecodeResult::ok(Message::roomUpdate(payload));
    }
    case MessageType::INSTRUCTION:
    case MessageType::STATUS: {
      auto text = firstString(frame, {"text", "message", "value"});
      if (!text) {
        return DecodeResult::failure(DecodeError::MALFORMED,
                                     typeString + " has no text");
      }
      if (*type == MessageType::INSTRUCTION) {
        return DecodeResult::ok(Message::instruction(*text));
      }
      return DecodeResult::ok(Message::status(*text));
    }
    case MessageType::KEEPALIVE:
      return DecodeResult::ok(Message::keepalive());
  }
  return DecodeResult::failure(DecodeError::UNKNOWN_TYPE,
                               "Unhandled frame type: " + typeString);
}
}  // namespace

const char* decodeErrorName(DecodeError error) {
  switch (error) {
    case DecodeError::NONE:
      return "None";
    case DecodeError::UNKNOWN_TYPE:
      return "UnknownType";
    case DecodeError::MALFORMED:
      return "Malformed";
  }
  return "Unknown";
}

const char* SessionCodec::typeName(MessageType type) {
  switch (type) {
    case MessageType::HELLO:
      return "hello";
    case MessageType::HELLO_ACK:
      return "hello_ack";
    case MessageType::HELLO_REJECT:
      return "hello_reject";
    case MessageType::CONTROL:
      return "control";
    case MessageType::ROOM_UPDATE:
      return "room_update";
    case MessageType::INSTRUCTION:
      return "instruction";
    case MessageType::STATUS:
      return "status";
    case MessageType::KEEPALIVE:
      return "keepalive";
  }
  STFATAL << "Invalid message type: " << int(type);
  return "";
}

optional<MessageType> SessionCodec::typeFromName(const string& name) {
  static const map<string, MessageType> NAMES = {
      {"hello", MessageType::HELLO},
      {"hello_ack", MessageType::HELLO_ACK},
      {"hello_reject", MessageType::HELLO_REJECT},
      {"control", MessageType::CONTROL},
      {"room_update", MessageType::ROOM_UPDATE},
      {"instruction", MessageType::INSTRUCTION},
      {"status", MessageType::STATUS},
      {"keepalive", MessageType::KEEPALIVE},
  };
  auto it = NAMES.find(name);
  if (it == NAMES.end()) {
    return std::nullopt;
  }
  return it->second;
}

string SessionCodec::encode(const Message& message) {
  json frame;
  frame[TYPE_FIELD] = typeName(message.getType());
  switch (message.getType()) {
    case MessageType::HELLO:
      frame["role"] = message.getRole();
      frame["token"] = message.getToken();
      break;
    case MessageType::HELLO_REJECT:
      frame["reason"] = message.getText();
      break;
    case MessageType::CONTROL:
      frame["action"] = controlActionName(message.getAction());
      break;
    case MessageType::ROOM_UPDATE:
      frame["payload"] = message.getPayload();
      break;
    case MessageType::INSTRUCTION:
    case MessageType::STATUS:
      frame["text"] = message.getText();
      break;
    case MessageType::HELLO_ACK:
    case MessageType::KEEPALIVE:
      break;
  }
  // dump() escapes control characters, so the frame never contains a newline
  return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

DecodeResult SessionCodec::decode(const string& frame) {
  json parsed = json::parse(frame, nullptr, false);
  if (parsed.is_discarded()) {
    return DecodeResult::failure(DecodeError::MALFORMED, "Frame is not JSON");
  }
  if (!parsed.is_object()) {
    return DecodeResult::failure(DecodeError::MALFORMED,
                                 "Frame is not a JSON object");
  }
  try {
    return decodeObject(parsed);
  } catch (const json::exception& e) {
    return DecodeResult::failure(DecodeError::MALFORMED, e.what());
  }
}
}  // namespace scanlink
