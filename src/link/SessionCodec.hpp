#ifndef __SCANLINK_SESSION_CODEC__
#define __SCANLINK_SESSION_CODEC__

#include "Headers.hpp"
#include "Message.hpp"

namespace scanlink {
enum class DecodeError {
  NONE,
  UNKNOWN_TYPE,
  MALFORMED,
};

const char* decodeErrorName(DecodeError error);

/**
 * @brief Either a decoded Message or the reason decoding failed.
 */
class DecodeResult {
 public:
  static DecodeResult ok(const Message& message) {
    DecodeResult r;
    r.message = message;
    return r;
  }
  static DecodeResult failure(DecodeError error, const string& detail) {
    DecodeResult r;
    r.error = error;
    r.detail = detail;
    return r;
  }

  bool isOk() const { return message.has_value(); }
  /** @brief Only valid when isOk(). */
  const Message& getMessage() const { return *message; }
  DecodeError getError() const { return error; }
  const string& getDetail() const { return detail; }

 protected:
  DecodeResult() : error(DecodeError::NONE) {}

  optional<Message> message;
  DecodeError error;
  string detail;
};

/**
 * @brief Converts Messages to and from their JSON wire form.
 *
 * A wire frame is one JSON object whose "type" field selects the variant.
 * Frames do not include the newline that delimits them on the stream.
 */
class SessionCodec {
 public:
  static string encode(const Message& message);
  /** @brief Never throws. Corrupt input is reported in the result. */
  static DecodeResult decode(const string& frame);

  static const char* typeName(MessageType type);
  static optional<MessageType> typeFromName(const string& name);
};
}  // namespace scanlink

#endif  // __SCANLINK_SESSION_CODEC__
