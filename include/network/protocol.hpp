#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace netctrl {
namespace network {
namespace protocol {

// Size of the big-endian length prefix in front of every payload.
constexpr size_t kHeaderSize = 2;
constexpr size_t kMaxPayloadSize = 0xFFFF;

// Message verbs
enum class Verb {
  GET,
  SET,
  TRAP,
  GET_REPLY,
  SET_REPLY,
  TRAP_REPLY,
  ERROR
};

/**
 * Decoded form of one frame payload:
 *   <transaction_id> <VERB> <variable>[ <value>]
 * ERROR messages carry no variable; the remaining text is the reason
 * and is kept in value.
 */
struct Message {
  std::string transaction_id;
  Verb verb;
  std::string variable;
  std::optional<std::string> value;
};

std::string verbToString(Verb verb);
std::optional<Verb> verbFromString(const std::string& token);

// The reply verb that signals success for a GET or SET.
Verb expectedReplyVerb(Verb command);

/**
 * Build a framed GET or SET command ready to be written to the socket.
 * Throws ProtocolError when the command cannot be represented on the wire.
 */
std::string encodeCommand(Verb verb, const std::string& transaction_id,
                          const std::string& variable,
                          const std::optional<std::string>& value = std::nullopt);

/**
 * Tokenize a frame payload. Throws ParseError on malformed input.
 */
Message decodeMessage(const std::string& payload);

// Unsolicited notifications never answer a pending command.
bool isNotification(const Message& message);

// Message framing for TCP transport
class MessageFramer {
 public:
  struct Frame {
    std::string payload;
    std::string remaining;
  };

  static std::string frameMessage(const std::string& payload);

  /**
   * Extract the first frame of an accumulated buffer. Returns nullopt
   * while the prefix or the payload is still incomplete.
   */
  static std::optional<Frame> extractFrame(const std::string& buffer);

  /**
   * Split the head frame off a buffer holding one or more frames.
   * Throws ProtocolError when the head frame is incomplete.
   */
  static std::pair<std::string, std::string> splitCombined(const std::string& buffer);

  static bool isCompleteMessage(const std::string& buffer);

  // Payload length announced by the prefix; buffer must hold the header.
  static size_t payloadLength(const std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace netctrl

#endif  // PROTOCOL_HPP_
