#include "network/protocol.hpp"

#include "ctrl_errors.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace netctrl {
namespace network {
namespace protocol {

namespace {

bool containsWhitespace(const std::string& text) {
  for (unsigned char c : text) {
    if (std::isspace(c)) return true;
  }
  return false;
}

// Next whitespace-delimited token starting at pos; pos moves past it.
std::string nextToken(const std::string& text, size_t& pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  size_t start = pos;
  while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return text.substr(start, pos - start);
}

// Everything after the separator following the last token, or nullopt.
std::optional<std::string> restOfPayload(const std::string& text, size_t pos) {
  if (pos >= text.size()) return std::nullopt;
  ++pos;  // single separator
  if (pos >= text.size()) return std::nullopt;
  return text.substr(pos);
}

}  // namespace

std::string verbToString(Verb verb) {
  switch (verb) {
    case Verb::GET: return "GET";
    case Verb::SET: return "SET";
    case Verb::TRAP: return "TRAP";
    case Verb::GET_REPLY: return "GET_REPLY";
    case Verb::SET_REPLY: return "SET_REPLY";
    case Verb::TRAP_REPLY: return "TRAP_REPLY";
    case Verb::ERROR: return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<Verb> verbFromString(const std::string& token) {
  static const std::pair<const char*, Verb> kVerbs[] = {
      {"GET", Verb::GET},
      {"SET", Verb::SET},
      {"TRAP", Verb::TRAP},
      {"GET_REPLY", Verb::GET_REPLY},
      {"SET_REPLY", Verb::SET_REPLY},
      {"TRAP_REPLY", Verb::TRAP_REPLY},
      {"ERROR", Verb::ERROR},
  };
  for (const auto& [name, verb] : kVerbs) {
    if (token == name) return verb;
  }
  return std::nullopt;
}

Verb expectedReplyVerb(Verb command) {
  switch (command) {
    case Verb::GET: return Verb::GET_REPLY;
    case Verb::SET: return Verb::SET_REPLY;
    case Verb::TRAP: return Verb::TRAP_REPLY;
    default:
      throw ProtocolError("no reply verb for " + verbToString(command));
  }
}

std::string encodeCommand(Verb verb, const std::string& transaction_id,
                          const std::string& variable,
                          const std::optional<std::string>& value) {
  if (verb != Verb::GET && verb != Verb::SET) {
    throw ProtocolError("cannot send " + verbToString(verb) + " as a command");
  }
  if (transaction_id.empty() || containsWhitespace(transaction_id)) {
    throw ProtocolError("invalid transaction id '" + transaction_id + "'");
  }
  if (variable.empty() || containsWhitespace(variable)) {
    throw ProtocolError("invalid variable '" + variable + "'");
  }
  if (verb == Verb::SET && (!value || value->empty())) {
    throw ProtocolError("SET " + variable + " requires a value");
  }

  std::stringstream ss;
  ss << transaction_id << ' ' << verbToString(verb) << ' ' << variable;
  if (verb == Verb::SET) {
    ss << ' ' << *value;
  }
  return MessageFramer::frameMessage(ss.str());
}

Message decodeMessage(const std::string& payload) {
  if (payload.empty()) {
    throw ParseError("empty payload");
  }

  size_t pos = 0;
  Message message;
  message.transaction_id = nextToken(payload, pos);
  std::string verb_token = nextToken(payload, pos);
  if (message.transaction_id.empty() || verb_token.empty()) {
    throw ParseError("too few tokens in '" + payload + "'");
  }

  auto verb = verbFromString(verb_token);
  if (!verb) {
    throw ParseError("unrecognized verb '" + verb_token + "'");
  }
  message.verb = *verb;

  if (message.verb == Verb::ERROR) {
    message.value = restOfPayload(payload, pos);
    return message;
  }

  message.variable = nextToken(payload, pos);
  if (message.variable.empty()) {
    throw ParseError(verb_token + " without variable in '" + payload + "'");
  }
  message.value = restOfPayload(payload, pos);

  switch (message.verb) {
    case Verb::GET:
      if (message.value) {
        throw ParseError("GET with trailing value in '" + payload + "'");
      }
      break;
    case Verb::SET:
    case Verb::TRAP:
    case Verb::GET_REPLY:
    case Verb::SET_REPLY:
      if (!message.value) {
        throw ParseError(verb_token + " without value in '" + payload + "'");
      }
      break;
    default:
      break;
  }
  return message;
}

bool isNotification(const Message& message) {
  return message.verb == Verb::TRAP;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& payload) {
  if (payload.size() > kMaxPayloadSize) {
    throw ProtocolError("payload of " + std::to_string(payload.size()) +
                        " bytes exceeds frame limit");
  }
  std::string framed;
  framed.reserve(kHeaderSize + payload.size());
  framed.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
  framed.push_back(static_cast<char>(payload.size() & 0xFF));
  framed.append(payload);
  return framed;
}

size_t MessageFramer::payloadLength(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    throw ProtocolError("buffer too short for frame header");
  }
  return (static_cast<size_t>(static_cast<uint8_t>(buffer[0])) << 8) |
         static_cast<size_t>(static_cast<uint8_t>(buffer[1]));
}

bool MessageFramer::isCompleteMessage(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) return false;
  return buffer.size() >= kHeaderSize + payloadLength(buffer);
}

std::optional<MessageFramer::Frame> MessageFramer::extractFrame(const std::string& buffer) {
  if (!isCompleteMessage(buffer)) return std::nullopt;

  size_t length = payloadLength(buffer);
  Frame frame;
  frame.payload = buffer.substr(kHeaderSize, length);
  frame.remaining = buffer.substr(kHeaderSize + length);
  return frame;
}

std::pair<std::string, std::string> MessageFramer::splitCombined(const std::string& buffer) {
  auto frame = extractFrame(buffer);
  if (!frame) {
    throw ProtocolError("incomplete frame at head of " +
                        std::to_string(buffer.size()) + " byte buffer");
  }
  return {std::move(frame->payload), std::move(frame->remaining)};
}

}  // namespace protocol
}  // namespace network
}  // namespace netctrl
