#ifndef CTRL_ERRORS_HPP_
#define CTRL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace netctrl {

/**
 * Base class of every error raised by the control client.
 */
struct ControlError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Transport could not be established (resolution failure, refused, ...).
struct ConnectionError : ControlError {
  using ControlError::ControlError;
};

// A connect or receive did not complete within its bound.
struct TimeoutError : ControlError {
  using ControlError::ControlError;
};

// Read/write failure or peer closed the connection mid-exchange.
struct IoError : ControlError {
  using ControlError::ControlError;
};

// Malformed traffic or a command that cannot be encoded.
struct ProtocolError : ControlError {
  using ControlError::ControlError;
};

// A frame payload that does not tokenize into a message.
struct ParseError : ProtocolError {
  using ProtocolError::ProtocolError;
};

struct ConfigError : ControlError {
  using ControlError::ControlError;
};

/**
 * A reply was received but does not match the command that was sent.
 * field() names what differed: transaction_id, verb, variable or value.
 */
class MismatchError : public ControlError {
 public:
  MismatchError(const std::string& field, const std::string& expected,
                const std::string& actual)
      : ControlError(field + " mismatch: expected '" + expected +
                     "', got '" + actual + "'"),
        field_(field), expected_(expected), actual_(actual) {}

  const std::string& field() const { return field_; }
  const std::string& expected() const { return expected_; }
  const std::string& actual() const { return actual_; }

 protected:
  MismatchError(const std::string& what, const std::string& field,
                const std::string& expected, const std::string& actual)
      : ControlError(what), field_(field), expected_(expected), actual_(actual) {}

 private:
  std::string field_;
  std::string expected_;
  std::string actual_;
};

/**
 * The peer answered the command with an ERROR reply.
 */
class RemoteError : public MismatchError {
 public:
  RemoteError(const std::string& expected_verb, const std::string& reason)
      : MismatchError("remote error: " + reason, "verb", expected_verb, "ERROR"),
        reason_(reason) {}

  const std::string& reason() const { return reason_; }

 private:
  std::string reason_;
};

}  // namespace netctrl

#endif  // CTRL_ERRORS_HPP_
