#ifndef CTRL_CLIENT_HPP_
#define CTRL_CLIENT_HPP_

#include "config/client_config.hpp"
#include "network/protocol.hpp"
#include "network/tcp_session.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace netctrl {
namespace network {

/**
 * Client for the length-framed CTRL protocol.
 * Issues one GET or SET at a time over a single TCP session, skipping
 * unsolicited TRAP notifications while it waits for the matching reply.
 */
class ControlClient {
 public:
  using NotificationHandler = std::function<void(const protocol::Message&)>;

  struct CommandReply {
    std::string raw;  // reply payload without the length prefix
    protocol::Verb verb;
    std::string transaction_id;
    std::string variable;
    std::optional<std::string> value;
  };

  explicit ControlClient(const config::ClientConfig& config = config::ClientConfig());
  ~ControlClient();

  // Non-copyable
  ControlClient(const ControlClient&) = delete;
  ControlClient& operator=(const ControlClient&) = delete;

  /**
   * Connect to the host and port from the config.
   */
  void connect();

  /**
   * Connect to host:port. Throws ConnectionError or TimeoutError.
   */
  void connect(const std::string& host, uint16_t port);

  /**
   * Send GET (no value) or SET and wait for the verified reply.
   * Throws IoError, TimeoutError, ProtocolError or MismatchError.
   */
  CommandReply sendCommand(const std::string& variable,
                           const std::optional<std::string>& value = std::nullopt);

  CommandReply get(const std::string& variable);
  CommandReply set(const std::string& variable, const std::string& value);

  /**
   * Called for every TRAP seen while draining or awaiting a reply,
   * in arrival order. Runs with the command lock held; the handler must
   * not call back into this client.
   */
  void setNotificationHandler(NotificationHandler handler);

  /**
   * Close the session. Safe to call repeatedly.
   */
  void close();

  bool isConnected() const;

  /**
   * Bytes received but not yet consumed as a complete frame.
   */
  size_t bufferedBytes() const;

  const config::ClientConfig& getConfig() const { return config_; }

 private:
  struct PendingCommand {
    std::string transaction_id;
    uint64_t sequence = 0;
    protocol::Verb verb;
    std::string variable;
    std::optional<std::string> value;
  };

  void drainLeftovers();
  void handleNotification(const protocol::Message& message, const char* source);
  CommandReply awaitReply(const PendingCommand& pending);
  CommandReply verifyReply(const PendingCommand& pending, const std::string& raw,
                           const protocol::Message& reply) const;

  config::ClientConfig config_;
  TCPSession session_;
  std::string buffer_;
  uint64_t next_transaction_id_;
  NotificationHandler notification_handler_;
  mutable std::mutex command_mutex_;
};

}  // namespace network
}  // namespace netctrl

#endif  // CTRL_CLIENT_HPP_
