#include "network/ctrl_client.hpp"

#include "ctrl_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

namespace netctrl {
namespace network {

using protocol::Message;
using protocol::MessageFramer;
using protocol::Verb;

namespace {

std::string firstToken(const std::string& payload) {
  size_t start = payload.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  size_t end = payload.find_first_of(" \t\r\n", start);
  return payload.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// Decimal transaction ids as issued by this client; nullopt for anything else
std::optional<uint64_t> parseSequence(const std::string& transaction_id) {
  if (transaction_id.empty() || transaction_id.size() > 19) return std::nullopt;
  uint64_t value = 0;
  for (char c : transaction_id) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

}  // namespace

ControlClient::ControlClient(const config::ClientConfig& config)
    : config_(config),
      next_transaction_id_(config.first_transaction_id) {
}

ControlClient::~ControlClient() {
  close();
}

void ControlClient::connect() {
  connect(config_.host, config_.port);
}

void ControlClient::connect(const std::string& host, uint16_t port) {
  std::lock_guard<std::mutex> lock(command_mutex_);

  buffer_.clear();
  session_.connect(host, port, config_.connect_timeout_ms);
  observability::getGlobalMetrics().setGauge("ctrl_session_connected", 1);
}

void ControlClient::close() {
  std::lock_guard<std::mutex> lock(command_mutex_);

  if (!session_.isOpen()) return;
  session_.close();
  buffer_.clear();
  observability::getGlobalMetrics().setGauge("ctrl_session_connected", 0);
}

bool ControlClient::isConnected() const {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return session_.isOpen();
}

size_t ControlClient::bufferedBytes() const {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return buffer_.size();
}

void ControlClient::setNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  notification_handler_ = std::move(handler);
}

ControlClient::CommandReply ControlClient::get(const std::string& variable) {
  return sendCommand(variable);
}

ControlClient::CommandReply ControlClient::set(const std::string& variable,
                                               const std::string& value) {
  return sendCommand(variable, value);
}

ControlClient::CommandReply ControlClient::sendCommand(const std::string& variable,
                                                       const std::optional<std::string>& value) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  auto& metrics = observability::getGlobalMetrics();

  PendingCommand pending;
  pending.verb = value ? Verb::SET : Verb::GET;
  pending.variable = variable;
  pending.value = value;

  try {
    if (!session_.isOpen()) {
      throw IoError("not connected");
    }

    drainLeftovers();

    std::string transaction_id = std::to_string(next_transaction_id_);
    std::string frame = protocol::encodeCommand(pending.verb, transaction_id,
                                                pending.variable, pending.value);
    pending.transaction_id = transaction_id;
    pending.sequence = next_transaction_id_++;

    observability::MetricsCollector::Timer timer(metrics, "ctrl_command_duration_seconds");

    session_.write(frame);
    metrics.incrementCounter("ctrl_commands_sent_total");
    LOG_CORRELATED(observability::LogLevel::DEBUG, "Command sent", pending.transaction_id)
        .field("verb", protocol::verbToString(pending.verb))
        .field("variable", pending.variable);

    CommandReply reply = awaitReply(pending);

    LOG_CORRELATED(observability::LogLevel::DEBUG, "Command completed", pending.transaction_id)
        .field("reply", reply.raw);
    return reply;
  } catch (const ControlError& e) {
    metrics.incrementCounter("ctrl_commands_failed_total");
    LOG_CORRELATED(observability::LogLevel::ERROR, "Command failed", pending.transaction_id)
        .field("variable", variable)
        .field("error", e.what());
    throw;
  }
}

void ControlClient::drainLeftovers() {
  // Pull whatever the kernel already holds without ever blocking
  for (int i = 0; i < config_.drain_max_reads; ++i) {
    std::string chunk = session_.readAvailable(config_.drain_chunk_bytes, ReadMode::NonBlocking);
    if (chunk.empty()) break;
    buffer_.append(chunk);
    if (chunk.size() < config_.drain_chunk_bytes) break;
  }

  // A partial trailing frame stays in buffer_ for the next read
  while (MessageFramer::isCompleteMessage(buffer_)) {
    auto [head, tail] = MessageFramer::splitCombined(buffer_);
    buffer_ = std::move(tail);

    try {
      Message message = protocol::decodeMessage(head);
      if (protocol::isNotification(message)) {
        observability::getGlobalMetrics().incrementCounter("ctrl_notifications_drained_total");
        handleNotification(message, "drain");
      } else {
        observability::getGlobalMetrics().incrementCounter("ctrl_stale_replies_total");
        LOG_CORRELATED(observability::LogLevel::WARN, "Discarding stale reply",
                       message.transaction_id)
            .field("payload", head);
      }
    } catch (const ParseError& e) {
      observability::getGlobalMetrics().incrementCounter("ctrl_frames_dropped_total");
      LOG_BUILDER(observability::LogLevel::WARN, "Dropping malformed frame")
          .field("payload", head)
          .field("error", e.what());
    }
  }
}

void ControlClient::handleNotification(const Message& message, const char* source) {
  LOG_CORRELATED(observability::LogLevel::INFO, "Notification", message.transaction_id)
      .field("source", source)
      .field("variable", message.variable)
      .field("value", message.value.value_or(""));

  if (notification_handler_) {
    notification_handler_(message);
  }
}

ControlClient::CommandReply ControlClient::awaitReply(const PendingCommand& pending) {
  using Clock = std::chrono::steady_clock;
  const bool bounded = config_.reply_timeout_ms >= 0;
  const auto deadline = Clock::now() + std::chrono::milliseconds(config_.reply_timeout_ms);
  auto& metrics = observability::getGlobalMetrics();

  while (true) {
    while (auto frame = MessageFramer::extractFrame(buffer_)) {
      std::string payload = std::move(frame->payload);
      buffer_ = std::move(frame->remaining);

      std::optional<Message> message;
      try {
        message = protocol::decodeMessage(payload);
      } catch (const ParseError& e) {
        if (firstToken(payload) == pending.transaction_id) {
          throw ProtocolError("malformed reply to transaction " + pending.transaction_id +
                              ": " + e.what());
        }
        metrics.incrementCounter("ctrl_frames_dropped_total");
        LOG_CORRELATED(observability::LogLevel::WARN, "Dropping malformed frame",
                       pending.transaction_id)
            .field("payload", payload)
            .field("error", e.what());
        continue;
      }

      if (protocol::isNotification(*message)) {
        metrics.incrementCounter("ctrl_notifications_skipped_total");
        handleNotification(*message, "receive");
        continue;
      }

      // Reply to an earlier command that timed out
      auto sequence = parseSequence(message->transaction_id);
      if (sequence && *sequence < pending.sequence) {
        metrics.incrementCounter("ctrl_stale_replies_total");
        LOG_CORRELATED(observability::LogLevel::WARN, "Discarding stale reply",
                       message->transaction_id)
            .field("pending", pending.transaction_id)
            .field("payload", payload);
        continue;
      }

      return verifyReply(pending, payload, *message);
    }

    int wait_ms = -1;
    if (bounded) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (left.count() <= 0) {
        throw TimeoutError("no reply to transaction " + pending.transaction_id + " within " +
                           std::to_string(config_.reply_timeout_ms) + " ms");
      }
      wait_ms = static_cast<int>(left.count());
    }

    buffer_.append(session_.readAvailable(config_.read_chunk_bytes, ReadMode::Blocking, wait_ms));
  }
}

ControlClient::CommandReply ControlClient::verifyReply(const PendingCommand& pending,
                                                       const std::string& raw,
                                                       const Message& reply) const {
  if (reply.transaction_id != pending.transaction_id) {
    throw MismatchError("transaction_id", pending.transaction_id, reply.transaction_id);
  }

  Verb expected = protocol::expectedReplyVerb(pending.verb);
  if (reply.verb == Verb::ERROR) {
    throw RemoteError(protocol::verbToString(expected), reply.value.value_or(""));
  }
  if (reply.verb != expected) {
    throw MismatchError("verb", protocol::verbToString(expected),
                        protocol::verbToString(reply.verb));
  }
  if (reply.variable != pending.variable) {
    throw MismatchError("variable", pending.variable, reply.variable);
  }
  if (pending.verb == Verb::SET && reply.value != pending.value) {
    throw MismatchError("value", pending.value.value_or(""), reply.value.value_or(""));
  }

  CommandReply result;
  result.raw = raw;
  result.verb = reply.verb;
  result.transaction_id = reply.transaction_id;
  result.variable = reply.variable;
  result.value = reply.value;
  return result;
}

}  // namespace network
}  // namespace netctrl
