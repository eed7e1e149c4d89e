#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace netctrl {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

// Parse "debug", "INFO", ... Throws ConfigError on unknown names.
LogLevel parseLogLevel(const std::string& name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe and supports correlation IDs for request tracing.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::clog)
  void setOutputStream(std::ostream& stream);

  // Plain message without fields
  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    // Never throws; an entry that cannot be written leaves a plain line on std::cerr
    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) netctrl::observability::Logger::getInstance().debug(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  netctrl::observability::Logger::LogBuilder(level, msg, __func__)

// Structured logging tagged with a transaction id
#define LOG_CORRELATED(level, msg, correlation_id) \
  netctrl::observability::Logger::LogBuilder(level, msg, __func__, correlation_id)

}  // namespace observability
}  // namespace netctrl

#endif  // LOGGER_HPP_
