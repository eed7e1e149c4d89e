#include "config/client_config.hpp"

#include "ctrl_errors.hpp"
#include "observability/logger.hpp"

#include <fstream>
#include <limits>

namespace netctrl {
namespace config {

namespace {

template <typename T>
T readInteger(const nlohmann::json& json, const char* key, T current,
              long long min_value, long long max_value) {
  if (!json.contains(key)) return current;

  const auto& node = json.at(key);
  if (!node.is_number_integer()) {
    throw ConfigError(std::string("'") + key + "' must be an integer");
  }
  long long value = node.get<long long>();
  if (value < min_value || value > max_value) {
    throw ConfigError(std::string("'") + key + "' out of range: " + std::to_string(value));
  }
  return static_cast<T>(value);
}

std::string readString(const nlohmann::json& json, const char* key,
                       const std::string& current) {
  if (!json.contains(key)) return current;

  const auto& node = json.at(key);
  if (!node.is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a string");
  }
  return node.get<std::string>();
}

}  // namespace

ClientConfig clientConfigFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw ConfigError("client config must be a JSON object");
  }

  constexpr long long kIntMax = std::numeric_limits<int>::max();

  ClientConfig config;
  config.host = readString(json, "host", config.host);
  if (config.host.empty()) {
    throw ConfigError("'host' must not be empty");
  }
  config.port = readInteger<uint16_t>(json, "port", config.port, 1, 65535);
  config.connect_timeout_ms =
      readInteger<int>(json, "connect_timeout_ms", config.connect_timeout_ms, 1, kIntMax);
  config.reply_timeout_ms =
      readInteger<int>(json, "reply_timeout_ms", config.reply_timeout_ms, -1, kIntMax);
  config.read_chunk_bytes =
      readInteger<size_t>(json, "read_chunk_bytes", config.read_chunk_bytes, 1, 1 << 20);
  config.drain_chunk_bytes =
      readInteger<size_t>(json, "drain_chunk_bytes", config.drain_chunk_bytes, 1, 1 << 20);
  config.drain_max_reads =
      readInteger<int>(json, "drain_max_reads", config.drain_max_reads, 1, 4096);
  config.first_transaction_id = readInteger<uint64_t>(
      json, "first_transaction_id", config.first_transaction_id, 0,
      std::numeric_limits<long long>::max());
  config.log_level = readString(json, "log_level", config.log_level);

  // Validates the name; throws ConfigError
  observability::parseLogLevel(config.log_level);

  return config;
}

ClientConfig loadClientConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }

  return clientConfigFromJson(json);
}

}  // namespace config
}  // namespace netctrl
