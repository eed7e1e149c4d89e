#ifndef CLIENT_CONFIG_HPP_
#define CLIENT_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace netctrl {
namespace config {

/**
 * Connection and timing settings of a control client.
 */
struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 4259;  // OsmoHLR CTRL
  int connect_timeout_ms = 5000;
  int reply_timeout_ms = 10000;  // negative waits for the reply forever
  size_t read_chunk_bytes = 4096;
  size_t drain_chunk_bytes = 1024;
  int drain_max_reads = 16;
  uint64_t first_transaction_id = 1;
  std::string log_level = "INFO";
};

/**
 * Build a config from a JSON object. Keys that are absent keep their
 * defaults; unknown keys are ignored. Throws ConfigError on bad values.
 */
ClientConfig clientConfigFromJson(const nlohmann::json& json);

/**
 * Load a config from a JSON file. Throws ConfigError.
 */
ClientConfig loadClientConfig(const std::string& path);

}  // namespace config
}  // namespace netctrl

#endif  // CLIENT_CONFIG_HPP_
