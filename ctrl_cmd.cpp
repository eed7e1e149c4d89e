#include "include/config/client_config.hpp"
#include "include/ctrl_errors.hpp"
#include "include/network/ctrl_client.hpp"
#include "include/observability/logger.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace netctrl;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitConnect = 2;
constexpr int kExitCommand = 3;

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--config FILE] [--host HOST] [--port PORT] [--timeout MS] [--debug]"
            << " VARIABLE [VALUE]\n"
            << "  Without VALUE a GET is sent, otherwise a SET.\n"
            << "  --timeout -1 waits for the reply without limit.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<std::string> config_path;
  std::optional<std::string> host;
  std::optional<int> port;
  std::optional<int> timeout_ms;
  bool debug = false;
  std::vector<std::string> positional;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      bool has_next = i + 1 < argc;

      if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "--config" && has_next) {
        config_path = argv[++i];
      } else if (arg == "--host" && has_next) {
        host = argv[++i];
      } else if (arg == "--port" && has_next) {
        port = std::stoi(argv[++i]);
      } else if (arg == "--timeout" && has_next) {
        timeout_ms = std::stoi(argv[++i]);
      } else if (arg == "--debug") {
        debug = true;
      } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
        std::cerr << "Unknown or incomplete option: " << arg << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
      } else {
        positional.push_back(arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
    return kExitUsage;
  }

  if (positional.empty() || positional.size() > 2) {
    printUsage(argv[0]);
    return kExitUsage;
  }

  config::ClientConfig client_config;
  try {
    if (config_path) {
      client_config = config::loadClientConfig(*config_path);
    }
    if (host) client_config.host = *host;
    if (port) {
      if (*port < 1 || *port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(*port));
      }
      client_config.port = static_cast<uint16_t>(*port);
    }
    if (timeout_ms) client_config.reply_timeout_ms = *timeout_ms;

    auto level = debug ? observability::LogLevel::DEBUG
                       : observability::parseLogLevel(client_config.log_level);
    observability::Logger::getInstance().setLogLevel(level);
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const std::string& variable = positional[0];
  std::optional<std::string> value;
  if (positional.size() == 2) value = positional[1];

  network::ControlClient client(client_config);

  try {
    client.connect();
  } catch (const ControlError& e) {
    std::cerr << "Connection error: " << e.what() << std::endl;
    return kExitConnect;
  }

  int status = 0;
  try {
    auto reply = client.sendCommand(variable, value);
    std::cout << reply.variable << " = " << reply.value.value_or("") << std::endl;
  } catch (const RemoteError& e) {
    std::cerr << "Command rejected: " << e.reason() << std::endl;
    status = kExitCommand;
  } catch (const MismatchError& e) {
    std::cerr << "Unexpected reply (" << e.field() << "): expected '" << e.expected()
              << "', got '" << e.actual() << "'" << std::endl;
    status = kExitCommand;
  } catch (const ControlError& e) {
    std::cerr << "Command failed: " << e.what() << std::endl;
    status = kExitCommand;
  }

  client.close();
  return status;
}
