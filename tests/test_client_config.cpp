#include "config/client_config.hpp"
#include "ctrl_errors.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace netctrl;
using netctrl::config::ClientConfig;
using netctrl::config::clientConfigFromJson;
using netctrl::config::loadClientConfig;

TEST(ClientConfigTest, EmptyObjectKeepsDefaults) {
  ClientConfig config = clientConfigFromJson(nlohmann::json::object());
  ClientConfig defaults;

  EXPECT_EQ(config.host, defaults.host);
  EXPECT_EQ(config.port, 4259);
  EXPECT_EQ(config.reply_timeout_ms, defaults.reply_timeout_ms);
  EXPECT_EQ(config.drain_chunk_bytes, 1024u);
  EXPECT_EQ(config.first_transaction_id, 1u);
}

TEST(ClientConfigTest, ReadsAllKeys) {
  auto json = nlohmann::json::parse(R"({
    "host": "hlr.example.net",
    "port": 4260,
    "connect_timeout_ms": 1500,
    "reply_timeout_ms": -1,
    "read_chunk_bytes": 8192,
    "drain_chunk_bytes": 512,
    "drain_max_reads": 4,
    "first_transaction_id": 100,
    "log_level": "debug",
    "comment": "ignored"
  })");

  ClientConfig config = clientConfigFromJson(json);
  EXPECT_EQ(config.host, "hlr.example.net");
  EXPECT_EQ(config.port, 4260);
  EXPECT_EQ(config.connect_timeout_ms, 1500);
  EXPECT_EQ(config.reply_timeout_ms, -1);
  EXPECT_EQ(config.read_chunk_bytes, 8192u);
  EXPECT_EQ(config.drain_chunk_bytes, 512u);
  EXPECT_EQ(config.drain_max_reads, 4);
  EXPECT_EQ(config.first_transaction_id, 100u);
  EXPECT_EQ(config.log_level, "debug");
}

TEST(ClientConfigTest, RejectsBadValues) {
  EXPECT_THROW(clientConfigFromJson(nlohmann::json::array()), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"port", 0}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"port", 70000}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"port", "4259"}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"host", ""}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"reply_timeout_ms", -5}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"drain_chunk_bytes", 0}}), ConfigError);
  EXPECT_THROW(clientConfigFromJson({{"log_level", "chatty"}}), ConfigError);
}

TEST(ClientConfigTest, LoadsFromFile) {
  char path[] = "/tmp/netctrl_config_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  close(fd);

  {
    std::ofstream out(path);
    out << R"({"host": "10.0.0.5", "port": 4259, "reply_timeout_ms": 3000})";
  }

  ClientConfig config = loadClientConfig(path);
  EXPECT_EQ(config.host, "10.0.0.5");
  EXPECT_EQ(config.reply_timeout_ms, 3000);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(loadClientConfig(path), ConfigError);

  std::remove(path);
  EXPECT_THROW(loadClientConfig(path), ConfigError);
}
