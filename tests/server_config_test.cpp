// =============================================================================
// server_config_test.cpp
// =============================================================================
// Unit tests for ServerConfig / DataServerConfig loading and validation, and
// for the Logger level parsing they rely on.
// =============================================================================

#include "gymbridge/config/server_config.hpp"
#include "gymbridge/log/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

using gymbridge::DataServerConfig;
using gymbridge::ServerConfig;

TEST(ServerConfigTest, DefaultsAreValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.network_address, "tcp://127.0.0.1:5500");
  EXPECT_EQ(config.data_network_address, "tcp://127.0.0.1:4999");
  EXPECT_EQ(config.connectTimeoutMs(), 60000);
  EXPECT_DOUBLE_EQ(config.wait_for_data_reset_s, 300.0);
  EXPECT_FALSE(config.send_full_info);
}

TEST(ServerConfigTest, OverlaysPresentKeys) {
  nlohmann::json j = {
      {"network_address", "tcp://127.0.0.1:6000"},
      {"connect_timeout_s", 1.5},
      {"task", 7},
      {"render", {{"enabled", true}, {"render_modes", {"human"}}}},
      {"engine", {{"skip_frame", 4}}},
      {"unknown_key", "ignored"}};

  ServerConfig config = ServerConfig::fromJson(j);
  EXPECT_EQ(config.network_address, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.connectTimeoutMs(), 1500);
  EXPECT_EQ(config.task, 7);
  EXPECT_TRUE(config.render.enabled);
  EXPECT_EQ(config.render.render_modes, (std::vector<std::string>{"human"}));
  EXPECT_EQ(config.engine.skip_frame, 4);
  EXPECT_EQ(config.engine.state_window, 10u);

  ServerConfig again = ServerConfig::fromJson(config.toJson());
  EXPECT_EQ(again.toJson(), config.toJson());
}

TEST(ServerConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(ServerConfig::fromJson({{"connect_timeout_s", 0}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson({{"network_address", ""}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson(
                   {{"data_network_address", "tcp://127.0.0.1:5500"}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson({{"log_level", "chatty"}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson({{"engine", {{"skip_frame", 0}}}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson("not an object"),
               std::invalid_argument);
}

// The data acquisition loop needs a positive back-off ceiling; a config that
// validates must also construct.
TEST(ServerConfigTest, RejectsZeroBackoff) {
  EXPECT_THROW(ServerConfig::fromJson({{"max_backoff_s", 0}}),
               std::invalid_argument);
  EXPECT_THROW(ServerConfig::fromJson({{"max_backoff_s", -1.5}}),
               std::invalid_argument);
  EXPECT_NO_THROW(ServerConfig::fromJson({{"max_backoff_s", 0.25}}));
}

TEST(ServerConfigTest, MissingFileThrows) {
  EXPECT_THROW(gymbridge::loadJsonFile("/nonexistent/gymbridge.json"),
               std::runtime_error);
}

TEST(DataServerConfigTest, OverlaysAndValidates) {
  DataServerConfig config = DataServerConfig::fromJson(
      {{"trial_length", 120}, {"train_ratio", 0.75}, {"seed", 9}});
  EXPECT_EQ(config.trial_length, 120u);
  EXPECT_DOUBLE_EQ(config.train_ratio, 0.75);
  EXPECT_EQ(config.seed, 9u);

  EXPECT_THROW(DataServerConfig::fromJson({{"train_ratio", 0.0}}),
               std::invalid_argument);
  EXPECT_THROW(DataServerConfig::fromJson({{"ready_after_s", -1}}),
               std::invalid_argument);
}

TEST(LoggerTest, FiltersByLevelAndRoutesStreams) {
  std::ostringstream out;
  std::ostringstream err;
  gymbridge::Logger log("EnvServer_3", gymbridge::LogLevel::Info, &out, &err);

  log.debug("hidden");
  log.info("shown");
  log.error("broken");

  EXPECT_EQ(out.str(), "[EnvServer_3] INFO: shown\n");
  EXPECT_EQ(err.str(), "[EnvServer_3] ERROR: broken\n");
}

TEST(LoggerTest, ParsesLevels) {
  EXPECT_EQ(gymbridge::parseLogLevel("debug"), gymbridge::LogLevel::Debug);
  EXPECT_EQ(gymbridge::parseLogLevel("warning"), gymbridge::LogLevel::Warning);
  EXPECT_THROW(gymbridge::parseLogLevel("WARN"), std::invalid_argument);
  EXPECT_STREQ(gymbridge::logLevelToString(gymbridge::LogLevel::Error),
               "ERROR");
}
