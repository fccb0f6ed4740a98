// =============================================================================
// data_server_test.cpp
// =============================================================================
// Unit tests for gymbridge::DataServer: request handling without sockets,
// then the threaded REP loop through a BoundedChannel.
// =============================================================================

#include "gymbridge/data/data_server.hpp"
#include "gymbridge/network/bounded_channel.hpp"
#include "gymbridge/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <thread>

using gymbridge::DataServer;
using gymbridge::DataServerOptions;

class DataServerTestFixture : public ::testing::Test {
 protected:
  std::ostringstream sink;
  gymbridge::Logger log{"DataServer", gymbridge::LogLevel::Debug, &sink,
                        &sink};
  gymbridge::SimulationTimeProvider clock;

  DataServerOptions options(double ready_after_s = 0.0) {
    DataServerOptions o;
    o.endpoint = gymbridge::test::nextEndpoint();
    o.trial_length = 50;
    o.ready_after_s = ready_after_s;
    return o;
  }
};

TEST_F(DataServerTestFixture, RejectsEmptyDataset) {
  EXPECT_THROW(DataServer(nullptr, options(), log, clock),
               std::invalid_argument);
}

TEST_F(DataServerTestFixture, NotReadyUntilWarmUpElapsed) {
  DataServer server(gymbridge::test::makeSample(200), options(5.0), log,
                    clock);

  nlohmann::json reply = server.handleRequest({{"ctrl", "get_data"}});
  EXPECT_EQ(reply["status"], "not_ready");
  EXPECT_EQ(reply["ctrl"], "Dataset not ready");
  EXPECT_EQ(server.handleRequest({{"ctrl", "ping"}})["status"], "not_ready");

  clock.advance_time(5000);
  EXPECT_TRUE(server.isReady());
  EXPECT_EQ(server.handleRequest({{"ctrl", "ping"}}),
            (nlohmann::json{{"status", "ready"}, {"ctrl", "pong"}}));
}

TEST_F(DataServerTestFixture, GetDataShipsTrialAndStats) {
  DataServer server(gymbridge::test::makeSample(200), options(), log, clock);

  nlohmann::json reply = server.handleRequest(
      {{"ctrl", "get_data"}, {"kwargs", {{"b_alpha", 2.0}}}});
  ASSERT_EQ(reply["status"], "ready");
  auto trial = gymbridge::DataSample::fromJson(reply["sample"]);
  EXPECT_EQ(trial->size(), 50u);
  EXPECT_EQ(reply["stat"]["count"], 200);
  EXPECT_EQ(server.trialsServed(), 1);

  nlohmann::json explicit_length = server.handleRequest(
      {{"ctrl", "get_data"}, {"kwargs", {{"length", 10}}}});
  EXPECT_EQ(explicit_length["sample"]["bars"].size(), 10u);
}

TEST_F(DataServerTestFixture, UnsatisfiableRequestIsAnError) {
  DataServer server(gymbridge::test::makeSample(200), options(), log, clock);

  nlohmann::json reply = server.handleRequest(
      {{"ctrl", "get_data"}, {"kwargs", {{"length", 500}}}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(server.trialsServed(), 0);

  EXPECT_EQ(server.handleRequest({{"ctrl", "dance"}})["status"], "error");
}

TEST_F(DataServerTestFixture, StopRequestEndsTheLoop) {
  DataServerOptions o = options();
  DataServer server(gymbridge::test::makeSample(200), o, log, clock);
  server.start();

  gymbridge::ChannelOptions channel_options;
  channel_options.send_timeout_ms = 1000;
  channel_options.receive_timeout_ms = 2000;
  gymbridge::BoundedChannel channel(gymbridge::ChannelRole::Request,
                                    o.endpoint, channel_options);
  channel.open();

  auto pong = channel.exchange({{"ctrl", "ping"}});
  ASSERT_TRUE(pong.ok());
  EXPECT_EQ(pong.message["ctrl"], "pong");

  auto data = channel.exchange({{"ctrl", "get_data"}});
  ASSERT_TRUE(data.ok());
  EXPECT_EQ(data.message["status"], "ready");

  auto stop = channel.exchange({{"ctrl", "stop"}});
  ASSERT_TRUE(stop.ok());
  EXPECT_EQ(stop.message, (nlohmann::json{{"ctrl", "stopping"}}));

  // The worker notices the flag after replying.
  for (int i = 0; i < 100 && server.stopRequested() == false; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(server.stopRequested());
  server.stop();
}
