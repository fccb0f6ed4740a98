// =============================================================================
// step_exchange_test.cpp
// =============================================================================
// Unit tests for gymbridge::StepExchange driven by a real BarBacktestEngine.
//
// Validates:
//   - One 4-tuple per communicated tick; done set on the last one
//   - render never consumes the action turn nor changes the next tuple
//   - done ends the episode early with an acknowledgement
//   - skip-frame gating and info batching
//   - unknown ctrl / missing action: diagnostic reply, then ProtocolError
//
// Design: the engine runs on a std::async worker; the test thread plays the
// controller through a TestClient.
// =============================================================================

#include "gymbridge/protocol/errors.hpp"
#include "gymbridge/render/summary_renderer.hpp"
#include "gymbridge/server/step_exchange.hpp"
#include "gymbridge/sim/bar_backtest_engine.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <future>
#include <sstream>

using gymbridge::BarBacktestEngine;
using gymbridge::BoundedChannel;
using gymbridge::EngineParams;
using gymbridge::ProtocolError;
using gymbridge::StepExchange;

class StepExchangeTestFixture : public ::testing::Test {
 protected:
  std::ostringstream sink;
  gymbridge::Logger log{"EnvServer_0", gymbridge::LogLevel::Debug, &sink,
                        &sink};
  gymbridge::SummaryRenderer renderer{true, {"human", "agent", "episode"}};
  std::string endpoint = gymbridge::test::nextEndpoint();
  std::unique_ptr<BoundedChannel> channel;
  std::unique_ptr<BarBacktestEngine> engine;
  StepExchange* hook{nullptr};

  void build(std::size_t bars, std::size_t window, int skip_frame,
             bool send_full_info = false) {
    gymbridge::ChannelOptions o;
    o.send_timeout_ms = 2000;
    o.receive_timeout_ms = gymbridge::ChannelOptions::kUnbounded;
    channel = std::make_unique<BoundedChannel>(gymbridge::ChannelRole::Reply,
                                               endpoint, o);
    channel->open();

    EngineParams p;
    p.state_window = window;
    p.skip_frame = skip_frame;
    engine = std::make_unique<BarBacktestEngine>(p);

    auto exchange = std::make_unique<StepExchange>(*channel, log, renderer,
                                                   send_full_info);
    hook = exchange.get();
    engine->addAnalyzer(gymbridge::kStepHookName, std::move(exchange));
    engine->addData(gymbridge::test::makeBars(bars), "feed");
  }

  std::future<std::size_t> runAsync() {
    return std::async(std::launch::async,
                      [this]() { return engine->run(); });
  }
};

// -----------------------------------------------------------------------------
// 1. Every tick talks when skip_frame == 1.
// -----------------------------------------------------------------------------
TEST_F(StepExchangeTestFixture, OneTuplePerTick) {
  build(6, 2, 1);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  for (int i = 0; i < 5; ++i) {
    nlohmann::json reply = client.request({{"action", "hold"}});
    ASSERT_TRUE(reply.is_array());
    ASSERT_EQ(reply.size(), 4u);
    EXPECT_TRUE(reply[0].is_array());
    EXPECT_TRUE(reply[1].is_number());
    EXPECT_EQ(reply[2].get<bool>(), i == 4);
    ASSERT_EQ(reply[3].size(), 1u);
    EXPECT_EQ(reply[3][0]["step"], i + 1);
  }

  EXPECT_EQ(run.get(), 6u);
  EXPECT_EQ(hook->exchanges(), 5u);
  EXPECT_FALSE(hook->forcedDone());
}

// -----------------------------------------------------------------------------
// 2. render is answered in place and leaves the tuple untouched.
// -----------------------------------------------------------------------------
TEST_F(StepExchangeTestFixture, RenderDoesNotConsumeTurn) {
  build(6, 2, 1);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  nlohmann::json first = client.request({{"action", "hold"}});

  nlohmann::json agent = client.request({{"ctrl", "render"}, {"mode", "agent"}});
  nlohmann::json human = client.request({{"ctrl", "render"}, {"mode", "human"}});
  EXPECT_EQ(agent["mode"], "agent");
  EXPECT_EQ(human["state"].size(), 2u);

  nlohmann::json second = client.request({{"action", "hold"}});
  EXPECT_EQ(second[0], agent["state"]);
  EXPECT_EQ(second[3][0]["step"], 2);

  for (int i = 0; i < 3; ++i) {
    client.request({{"action", "hold"}});
  }
  EXPECT_EQ(run.get(), 6u);
  EXPECT_EQ(hook->exchanges(), 5u);
  EXPECT_EQ(hook->analysis()["render_requests"], 2);
  EXPECT_TRUE(first[0].is_array());
}

// -----------------------------------------------------------------------------
// 3. done ends the episode on the spot.
// -----------------------------------------------------------------------------
TEST_F(StepExchangeTestFixture, DoneStopsEngine) {
  build(50, 2, 1);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  client.request({{"action", "buy"}});
  client.request({{"action", "hold"}});
  EXPECT_EQ(client.request({{"ctrl", "done"}}), StepExchange::kDoneAck);

  std::size_t length = run.get();
  EXPECT_EQ(length, 4u);
  EXPECT_TRUE(hook->forcedDone());
  EXPECT_TRUE(engine->stopRequested());

  // Early stop refreshed the non-episode renderings.
  EXPECT_EQ(renderer.render({"human"})["info"]["step"], 3);
}

// -----------------------------------------------------------------------------
// 4. skip_frame gates communication; info batches cover skipped ticks.
// -----------------------------------------------------------------------------
TEST_F(StepExchangeTestFixture, SkipFrameBatchesInfo) {
  build(10, 1, 3, true);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  std::vector<std::size_t> batch_sizes;
  std::vector<bool> done_flags;
  for (int i = 0; i < 4; ++i) {
    nlohmann::json reply = client.request({{"action", "hold"}});
    batch_sizes.push_back(reply[3].size());
    done_flags.push_back(reply[2].get<bool>());
  }

  EXPECT_EQ(run.get(), 10u);
  EXPECT_EQ(batch_sizes, (std::vector<std::size_t>{3, 3, 3, 1}));
  EXPECT_EQ(done_flags, (std::vector<bool>{false, false, false, true}));
  EXPECT_EQ(hook->analysis()["info_records"], 10);
}

TEST_F(StepExchangeTestFixture, DefaultSendsOnlyNewestInfo) {
  build(10, 1, 3, false);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  nlohmann::json reply = client.request({{"action", "hold"}});
  ASSERT_EQ(reply[3].size(), 1u);
  EXPECT_EQ(reply[3][0]["step"], 3);

  for (int i = 0; i < 3; ++i) {
    client.request({{"action", "hold"}});
  }
  run.get();
}

// -----------------------------------------------------------------------------
// 5. Protocol violations during an episode are fatal after a reply.
// -----------------------------------------------------------------------------
TEST_F(StepExchangeTestFixture, UnknownControlIsFatal) {
  build(10, 2, 1);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  nlohmann::json reply = client.request({{"ctrl", "reset"}});
  EXPECT_TRUE(reply.is_string());

  try {
    run.get();
    FAIL() << "run() finished despite an unknown control key";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.kind(), ProtocolError::Kind::UnknownControl);
  }
}

TEST_F(StepExchangeTestFixture, MissingActionIsFatal) {
  build(10, 2, 1);
  auto run = runAsync();
  gymbridge::test::TestClient client(endpoint);

  nlohmann::json reply = client.request({{"foo", 1}});
  ASSERT_TRUE(reply.is_string());
  EXPECT_EQ(reply.get<std::string>().rfind("No <action> key received", 0), 0u);

  try {
    run.get();
    FAIL() << "run() finished despite a request without action";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.kind(), ProtocolError::Kind::MissingAction);
  }
}

TEST_F(StepExchangeTestFixture, HookCannotBeCloned) {
  build(5, 2, 1);
  EXPECT_THROW(hook->clone(), std::logic_error);
  EXPECT_THROW(engine->clone(), std::logic_error);
}
