// =============================================================================
// data_acquisition_test.cpp
// =============================================================================
// Unit tests for gymbridge::DataAcquisition.
//
// Validates:
//   - K "not ready" replies then data: K+1 attempts, K back-off sleeps
//   - Never ready: stop sent to the provider, give-up hook run, Timeout
//   - No provider / malformed reply: Unreachable without retrying
//
// Design: a ScriptedProvider plays the data provider over loopback TCP;
// SimulationTimeProvider absorbs the back-off so tests run in milliseconds.
// =============================================================================

#include "gymbridge/data/data_acquisition.hpp"
#include "gymbridge/protocol/errors.hpp"
#include "gymbridge/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <sstream>
#include <string>

using gymbridge::AcquisitionPolicy;
using gymbridge::BoundedChannel;
using gymbridge::DataAcquisition;
using gymbridge::DataError;

class DataAcquisitionTestFixture : public ::testing::Test {
 protected:
  std::ostringstream sink;
  gymbridge::Logger log{"EnvServer_0", gymbridge::LogLevel::Debug, &sink,
                        &sink};
  gymbridge::SimulationTimeProvider clock;
  std::string endpoint = gymbridge::test::nextEndpoint();

  std::unique_ptr<BoundedChannel> openChannel(int receive_ms = 2000) {
    gymbridge::ChannelOptions o;
    o.send_timeout_ms = 500;
    o.receive_timeout_ms = receive_ms;
    auto channel = std::make_unique<BoundedChannel>(
        gymbridge::ChannelRole::Request, endpoint, o);
    channel->open();
    return channel;
  }
};

// -----------------------------------------------------------------------------
// 1. K not-ready replies, then a trial.
// -----------------------------------------------------------------------------
TEST_F(DataAcquisitionTestFixture, RetriesUntilReady) {
  constexpr int kNotReady = 4;
  auto trial = gymbridge::test::makeSample(80);
  std::atomic<int> served{0};

  gymbridge::test::ScriptedProvider provider(
      endpoint, [&](const nlohmann::json&) {
        return served++ < kNotReady ? gymbridge::test::notReadyReply()
                                    : gymbridge::test::readyReply(*trial);
      });

  auto channel = openChannel();
  DataAcquisition acquisition(*channel, log, clock, AcquisitionPolicy{}, 11);

  gymbridge::AcquiredTrial acquired =
      acquisition.acquire({{"sample_type", 0}});

  ASSERT_NE(acquired.sample, nullptr);
  EXPECT_EQ(acquired.sample->size(), 80u);
  EXPECT_EQ(acquired.trial_stat["count"], 80);
  EXPECT_EQ(acquired.dataset_stat["count"], 80);

  EXPECT_EQ(acquisition.attempts(), kNotReady + 1);
  EXPECT_EQ(clock.sleep_count(), kNotReady);
  EXPECT_NEAR(static_cast<double>(clock.total_slept_ms()) / 1000.0,
              acquisition.waited_s(), 0.001 * kNotReady);

  for (const auto& request : provider.requests()) {
    EXPECT_EQ(request["ctrl"], "get_data");
    EXPECT_EQ(request["kwargs"]["sample_type"], 0);
  }
  EXPECT_NE(sink.str().find("Dataset not ready"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 2. Never ready: Timeout once the budget is spent, stop observed first.
// -----------------------------------------------------------------------------
TEST_F(DataAcquisitionTestFixture, GivesUpAfterBudget) {
  gymbridge::test::ScriptedProvider provider(
      endpoint, [](const nlohmann::json& request) {
        if (request.value("ctrl", "") == "stop") {
          return nlohmann::json{{"ctrl", "stopping"}};
        }
        return gymbridge::test::notReadyReply();
      });

  auto channel = openChannel();
  AcquisitionPolicy policy;
  policy.wait_budget_s = 3.0;
  policy.max_backoff_s = 2.0;
  DataAcquisition acquisition(*channel, log, clock, policy, 5);

  bool hook_ran = false;
  acquisition.setGiveUpHook([&hook_ran]() { hook_ran = true; });

  try {
    acquisition.acquire(nlohmann::json::object());
    FAIL() << "acquire() returned without data";
  } catch (const DataError& e) {
    EXPECT_EQ(e.kind(), DataError::Kind::Timeout);
  }

  EXPECT_TRUE(hook_ran);
  EXPECT_GT(acquisition.waited_s(), policy.wait_budget_s);

  auto ctrls = provider.ctrls();
  ASSERT_GE(ctrls.size(), 2u);
  EXPECT_EQ(ctrls.back(), "stop");
  for (std::size_t i = 0; i + 1 < ctrls.size(); ++i) {
    EXPECT_EQ(ctrls[i], "get_data");
  }
}

// -----------------------------------------------------------------------------
// 3. Failed exchanges are not retried.
// -----------------------------------------------------------------------------
TEST_F(DataAcquisitionTestFixture, SilentProviderIsUnreachable) {
  gymbridge::test::ScriptedProvider provider(
      endpoint, [](const nlohmann::json&) { return nlohmann::json(); });

  auto channel = openChannel(100);
  DataAcquisition acquisition(*channel, log, clock);

  try {
    acquisition.acquire(nlohmann::json::object());
    FAIL() << "acquire() did not throw";
  } catch (const DataError& e) {
    EXPECT_EQ(e.kind(), DataError::Kind::Unreachable);
  }
  EXPECT_EQ(acquisition.attempts(), 1);
  EXPECT_EQ(clock.sleep_count(), 0);
}

TEST_F(DataAcquisitionTestFixture, MalformedSampleIsUnreachable) {
  gymbridge::test::ScriptedProvider provider(
      endpoint, [](const nlohmann::json&) {
        return nlohmann::json{{"status", "ready"}, {"stat", {}}};
      });

  auto channel = openChannel();
  DataAcquisition acquisition(*channel, log, clock);
  EXPECT_THROW(acquisition.acquire(nlohmann::json::object()), DataError);
}

TEST_F(DataAcquisitionTestFixture, PingFailureIsFatal) {
  auto channel = openChannel(100);
  DataAcquisition acquisition(*channel, log, clock);
  EXPECT_THROW(acquisition.ping(), DataError);
}

TEST_F(DataAcquisitionTestFixture, RequestDataClassifiesReplies) {
  auto trial = gymbridge::test::makeSample(20);
  std::atomic<int> served{0};
  gymbridge::test::ScriptedProvider provider(
      endpoint, [&](const nlohmann::json&) {
        return served++ == 0 ? gymbridge::test::notReadyReply()
                             : gymbridge::test::readyReply(*trial);
      });

  auto channel = openChannel();
  DataAcquisition acquisition(*channel, log, clock);

  EXPECT_EQ(acquisition.requestData({}).readiness,
            gymbridge::DataReadiness::NotReady);
  EXPECT_EQ(acquisition.requestData({}).readiness,
            gymbridge::DataReadiness::Ready);
}

TEST_F(DataAcquisitionTestFixture, ProviderErrorCarriesReason) {
  gymbridge::test::ScriptedProvider provider(
      endpoint, [](const nlohmann::json&) {
        return nlohmann::json{{"status", "error"},
                              {"ctrl", "Requested length exceeds section"}};
      });

  auto channel = openChannel();
  DataAcquisition acquisition(*channel, log, clock);
  EXPECT_EQ(acquisition.requestData({}).readiness,
            gymbridge::DataReadiness::Rejected);

  try {
    acquisition.acquire(nlohmann::json::object());
    FAIL() << "acquire() accepted an error reply";
  } catch (const DataError& e) {
    EXPECT_EQ(e.kind(), DataError::Kind::Unreachable);
    EXPECT_NE(std::string(e.what()).find("Requested length exceeds section"),
              std::string::npos);
  }
  EXPECT_EQ(acquisition.attempts(), 1);
  EXPECT_FALSE(acquisition.stopSent());
}

TEST(DataAcquisitionPolicyTest, RejectsNonPositiveBackoff) {
  gymbridge::BoundedChannel channel(gymbridge::ChannelRole::Request,
                                    "tcp://127.0.0.1:1",
                                    gymbridge::ChannelOptions{});
  std::ostringstream sink;
  gymbridge::Logger log("t", gymbridge::LogLevel::Error, &sink, &sink);
  gymbridge::SimulationTimeProvider clock;
  AcquisitionPolicy policy;
  policy.max_backoff_s = 0.0;
  EXPECT_THROW(DataAcquisition(channel, log, clock, policy),
               std::invalid_argument);
}
