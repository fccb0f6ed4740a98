#pragma once

#include "gymbridge/data/data_sample.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/network/bounded_channel.hpp"
#include "gymbridge/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <random>

namespace gymbridge {

// -----------------------------------------------------------------------------
// AcquisitionPolicy - how long to keep polling a data provider that is not
// ready yet
// -----------------------------------------------------------------------------
struct AcquisitionPolicy {
  // Total back-off (seconds) tolerated before giving up for good.
  double wait_budget_s{300.0};
  // Each pause is drawn uniformly from [0, max_backoff_s).
  double max_backoff_s{2.0};
};

// Trial sample plus the statistics that travel with it.
struct AcquiredTrial {
  std::unique_ptr<DataSample> sample;
  nlohmann::json trial_stat;
  nlohmann::json dataset_stat;
};

// Rejected: the provider answered with status "error" (bad request).
enum class DataReadiness { Ready, NotReady, Rejected, Unreachable };

// Result of one get_data round trip, classified without exceptions.
struct DataReply {
  DataReadiness readiness{DataReadiness::Unreachable};
  ExchangeStatus status{ExchangeStatus::SendFailedOther};
  nlohmann::json message;
  std::int64_t elapsed_ms{0};
};

// -----------------------------------------------------------------------------
// DataAcquisition - bounded, jittered retry loop against the data provider
// -----------------------------------------------------------------------------
//
// @brief  Asks the data provider for a trial sample until it reports ready,
//         the exchange fails, or the wait budget runs out.
//
// @details
// acquire(kwargs) loop:
//   1. requestData(kwargs) - one {ctrl: get_data, kwargs} exchange,
//      classified as Ready / NotReady / Rejected / Unreachable.
//   2. Unreachable → DataError{Unreachable} at once. A failed exchange means
//      the provider process or the transport is broken; polling again does
//      not help. Rejected → DataError{Unreachable} carrying the provider's
//      reason.
//   3. NotReady and accumulated wait <= budget → sleep a pause drawn from
//      [0, max_backoff_s), add it to the accumulated wait, log progress,
//      repeat.
//   4. NotReady and budget spent → best-effort {ctrl: stop} to the provider,
//      run the give-up hook (EnvServer closes its controller channel there),
//      then DataError{Timeout}. The session cannot continue without data.
//   5. Ready → decode the sample, describe() it, reset() it, return it with
//      the provider's dataset statistics.
//
// The jitter keeps many sessions sharing one provider from polling it in
// lock-step.
//
// Thread model:
//   Runs on the session thread. Sleeps through the injected ITimeProvider.
//
// Ownership:
//   Holds references to the data channel, the logger and the clock; owns
//   none of them.
// -----------------------------------------------------------------------------
class DataAcquisition {
 public:
  using GiveUpHook = std::function<void()>;

  DataAcquisition(BoundedChannel& data_channel, Logger& log,
                  ITimeProvider& clock, AcquisitionPolicy policy = {},
                  std::uint64_t seed = std::random_device{}());

  DataAcquisition(const DataAcquisition&) = delete;
  DataAcquisition& operator=(const DataAcquisition&) = delete;

  // Invoked right before DataError{Timeout} is thrown.
  void setGiveUpHook(GiveUpHook hook) { give_up_hook_ = std::move(hook); }

  // -------------------------------------------------------------------------
  // ping()
  // -------------------------------------------------------------------------
  // @brief  Liveness check, done once at session start.
  // @return The provider's reply.
  // @throws DataError{Unreachable} if the exchange fails.
  // -------------------------------------------------------------------------
  nlohmann::json ping();

  DataReply requestData(const nlohmann::json& kwargs);

  // @throws DataError{Unreachable} or DataError{Timeout}.
  AcquiredTrial acquire(const nlohmann::json& kwargs);

  // Best-effort {ctrl: stop}. Returns whether the exchange succeeded.
  bool sendStop();

  // Whether sendStop() was attempted on this channel.
  bool stopSent() const { return stop_sent_; }

  // Number of get_data exchanges made by the last acquire().
  int attempts() const { return attempts_; }

  // Back-off accumulated by the last acquire(), in seconds.
  double waited_s() const { return waited_s_; }

 private:
  static DataReadiness classify(const ExchangeResult& result);

  BoundedChannel& channel_;
  Logger& log_;
  ITimeProvider& clock_;
  AcquisitionPolicy policy_;
  std::mt19937_64 rng_;
  GiveUpHook give_up_hook_;

  int attempts_{0};
  double waited_s_{0.0};
  bool stop_sent_{false};
};

}  // namespace gymbridge
