#include "gymbridge/data/data_acquisition.hpp"
#include "gymbridge/protocol/message.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
DataAcquisition::DataAcquisition(BoundedChannel& data_channel, Logger& log,
                                 ITimeProvider& clock,
                                 AcquisitionPolicy policy, std::uint64_t seed)
    : channel_(data_channel),
      log_(log),
      clock_(clock),
      policy_(policy),
      rng_(seed) {
  if (policy_.wait_budget_s < 0.0 || !(policy_.max_backoff_s > 0.0)) {
    throw std::invalid_argument(
        "DataAcquisition: wait budget must be >= 0 and max back-off > 0");
  }
}

// -----------------------------------------------------------------------------
// ping()
// -----------------------------------------------------------------------------
nlohmann::json DataAcquisition::ping() {
  log_.debug("Pinging data_server at: " + channel_.endpoint() + " ...");

  ExchangeResult result =
      channel_.exchange(Message::makeControl(ctrl::kPing).toJson());
  if (!result.ok()) {
    std::string msg = std::string("Data_server unreachable with status: <") +
                      exchangeStatusToString(result.status) + ">.";
    log_.error(msg);
    throw DataError(DataError::Kind::Unreachable, msg);
  }

  log_.debug("Data_server seems ready with response: <" +
             result.message.dump() + ">");
  return result.message;
}

// -----------------------------------------------------------------------------
// classify(): explicit status field decides readiness
// -----------------------------------------------------------------------------
DataReadiness DataAcquisition::classify(const ExchangeResult& result) {
  if (!result.ok()) {
    return DataReadiness::Unreachable;
  }
  const auto& msg = result.message;
  if (msg.is_object()) {
    auto it = msg.find("status");
    if (it != msg.end() && it->is_string()) {
      const std::string status = it->get<std::string>();
      if (status == data_status::kNotReady) {
        return DataReadiness::NotReady;
      }
      if (status == data_status::kError) {
        return DataReadiness::Rejected;
      }
    }
  }
  return DataReadiness::Ready;
}

// -----------------------------------------------------------------------------
// requestData(): one get_data round trip
// -----------------------------------------------------------------------------
DataReply DataAcquisition::requestData(const nlohmann::json& kwargs) {
  ExchangeResult result = channel_.exchange(
      Message::makeControl(ctrl::kGetData, kwargs).toJson());

  DataReply reply;
  reply.readiness = classify(result);
  reply.status = result.status;
  reply.elapsed_ms = result.elapsed_ms;
  reply.message = std::move(result.message);
  return reply;
}

// -----------------------------------------------------------------------------
// acquire(): poll until ready, unreachable, or out of budget
// -----------------------------------------------------------------------------
AcquiredTrial DataAcquisition::acquire(const nlohmann::json& kwargs) {
  attempts_ = 0;
  waited_s_ = 0.0;
  std::uniform_real_distribution<double> jitter(0.0, policy_.max_backoff_s);

  while (true) {
    DataReply reply = requestData(kwargs);
    ++attempts_;

    if (reply.readiness == DataReadiness::Unreachable) {
      std::string msg =
          std::string("Sampling attempt: data_server unreachable with "
                      "status: <") +
          exchangeStatusToString(reply.status) + ">.";
      log_.error(msg);
      throw DataError(DataError::Kind::Unreachable, msg);
    }

    if (reply.readiness == DataReadiness::Rejected) {
      std::string msg = "Data_server rejected the request: <" +
                        reply.message.value("ctrl", std::string("?")) + ">.";
      log_.error(msg);
      throw DataError(DataError::Kind::Unreachable, msg);
    }

    if (reply.readiness == DataReadiness::Ready) {
      log_.debug("Data_server responded with data in about " +
                 std::to_string(reply.elapsed_ms) + " ms.");
      try {
        AcquiredTrial trial;
        trial.sample = DataSample::fromJson(reply.message.at("sample"));
        trial.trial_stat = trial.sample->describe();
        trial.sample->reset();
        trial.dataset_stat = reply.message.value("stat", nlohmann::json());
        return trial;
      } catch (const nlohmann::json::exception& e) {
        std::string msg =
            std::string("Data_server sent a malformed sample: ") + e.what();
        log_.error(msg);
        throw DataError(DataError::Kind::Unreachable, msg);
      }
    }

    // Not ready yet.
    if (waited_s_ <= policy_.wait_budget_s) {
      double pause = jitter(rng_);
      clock_.sleep_ms(static_cast<std::int64_t>(std::llround(pause * 1000.0)));
      waited_s_ += pause;

      std::ostringstream os;
      os << "Dataset not ready, wait time left: " << std::fixed
         << std::setprecision(2) << (policy_.wait_budget_s - waited_s_)
         << "s.";
      log_.info(os.str());
      continue;
    }

    sendStop();
    if (give_up_hook_) {
      give_up_hook_();
    }
    std::string msg =
        "Dataset never became ready within the wait budget. Exiting.";
    log_.error(msg);
    throw DataError(DataError::Kind::Timeout, msg);
  }
}

// -----------------------------------------------------------------------------
// sendStop(): best effort; the outcome is logged, not acted on
// -----------------------------------------------------------------------------
bool DataAcquisition::sendStop() {
  stop_sent_ = true;
  ExchangeResult result =
      channel_.exchange(Message::makeControl(ctrl::kStop).toJson());
  if (!result.ok()) {
    log_.warning(std::string("Data_server did not acknowledge stop: <") +
                 exchangeStatusToString(result.status) + ">.");
    return false;
  }
  return true;
}

}  // namespace gymbridge
