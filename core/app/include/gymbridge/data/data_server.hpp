#pragma once

#include "gymbridge/data/data_sample.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace gymbridge {

// -----------------------------------------------------------------------------
// DataServerOptions
// -----------------------------------------------------------------------------
struct DataServerOptions {
  std::string endpoint{"tcp://127.0.0.1:4999"};
  // Rows per trial when the request does not ask for a length.
  std::size_t trial_length{0};
  // The server answers "not_ready" until this many seconds after start().
  double ready_after_s{0.0};
};

// -----------------------------------------------------------------------------
// DataServer - data-provider side of the data channel
// -----------------------------------------------------------------------------
//
// @brief  REP socket that hands out trial samples drawn from one dataset.
//
// @details
// Requests (JSON objects, see protocol/message.hpp):
//   {ctrl: "ping"}             → {status: ready|not_ready, ctrl: "pong"}
//   {ctrl: "get_data", kwargs} → {status: "not_ready", ctrl: "Dataset not
//                                ready"} while warming up, otherwise
//                                {status: "ready", sample: <trial>,
//                                 stat: <dataset describe()>}
//   {ctrl: "stop"}             → {ctrl: "stopping"}; the loop then exits
//   anything else              → {status: "error", ctrl: <hint>}
//
// kwargs is a SampleConfig document. A zero or missing length falls back to
// DataServerOptions::trial_length (0 there means the whole section). A
// request the dataset cannot satisfy is answered with status "error".
//
// Thread model:
//   start() binds the socket on the caller's thread and spawns the worker
//   running run(). run() can also be called directly to serve on the
//   current thread (the gymbridge_data_server executable does this). The
//   receive timeout (kPollTimeoutMs) lets run() notice stop() promptly.
//
// Ownership:
//   Owns the dataset, the ZMQ context and socket, and the worker thread.
//   Holds references to the logger and the clock.
// -----------------------------------------------------------------------------
class DataServer {
 public:
  DataServer(std::unique_ptr<DataSample> dataset, DataServerOptions options,
             Logger& log, const ITimeProvider& clock);

  ~DataServer();

  DataServer(const DataServer&) = delete;
  DataServer& operator=(const DataServer&) = delete;
  DataServer(DataServer&&) = delete;
  DataServer& operator=(DataServer&&) = delete;

  // Creates and binds the socket. Idempotent. Starts the readiness clock.
  void bind();

  // bind() + spawn the worker thread. Idempotent.
  void start();

  // Signals the loop to exit and joins the worker. Idempotent.
  void stop();

  // Signals the loop to exit without joining. Safe from a signal handler.
  void requestStop() { running_.store(false); }

  // Serves requests until stop() or a {ctrl: "stop"} request.
  void run();

  // -------------------------------------------------------------------------
  // handleRequest(request)
  // -------------------------------------------------------------------------
  // @brief  Computes the reply for one request. No socket I/O.
  //
  // @details
  // Sets the stop-requested flag on {ctrl: "stop"}; run() checks it after
  // sending the reply.
  // -------------------------------------------------------------------------
  nlohmann::json handleRequest(const nlohmann::json& request);

  bool isReady() const;
  bool stopRequested() const { return stop_requested_.load(); }
  int trialsServed() const { return trials_served_; }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void serveOne();

  std::unique_ptr<DataSample> dataset_;
  DataServerOptions options_;
  Logger& log_;
  const ITimeProvider& clock_;

  nlohmann::json dataset_stat_;
  std::int64_t started_ms_{0};
  int trials_served_{0};

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

}  // namespace gymbridge
