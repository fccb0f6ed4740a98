#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Helpers shared by the socket-level tests:
//   - makeBars()            synthetic OHLCV feed
//   - TestClient            REQ socket playing the controller
//   - ScriptedProvider      REP socket on a thread playing the data provider
//   - nextEndpoint()        unique loopback TCP endpoint per call
// =============================================================================

#include "gymbridge/data/bar.hpp"
#include "gymbridge/data/data_sample.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace gymbridge {
namespace test {

// Each test binary runs in its own process; ports are unique within one.
inline std::string nextEndpoint() {
  static std::atomic<int> port{0};
  if (port.load() == 0) {
    // Spread test binaries apart so parallel ctest runs rarely collide.
    int base = 20000 + static_cast<int>(::getpid() % 1000) * 40;
    int expected = 0;
    port.compare_exchange_strong(expected, base);
  }
  return "tcp://127.0.0.1:" + std::to_string(port.fetch_add(1));
}

// Gently oscillating close prices, one bar per minute.
inline std::vector<Bar> makeBars(std::size_t count, double start = 100.0) {
  std::vector<Bar> bars;
  bars.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    double close = start + std::sin(static_cast<double>(i) / 5.0);
    Bar b;
    b.timestamp_ms = 1577836800000LL + static_cast<std::int64_t>(i) * 60000;
    b.open = close - 0.05;
    b.high = close + 0.2;
    b.low = close - 0.2;
    b.close = close;
    b.volume = 100.0 + static_cast<double>(i % 7);
    bars.push_back(b);
  }
  return bars;
}

inline std::unique_ptr<DataSample> makeSample(std::size_t count,
                                              double train_ratio = 1.0,
                                              std::uint64_t seed = 1) {
  return std::make_unique<DataSample>("synthetic.csv", makeBars(count),
                                      nlohmann::json::object(), train_ratio,
                                      seed);
}

// -----------------------------------------------------------------------------
// TestClient - controller side of the controller channel
// -----------------------------------------------------------------------------
class TestClient {
 public:
  explicit TestClient(const std::string& endpoint, int timeout_ms = 5000)
      : context_(1), socket_(context_, zmq::socket_type::req) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, timeout_ms);
    socket_.set(zmq::sockopt::sndtimeo, timeout_ms);
    socket_.connect(endpoint);
  }

  // Throws std::runtime_error when no reply arrives in time.
  nlohmann::json request(const nlohmann::json& message) {
    std::string payload = message.dump();
    zmq::message_t out(payload.data(), payload.size());
    if (!socket_.send(out, zmq::send_flags::none)) {
      throw std::runtime_error("TestClient: send timed out");
    }
    zmq::message_t in;
    if (!socket_.recv(in, zmq::recv_flags::none)) {
      throw std::runtime_error("TestClient: no reply to " + payload);
    }
    return nlohmann::json::parse(in.to_string());
  }

  // Sends a frame that is not JSON.
  std::string requestRaw(const std::string& payload) {
    zmq::message_t out(payload.data(), payload.size());
    if (!socket_.send(out, zmq::send_flags::none)) {
      throw std::runtime_error("TestClient: send timed out");
    }
    zmq::message_t in;
    if (!socket_.recv(in, zmq::recv_flags::none)) {
      throw std::runtime_error("TestClient: no reply to raw frame");
    }
    return in.to_string();
  }

 private:
  zmq::context_t context_;
  zmq::socket_t socket_;
};

// -----------------------------------------------------------------------------
// ScriptedProvider - data-provider stand-in answering from a callback
// -----------------------------------------------------------------------------
//
// Binds in the constructor, serves on its own thread until destroyed. Every
// request is recorded. The handler returns the reply document; a handler
// that returns null makes the provider stay silent (no reply), which the
// requester observes as a receive timeout.
// -----------------------------------------------------------------------------
class ScriptedProvider {
 public:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  ScriptedProvider(const std::string& endpoint, Handler handler)
      : handler_(std::move(handler)),
        context_(1),
        socket_(context_, zmq::socket_type::rep) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, 20);
    socket_.bind(endpoint);
    thread_ = std::thread([this]() { loop(); });
  }

  ~ScriptedProvider() {
    running_.store(false);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ScriptedProvider(const ScriptedProvider&) = delete;
  ScriptedProvider& operator=(const ScriptedProvider&) = delete;

  std::vector<nlohmann::json> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::vector<std::string> ctrls() const {
    std::vector<std::string> out;
    for (const auto& r : requests()) {
      out.push_back(r.value("ctrl", std::string{}));
    }
    return out;
  }

 private:
  void loop() {
    while (running_.load()) {
      zmq::message_t in;
      zmq::recv_result_t got;
      try {
        got = socket_.recv(in, zmq::recv_flags::none);
      } catch (const zmq::error_t&) {
        return;
      }
      if (!got) {
        continue;
      }
      nlohmann::json request = nlohmann::json::parse(in.to_string());
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
      }
      nlohmann::json reply = handler_(request);
      if (reply.is_null()) {
        // Stay silent; a REP socket cannot receive again until it replies,
        // so the rest of the test talks to a wedged provider on purpose.
        while (running_.load()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return;
      }
      std::string payload = reply.dump();
      zmq::message_t out(payload.data(), payload.size());
      if (!socket_.send(out, zmq::send_flags::none)) {
        return;
      }
    }
  }

  Handler handler_;
  zmq::context_t context_;
  zmq::socket_t socket_;
  std::thread thread_;
  std::atomic<bool> running_{true};
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> requests_;
};

// Reply a ready provider gives to get_data.
inline nlohmann::json readyReply(const DataSample& trial) {
  return {{"status", "ready"},
          {"sample", trial.toJson()},
          {"stat", trial.describe()}};
}

inline nlohmann::json notReadyReply() {
  return {{"status", "not_ready"}, {"ctrl", "Dataset not ready"}};
}

inline nlohmann::json pongReply() {
  return {{"status", "ready"}, {"ctrl", "pong"}};
}

}  // namespace test
}  // namespace gymbridge
