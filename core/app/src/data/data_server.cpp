#include "gymbridge/data/data_server.hpp"
#include "gymbridge/protocol/message.hpp"

#include <cerrno>
#include <stdexcept>
#include <utility>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Constructor: compute dataset statistics once
// -----------------------------------------------------------------------------
DataServer::DataServer(std::unique_ptr<DataSample> dataset,
                       DataServerOptions options, Logger& log,
                       const ITimeProvider& clock)
    : dataset_(std::move(dataset)),
      options_(std::move(options)),
      log_(log),
      clock_(clock) {
  if (!dataset_ || dataset_->size() == 0) {
    throw std::invalid_argument("DataServer: dataset must not be empty");
  }
  dataset_stat_ = dataset_->describe();
}

DataServer::~DataServer() { stop(); }

// -----------------------------------------------------------------------------
// bind(): create the REP socket on the caller's thread
// -----------------------------------------------------------------------------
void DataServer::bind() {
  if (socket_) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->bind(options_.endpoint);

  started_ms_ = clock_.now_ms();
  stop_requested_.store(false);

  log_.info("Serving " + dataset_->filename() + " (" +
            std::to_string(dataset_->size()) + " rows) at " +
            options_.endpoint);
}

// -----------------------------------------------------------------------------
// start(): bind and spawn the worker thread
// -----------------------------------------------------------------------------
void DataServer::start() {
  if (running_.load()) {
    return;
  }
  bind();
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): signal, join, release the socket
// -----------------------------------------------------------------------------
void DataServer::stop() {
  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// run(): serve until stop() or a stop request
// -----------------------------------------------------------------------------
void DataServer::run() {
  bind();
  running_.store(true);

  while (running_.load() && !stop_requested_.load()) {
    serveOne();
  }

  running_.store(false);
  log_.info("Data server loop exited.");
}

// -----------------------------------------------------------------------------
// serveOne(): one receive / reply pair, or a receive timeout
// -----------------------------------------------------------------------------
void DataServer::serveOne() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  nlohmann::json reply;
  try {
    reply = handleRequest(nlohmann::json::parse(request.to_string()));
  } catch (const nlohmann::json::parse_error& e) {
    log_.warning(std::string("Malformed request: ") + e.what());
    reply = {{"status", "error"}, {"ctrl", "Malformed request."}};
  }

  std::string payload = reply.dump();
  zmq::message_t frame(payload.data(), payload.size());
  if (!socket_->send(frame, zmq::send_flags::none)) {
    log_.warning("Reply not sent: send timed out");
  }
}

bool DataServer::isReady() const {
  auto ready_ms = static_cast<std::int64_t>(options_.ready_after_s * 1000.0);
  return clock_.now_ms() - started_ms_ >= ready_ms;
}

// -----------------------------------------------------------------------------
// handleRequest(): dispatch on ctrl
// -----------------------------------------------------------------------------
nlohmann::json DataServer::handleRequest(const nlohmann::json& request) {
  Message msg = Message::fromJson(request);
  log_.debug("Received <" + request.dump() + ">");

  switch (msg.controlCode()) {
    case ControlCode::Ping:
      return {{"status", isReady() ? data_status::kReady
                                   : data_status::kNotReady},
              {"ctrl", "pong"}};

    case ControlCode::Stop:
      stop_requested_.store(true);
      log_.info("Stop requested.");
      return {{"ctrl", "stopping"}};

    case ControlCode::GetData: {
      if (!isReady()) {
        return {{"status", data_status::kNotReady},
                {"ctrl", kNotReadyMarker}};
      }

      try {
        SampleConfig config = SampleConfig::fromJson(msg.kwargs);
        if (config.length == 0) {
          config.length = options_.trial_length;
        }
        auto trial = dataset_->sample(config);
        ++trials_served_;
        log_.debug("Sending trial <" + trial->filename() + ">");
        return {{"status", data_status::kReady},
                {"sample", trial->toJson()},
                {"stat", dataset_stat_}};
      } catch (const std::invalid_argument& e) {
        log_.warning(std::string("Cannot sample trial: ") + e.what());
        return {{"status", "error"}, {"ctrl", e.what()}};
      } catch (const nlohmann::json::exception& e) {
        log_.warning(std::string("Bad trial config: ") + e.what());
        return {{"status", "error"}, {"ctrl", e.what()}};
      }
    }

    default:
      return {{"status", "error"},
              {"ctrl", "send control keys: <ping>, <get_data>, <stop>."}};
  }
}

}  // namespace gymbridge
