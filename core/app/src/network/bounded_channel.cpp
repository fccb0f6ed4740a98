#include "gymbridge/network/bounded_channel.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Constructor: validate options, defer socket creation to open()
// -----------------------------------------------------------------------------
BoundedChannel::BoundedChannel(ChannelRole role, std::string endpoint,
                               ChannelOptions options)
    : role_(role),
      endpoint_(std::move(endpoint)),
      options_(validate(options)),
      turn_(role == ChannelRole::Reply ? Turn::Receive : Turn::Send) {
  if (endpoint_.empty()) {
    throw std::invalid_argument("BoundedChannel: endpoint must not be empty");
  }
}

BoundedChannel::~BoundedChannel() { close(); }

// -----------------------------------------------------------------------------
// validate(): strictly positive timeouts, kUnbounded allowed for receive only
// -----------------------------------------------------------------------------
ChannelOptions BoundedChannel::validate(const ChannelOptions& options) {
  if (options.send_timeout_ms <= 0) {
    throw std::invalid_argument(
        "BoundedChannel: send timeout must be strictly positive, got " +
        std::to_string(options.send_timeout_ms));
  }
  if (options.receive_timeout_ms <= 0 &&
      options.receive_timeout_ms != ChannelOptions::kUnbounded) {
    throw std::invalid_argument(
        "BoundedChannel: receive timeout must be strictly positive or "
        "unbounded, got " +
        std::to_string(options.receive_timeout_ms));
  }
  return options;
}

// -----------------------------------------------------------------------------
// open(): create socket, apply timeouts, bind or connect
// -----------------------------------------------------------------------------
void BoundedChannel::open() {
  if (socket_) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  auto type = (role_ == ChannelRole::Reply) ? zmq::socket_type::rep
                                            : zmq::socket_type::req;
  socket_ = std::make_unique<zmq::socket_t>(*context_, type);

  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::sndtimeo, options_.send_timeout_ms);
  socket_->set(zmq::sockopt::rcvtimeo, options_.receive_timeout_ms);

  if (role_ == ChannelRole::Reply) {
    socket_->bind(endpoint_);
  } else {
    // Let a timed-out request be abandoned without wedging the socket.
    socket_->set(zmq::sockopt::req_relaxed, 1);
    socket_->set(zmq::sockopt::req_correlate, 1);
    socket_->connect(endpoint_);
  }

  turn_ = (role_ == ChannelRole::Reply) ? Turn::Receive : Turn::Send;
}

// -----------------------------------------------------------------------------
// close(): release socket and context
// -----------------------------------------------------------------------------
void BoundedChannel::close() {
  if (socket_) {
    socket_->close();
    socket_.reset();
  }
  if (context_) {
    context_->close();
    context_.reset();
  }
}

// -----------------------------------------------------------------------------
// requireTurn(): enforce strict request/reply alternation
// -----------------------------------------------------------------------------
void BoundedChannel::requireTurn(Turn expected, const char* operation) const {
  if (turn_ == expected) {
    return;
  }
  throw ProtocolError(
      ProtocolError::Kind::OutOfOrderExchange,
      std::string("BoundedChannel: ") + operation + " out of turn on " +
          (role_ == ChannelRole::Reply ? "reply" : "request") +
          " channel " + endpoint_);
}

// -----------------------------------------------------------------------------
// send(): serialize to JSON text and push one frame
// -----------------------------------------------------------------------------
ChannelStatus BoundedChannel::send(const nlohmann::json& message) {
  if (!socket_) {
    return ChannelStatus::TransportError;
  }
  requireTurn(Turn::Send, "send");

  std::string payload = message.dump();
  zmq::message_t frame(payload.data(), payload.size());

  zmq::send_result_t result;
  try {
    result = socket_->send(frame, zmq::send_flags::none);
  } catch (const zmq::error_t&) {
    return ChannelStatus::TransportError;
  }

  // An empty result means EAGAIN: ZMQ_SNDTIMEO expired.
  if (!result.has_value()) {
    return ChannelStatus::TimedOut;
  }

  turn_ = Turn::Receive;
  return ChannelStatus::Ok;
}

// -----------------------------------------------------------------------------
// receive(): pull one frame and parse it as JSON
// -----------------------------------------------------------------------------
ReceiveResult BoundedChannel::receive() {
  ReceiveResult out;
  if (!socket_) {
    out.status = ChannelStatus::TransportError;
    return out;
  }
  requireTurn(Turn::Receive, "receive");

  zmq::message_t frame;
  zmq::recv_result_t result;
  try {
    result = socket_->recv(frame, zmq::recv_flags::none);
  } catch (const zmq::error_t&) {
    if (role_ == ChannelRole::Request) {
      turn_ = Turn::Send;
    }
    out.status = ChannelStatus::TransportError;
    return out;
  }

  if (!result.has_value()) {
    // ZMQ_RCVTIMEO expired. A REQ socket in relaxed mode may send again; a
    // REP socket never received anything, so it still owes nothing.
    if (role_ == ChannelRole::Request) {
      turn_ = Turn::Send;
    }
    out.status = ChannelStatus::TimedOut;
    return out;
  }

  // The frame is consumed: from here on a reply is owed (REP) or the
  // request is answered (REQ), regardless of whether the payload parses.
  turn_ = Turn::Send;

  try {
    out.message = nlohmann::json::parse(frame.to_string());
  } catch (const nlohmann::json::parse_error&) {
    out.message = frame.to_string();
    out.status = ChannelStatus::TransportError;
    return out;
  }

  out.status = ChannelStatus::Ok;
  return out;
}

// -----------------------------------------------------------------------------
// exchange(): send, then receive, with a structured outcome
// -----------------------------------------------------------------------------
ExchangeResult BoundedChannel::exchange(const nlohmann::json& message) {
  ExchangeResult out;

  ChannelStatus sent = send(message);
  if (sent != ChannelStatus::Ok) {
    out.status = (sent == ChannelStatus::TimedOut)
                     ? ExchangeStatus::SendFailedTimeout
                     : ExchangeStatus::SendFailedOther;
    return out;
  }

  auto start = std::chrono::steady_clock::now();
  ReceiveResult received = receive();
  out.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  switch (received.status) {
    case ChannelStatus::Ok:
      out.status = ExchangeStatus::Ok;
      out.message = std::move(received.message);
      break;
    case ChannelStatus::TimedOut:
      out.status = ExchangeStatus::ReceiveFailedTimeout;
      break;
    case ChannelStatus::TransportError:
      out.status = ExchangeStatus::ReceiveFailedOther;
      break;
  }
  return out;
}

bool BoundedChannel::replyPending() const {
  return socket_ != nullptr && role_ == ChannelRole::Reply &&
         turn_ == Turn::Send;
}

}  // namespace gymbridge
