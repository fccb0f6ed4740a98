#pragma once

#include "gymbridge/protocol/errors.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace gymbridge {

// -----------------------------------------------------------------------------
// ChannelRole - which side of the request/reply pair this channel plays
// -----------------------------------------------------------------------------
//   Reply   - binds a REP socket; must receive() before each send().
//   Request - connects a REQ socket; must send() before each receive().
// -----------------------------------------------------------------------------
enum class ChannelRole { Reply, Request };

// -----------------------------------------------------------------------------
// ChannelOptions - per-direction timeouts in milliseconds
// -----------------------------------------------------------------------------
// send_timeout_ms must be strictly positive. receive_timeout_ms must be
// strictly positive or kUnbounded (wait forever).
// -----------------------------------------------------------------------------
struct ChannelOptions {
  static constexpr int kUnbounded = -1;

  int send_timeout_ms{60000};
  int receive_timeout_ms{60000};
};

struct ReceiveResult {
  ChannelStatus status{ChannelStatus::TransportError};
  nlohmann::json message;

  bool ok() const { return status == ChannelStatus::Ok; }
};

struct ExchangeResult {
  ExchangeStatus status{ExchangeStatus::SendFailedOther};
  nlohmann::json message;
  std::int64_t elapsed_ms{0};

  bool ok() const { return status == ExchangeStatus::Ok; }
};

// -----------------------------------------------------------------------------
// BoundedChannel - duplex, message-oriented ZeroMQ connection with timeouts
// -----------------------------------------------------------------------------
//
// @brief  One REQ or REP socket carrying one JSON document per frame, with
//         independently configured send and receive timeouts.
//
// @details
// Every component that talks to the controller or to the data provider does
// so through a BoundedChannel:
//   - EnvServer owns a Reply channel bound at the controller address
//     (receive unbounded, send bounded).
//   - EnvServer owns a Request channel connected to the data provider
//     (both directions bounded).
//
// Outcomes are returned, not thrown:
//   - ZMQ_RCVTIMEO / ZMQ_SNDTIMEO expiry    → ChannelStatus::TimedOut
//   - any other zmq::error_t, closed socket → ChannelStatus::TransportError
//   - a frame that is not valid JSON        → ChannelStatus::TransportError
//     (the frame was consumed, so on a Reply channel a reply is now owed;
//     replyPending() reports that)
//
// Strict alternation:
//   The channel tracks whose turn it is. Calling send() or receive() out of
//   turn throws ProtocolError{OutOfOrderExchange} before touching the socket;
//   retrying cannot fix an ordering bug. A Request channel whose receive()
//   failed is handed back to the send turn; the socket is created with
//   ZMQ_REQ_RELAXED / ZMQ_REQ_CORRELATE so the next request is legal and a
//   late reply to the abandoned one is discarded.
//
// Thread model:
//   Not thread-safe. A channel is used by exactly one thread at a time (the
//   session thread in EnvServer, or a test thread).
//
// Ownership:
//   Owns its zmq::context_t and socket. Sockets close with linger 0 so
//   close() never blocks on undelivered frames.
// -----------------------------------------------------------------------------
class BoundedChannel {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  role      Reply (bind) or Request (connect).
  // @param  endpoint  ZMQ endpoint, e.g. "tcp://127.0.0.1:5500".
  // @param  options   Timeouts. Validated here.
  //
  // @throws std::invalid_argument on an empty endpoint or a non-positive
  //         timeout other than ChannelOptions::kUnbounded for receive.
  //
  // Side-effects: None. open() creates the socket.
  // -------------------------------------------------------------------------
  BoundedChannel(ChannelRole role, std::string endpoint,
                 ChannelOptions options);

  ~BoundedChannel();

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;
  BoundedChannel(BoundedChannel&&) = delete;
  BoundedChannel& operator=(BoundedChannel&&) = delete;

  // -------------------------------------------------------------------------
  // open()
  // -------------------------------------------------------------------------
  // @brief  Creates the socket, applies timeouts, binds or connects.
  //
  // @details
  // Idempotent while open. A bind failure (address in use) propagates as
  // zmq::error_t: without its channel the session cannot start at all.
  // -------------------------------------------------------------------------
  void open();

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // @brief  Closes the socket and the context. Idempotent.
  // -------------------------------------------------------------------------
  void close();

  bool isOpen() const { return socket_ != nullptr; }

  ChannelStatus send(const nlohmann::json& message);

  ReceiveResult receive();

  // -------------------------------------------------------------------------
  // exchange(message)
  // -------------------------------------------------------------------------
  // @brief  send() then receive(), folded into one ExchangeStatus.
  //
  // @details
  // Only meaningful on a Request channel. elapsed_ms covers the receive
  // wait and is filled in on success.
  // -------------------------------------------------------------------------
  ExchangeResult exchange(const nlohmann::json& message);

  // True on a Reply channel that has received a request and not yet
  // answered it.
  bool replyPending() const;

  ChannelRole role() const { return role_; }
  const std::string& endpoint() const { return endpoint_; }
  const ChannelOptions& options() const { return options_; }

 private:
  enum class Turn { Send, Receive };

  static ChannelOptions validate(const ChannelOptions& options);
  void requireTurn(Turn expected, const char* operation) const;

  ChannelRole role_;
  std::string endpoint_;
  ChannelOptions options_;
  Turn turn_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace gymbridge
