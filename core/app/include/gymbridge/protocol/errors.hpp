#pragma once

#include <stdexcept>
#include <string>

namespace gymbridge {

// -----------------------------------------------------------------------------
// ChannelStatus - outcome of a single send() or receive()
// -----------------------------------------------------------------------------
// Returned by value from BoundedChannel. Callers branch on it; nothing is
// thrown for an ordinary timeout or transport fault.
// -----------------------------------------------------------------------------
enum class ChannelStatus {
  Ok,
  TimedOut,
  TransportError,
};

// -----------------------------------------------------------------------------
// ExchangeStatus - outcome of a send-then-receive pair
// -----------------------------------------------------------------------------
enum class ExchangeStatus {
  Ok,
  SendFailedTimeout,
  SendFailedOther,
  ReceiveFailedTimeout,
  ReceiveFailedOther,
};

const char* channelStatusToString(ChannelStatus status);
const char* exchangeStatusToString(ExchangeStatus status);

// -----------------------------------------------------------------------------
// DataError - the data provider could not deliver a trial sample
// -----------------------------------------------------------------------------
//
// @brief  Session-fatal. Thrown by DataAcquisition and propagated out of
//         EnvServer::run().
//
// @details
//   Unreachable - the exchange itself failed (send/receive timeout or
//                 transport fault) or the reply could not be decoded.
//   Timeout     - the provider kept answering "not ready" until the wait
//                 budget was spent.
// -----------------------------------------------------------------------------
class DataError : public std::runtime_error {
 public:
  enum class Kind { Unreachable, Timeout };

  DataError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

// -----------------------------------------------------------------------------
// ProtocolError - the request/reply contract with a peer was broken
// -----------------------------------------------------------------------------
//
// @details
//   MissingAction      - an episode-mode request carried neither ctrl nor
//                        action.
//   UnknownControl     - an episode-mode request carried a ctrl other than
//                        render or done.
//   OutOfOrderExchange - a send/receive was attempted out of the strict
//                        request/reply alternation. Not recoverable by retry.
// -----------------------------------------------------------------------------
class ProtocolError : public std::runtime_error {
 public:
  enum class Kind { MissingAction, UnknownControl, OutOfOrderExchange };

  ProtocolError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

}  // namespace gymbridge
