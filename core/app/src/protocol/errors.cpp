#include "gymbridge/protocol/errors.hpp"

namespace gymbridge {

const char* channelStatusToString(ChannelStatus status) {
  switch (status) {
    case ChannelStatus::Ok:             return "ok";
    case ChannelStatus::TimedOut:       return "timed_out";
    case ChannelStatus::TransportError: return "transport_error";
  }
  return "unknown";
}

const char* exchangeStatusToString(ExchangeStatus status) {
  switch (status) {
    case ExchangeStatus::Ok:                   return "ok";
    case ExchangeStatus::SendFailedTimeout:    return "send_failed_timeout";
    case ExchangeStatus::SendFailedOther:      return "send_failed_other";
    case ExchangeStatus::ReceiveFailedTimeout: return "receive_failed_timeout";
    case ExchangeStatus::ReceiveFailedOther:   return "receive_failed_other";
  }
  return "unknown";
}

}  // namespace gymbridge
