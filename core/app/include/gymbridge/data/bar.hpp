#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Bar - one OHLCV row of a data sample
// -----------------------------------------------------------------------------
// Serialized as a compact array [timestamp_ms, open, high, low, close,
// volume] so a trial of a few thousand rows stays a reasonable frame size.
// -----------------------------------------------------------------------------
struct Bar {
  std::int64_t timestamp_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

inline void to_json(nlohmann::json& j, const Bar& b) {
  j = nlohmann::json::array(
      {b.timestamp_ms, b.open, b.high, b.low, b.close, b.volume});
}

inline void from_json(const nlohmann::json& j, Bar& b) {
  b.timestamp_ms = j.at(0).get<std::int64_t>();
  b.open = j.at(1).get<double>();
  b.high = j.at(2).get<double>();
  b.low = j.at(3).get<double>();
  b.close = j.at(4).get<double>();
  b.volume = j.at(5).get<double>();
}

}  // namespace gymbridge
