#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace gymbridge {

// -----------------------------------------------------------------------------
// SampleConfig - how to cut a narrower sample out of a wider one
// -----------------------------------------------------------------------------
//
// @brief  Parameters for DataSample::sample() (episodes out of a trial) and
//         for the data provider (trials out of the dataset).
//
// @details
// The defaults are the well-known configuration used whenever a reset
// request omits trial_config / episode_config:
//
//   get_new     true   - fetch a fresh trial instead of reusing the cache
//   sample_type 0      - 0 draws from the train section, 1 from test
//   timestamp   none   - if set, start at the first row at/after it
//   b_alpha     1.0    - Beta(b_alpha, b_beta) shapes the start position;
//   b_beta      1.0      (1, 1) is uniform
//   length      0      - rows to take; 0 means the whole section
//
// fromJson() applies "update" semantics: keys present in the object
// override the defaults passed in, everything else is kept.
// -----------------------------------------------------------------------------
struct SampleConfig {
  bool get_new{true};
  int sample_type{0};
  std::optional<std::int64_t> timestamp;
  double b_alpha{1.0};
  double b_beta{1.0};
  std::size_t length{0};

  // Throws std::invalid_argument on sample_type outside {0, 1} or
  // non-positive Beta parameters.
  void validate() const;

  nlohmann::json toJson() const;

  static SampleConfig fromJson(const nlohmann::json& j);
  static SampleConfig fromJson(const nlohmann::json& j, const SampleConfig& defaults);
};

inline SampleConfig SampleConfig::fromJson(const nlohmann::json& j) {
  return fromJson(j, SampleConfig{});
}

}  // namespace gymbridge
