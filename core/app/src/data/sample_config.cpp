#include "gymbridge/data/sample_config.hpp"

#include <stdexcept>
#include <string>

namespace gymbridge {

void SampleConfig::validate() const {
  if (sample_type != 0 && sample_type != 1) {
    throw std::invalid_argument(
        "SampleConfig: sample_type must be 0 or 1, got " +
        std::to_string(sample_type));
  }
  if (!(b_alpha > 0.0) || !(b_beta > 0.0)) {
    throw std::invalid_argument(
        "SampleConfig: b_alpha and b_beta must be positive");
  }
}

nlohmann::json SampleConfig::toJson() const {
  nlohmann::json j;
  j["get_new"] = get_new;
  j["sample_type"] = sample_type;
  j["timestamp"] = timestamp ? nlohmann::json(*timestamp) : nlohmann::json();
  j["b_alpha"] = b_alpha;
  j["b_beta"] = b_beta;
  j["length"] = length;
  return j;
}

// -----------------------------------------------------------------------------
// fromJson(): overlay present keys onto the defaults
// -----------------------------------------------------------------------------
SampleConfig SampleConfig::fromJson(const nlohmann::json& j,
                                    const SampleConfig& defaults) {
  SampleConfig config = defaults;
  if (!j.is_object()) {
    return config;
  }

  if (j.contains("get_new")) config.get_new = j.at("get_new").get<bool>();
  if (j.contains("sample_type")) {
    config.sample_type = j.at("sample_type").get<int>();
  }
  if (j.contains("timestamp")) {
    const auto& ts = j.at("timestamp");
    if (ts.is_null()) {
      config.timestamp.reset();
    } else {
      config.timestamp = ts.get<std::int64_t>();
    }
  }
  if (j.contains("b_alpha")) config.b_alpha = j.at("b_alpha").get<double>();
  if (j.contains("b_beta")) config.b_beta = j.at("b_beta").get<double>();
  if (j.contains("length")) config.length = j.at("length").get<std::size_t>();

  config.validate();
  return config;
}

}  // namespace gymbridge
