#pragma once

#include "gymbridge/sim/engine_params.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gymbridge {

// -----------------------------------------------------------------------------
// RenderConfig
// -----------------------------------------------------------------------------
struct RenderConfig {
  bool enabled{false};
  std::vector<std::string> render_modes{"human", "agent", "episode"};
};

// -----------------------------------------------------------------------------
// ServerConfig - everything the environment server process is started with
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct with defaults, optionally overlaid from a JSON
//         document or file.
//
// @details
// Keys mirror the member names. Missing keys keep their default; unknown
// keys are ignored. Timeouts are seconds on the wire and converted to
// milliseconds for the channels.
//
// Example:
//   {
//     "network_address": "tcp://127.0.0.1:5500",
//     "data_network_address": "tcp://127.0.0.1:4999",
//     "connect_timeout_s": 60,
//     "log_level": "info",
//     "render": {"enabled": true, "render_modes": ["human", "episode"]},
//     "engine": {"state_window": 10, "skip_frame": 1}
//   }
//
// Thread model:
//   Copied into EnvServer at construction; never shared.
// -----------------------------------------------------------------------------
struct ServerConfig {
  std::string network_address{"tcp://127.0.0.1:5500"};
  std::string data_network_address{"tcp://127.0.0.1:4999"};

  /// Send timeout of the controller channel, both timeouts of the data
  /// channel.
  double connect_timeout_s{60.0};
  /// Budget for waiting on a not-ready data provider.
  double wait_for_data_reset_s{300.0};
  /// Upper bound of one back-off pause.
  double max_backoff_s{2.0};

  /// Session id; tags the log name.
  int task{0};
  std::string log_level{"warning"};

  /// Reply with every info record of a skip-frame batch instead of the last.
  bool send_full_info{false};

  /// Send {ctrl: stop} to the data provider when the session ends.
  bool stop_data_on_exit{true};

  RenderConfig render;
  EngineParams engine;

  int connectTimeoutMs() const;

  // Throws std::invalid_argument on empty addresses, non-positive timeouts,
  // a negative back-off, an unknown log level or invalid engine params.
  void validate() const;

  nlohmann::json toJson() const;
  static ServerConfig fromJson(const nlohmann::json& j);
};

// -----------------------------------------------------------------------------
// DataServerConfig - the gymbridge_data_server process
// -----------------------------------------------------------------------------
struct DataServerConfig {
  std::string network_address{"tcp://127.0.0.1:4999"};
  std::string csv_path{"data/sample_bars.csv"};
  /// Rows per trial; 0 serves the whole train or test section.
  std::size_t trial_length{0};
  double train_ratio{1.0};
  /// Seconds after start during which get_data answers not_ready.
  double ready_after_s{0.0};
  std::uint64_t seed{0};
  std::string log_level{"info"};

  void validate() const;

  static DataServerConfig fromJson(const nlohmann::json& j);
};

// Reads and parses a JSON file. Throws std::runtime_error when the file
// cannot be opened and nlohmann::json::parse_error on malformed content.
nlohmann::json loadJsonFile(const std::string& path);

}  // namespace gymbridge
