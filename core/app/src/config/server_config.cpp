#include "gymbridge/config/server_config.hpp"
#include "gymbridge/log/logger.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace gymbridge {

// -----------------------------------------------------------------------------
// ServerConfig
// -----------------------------------------------------------------------------
int ServerConfig::connectTimeoutMs() const {
  return static_cast<int>(std::lround(connect_timeout_s * 1000.0));
}

void ServerConfig::validate() const {
  if (network_address.empty() || data_network_address.empty()) {
    throw std::invalid_argument("ServerConfig: addresses must not be empty");
  }
  if (network_address == data_network_address) {
    throw std::invalid_argument(
        "ServerConfig: controller and data addresses must differ");
  }
  if (!(connect_timeout_s > 0.0) || connectTimeoutMs() <= 0) {
    throw std::invalid_argument("ServerConfig: connect_timeout_s must be > 0");
  }
  if (wait_for_data_reset_s < 0.0) {
    throw std::invalid_argument(
        "ServerConfig: wait_for_data_reset_s must be >= 0");
  }
  if (!(max_backoff_s > 0.0)) {
    throw std::invalid_argument("ServerConfig: max_backoff_s must be > 0");
  }
  parseLogLevel(log_level);
  engine.validate();
}

nlohmann::json ServerConfig::toJson() const {
  nlohmann::json j;
  j["network_address"] = network_address;
  j["data_network_address"] = data_network_address;
  j["connect_timeout_s"] = connect_timeout_s;
  j["wait_for_data_reset_s"] = wait_for_data_reset_s;
  j["max_backoff_s"] = max_backoff_s;
  j["task"] = task;
  j["log_level"] = log_level;
  j["send_full_info"] = send_full_info;
  j["stop_data_on_exit"] = stop_data_on_exit;
  j["render"] = {{"enabled", render.enabled},
                 {"render_modes", render.render_modes}};
  j["engine"] = engine.toJson();
  return j;
}

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
  ServerConfig c;
  if (!j.is_object()) {
    throw std::invalid_argument("ServerConfig: expected a JSON object");
  }
  c.network_address = j.value("network_address", c.network_address);
  c.data_network_address =
      j.value("data_network_address", c.data_network_address);
  c.connect_timeout_s = j.value("connect_timeout_s", c.connect_timeout_s);
  c.wait_for_data_reset_s =
      j.value("wait_for_data_reset_s", c.wait_for_data_reset_s);
  c.max_backoff_s = j.value("max_backoff_s", c.max_backoff_s);
  c.task = j.value("task", c.task);
  c.log_level = j.value("log_level", c.log_level);
  c.send_full_info = j.value("send_full_info", c.send_full_info);
  c.stop_data_on_exit = j.value("stop_data_on_exit", c.stop_data_on_exit);

  auto render = j.find("render");
  if (render != j.end() && render->is_object()) {
    c.render.enabled = render->value("enabled", c.render.enabled);
    c.render.render_modes =
        render->value("render_modes", c.render.render_modes);
  }

  auto engine = j.find("engine");
  if (engine != j.end()) {
    c.engine = EngineParams::fromJson(*engine, c.engine);
  }

  c.validate();
  return c;
}

// -----------------------------------------------------------------------------
// DataServerConfig
// -----------------------------------------------------------------------------
void DataServerConfig::validate() const {
  if (network_address.empty()) {
    throw std::invalid_argument("DataServerConfig: empty network_address");
  }
  if (csv_path.empty()) {
    throw std::invalid_argument("DataServerConfig: empty csv_path");
  }
  if (!(train_ratio > 0.0 && train_ratio <= 1.0)) {
    throw std::invalid_argument(
        "DataServerConfig: train_ratio must be in (0, 1]");
  }
  if (ready_after_s < 0.0) {
    throw std::invalid_argument("DataServerConfig: ready_after_s must be >= 0");
  }
  parseLogLevel(log_level);
}

DataServerConfig DataServerConfig::fromJson(const nlohmann::json& j) {
  DataServerConfig c;
  if (!j.is_object()) {
    throw std::invalid_argument("DataServerConfig: expected a JSON object");
  }
  c.network_address = j.value("network_address", c.network_address);
  c.csv_path = j.value("csv_path", c.csv_path);
  c.trial_length = j.value("trial_length", c.trial_length);
  c.train_ratio = j.value("train_ratio", c.train_ratio);
  c.ready_after_s = j.value("ready_after_s", c.ready_after_s);
  c.seed = j.value("seed", c.seed);
  c.log_level = j.value("log_level", c.log_level);
  c.validate();
  return c;
}

nlohmann::json loadJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  return nlohmann::json::parse(in);
}

}  // namespace gymbridge
