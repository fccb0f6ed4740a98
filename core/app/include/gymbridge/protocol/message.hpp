#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Control vocabulary
// -----------------------------------------------------------------------------
namespace ctrl {
inline constexpr const char* kReset = "reset";
inline constexpr const char* kStop = "stop";
inline constexpr const char* kGetStat = "getstat";
inline constexpr const char* kRender = "render";
inline constexpr const char* kGetData = "get_data";
inline constexpr const char* kDone = "done";
inline constexpr const char* kPing = "ping";
}  // namespace ctrl

enum class ControlCode {
  Reset,
  Stop,
  GetStat,
  Render,
  GetData,
  Done,
  Ping,
  Unknown,
};

ControlCode parseControlCode(const std::string& text);

// -----------------------------------------------------------------------------
// Message - one request frame on either channel
// -----------------------------------------------------------------------------
//
// @brief  Tagged mapping with optional fields, decoded from / encoded to a
//         JSON object.
//
// @details
// Wire form (all keys optional):
//   {
//     "ctrl":   "reset",                 // control vocabulary above
//     "action": "buy",                   // agent action when ctrl is absent
//     "mode":   "human" | ["human", ...] // render target(s), ctrl=render only
//     "kwargs": { ... }                  // reset / get_data configuration
//   }
//
// A frame that is not a JSON object decodes to a Message with every field
// absent; the control loop treats it the same as a request with no ctrl.
// Replies are not Messages: they are arbitrary JSON values (strings, result
// objects, the [state, reward, done, info] step tuple).
// -----------------------------------------------------------------------------
struct Message {
  std::optional<std::string> ctrl;
  std::optional<std::string> action;
  nlohmann::json mode;     // null when absent
  nlohmann::json kwargs;   // null when absent

  bool hasCtrl() const { return ctrl.has_value(); }
  bool hasAction() const { return action.has_value(); }
  bool hasMode() const { return !mode.is_null(); }

  ControlCode controlCode() const {
    return ctrl ? parseControlCode(*ctrl) : ControlCode::Unknown;
  }

  nlohmann::json toJson() const;
  static Message fromJson(const nlohmann::json& j);

  static Message makeControl(const std::string& code,
                             nlohmann::json kwargs = nullptr);
  static Message makeAction(const std::string& action);
  static Message makeRender(nlohmann::json mode);
};

// -----------------------------------------------------------------------------
// Data provider reply status
// -----------------------------------------------------------------------------
// The provider answers get_data / ping with {"status": "ready" | "not_ready"}.
// -----------------------------------------------------------------------------
namespace data_status {
inline constexpr const char* kReady = "ready";
inline constexpr const char* kNotReady = "not_ready";
inline constexpr const char* kError = "error";
}  // namespace data_status

inline constexpr const char* kNotReadyMarker = "Dataset not ready";

}  // namespace gymbridge
