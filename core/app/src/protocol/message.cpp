#include "gymbridge/protocol/message.hpp"

#include <utility>

namespace gymbridge {

// -----------------------------------------------------------------------------
// parseControlCode()
// -----------------------------------------------------------------------------
ControlCode parseControlCode(const std::string& text) {
  if (text == ctrl::kReset) return ControlCode::Reset;
  if (text == ctrl::kStop) return ControlCode::Stop;
  if (text == ctrl::kGetStat) return ControlCode::GetStat;
  if (text == ctrl::kRender) return ControlCode::Render;
  if (text == ctrl::kGetData) return ControlCode::GetData;
  if (text == ctrl::kDone) return ControlCode::Done;
  if (text == ctrl::kPing) return ControlCode::Ping;
  return ControlCode::Unknown;
}

// -----------------------------------------------------------------------------
// toJson(): only present fields are emitted
// -----------------------------------------------------------------------------
nlohmann::json Message::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  if (ctrl) {
    j["ctrl"] = *ctrl;
  }
  if (action) {
    j["action"] = *action;
  }
  if (!mode.is_null()) {
    j["mode"] = mode;
  }
  if (!kwargs.is_null()) {
    j["kwargs"] = kwargs;
  }
  return j;
}

// -----------------------------------------------------------------------------
// fromJson(): tolerant decode
// -----------------------------------------------------------------------------
// Non-string ctrl/action values are stringified with dump() so that a
// controller sending {"action": 1} still reaches the engine as "1".
// -----------------------------------------------------------------------------
Message Message::fromJson(const nlohmann::json& j) {
  Message m;
  if (!j.is_object()) {
    return m;
  }

  auto as_text = [](const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
  };

  if (auto it = j.find("ctrl"); it != j.end() && !it->is_null()) {
    m.ctrl = as_text(*it);
  }
  if (auto it = j.find("action"); it != j.end() && !it->is_null()) {
    m.action = as_text(*it);
  }
  if (auto it = j.find("mode"); it != j.end()) {
    m.mode = *it;
  }
  if (auto it = j.find("kwargs"); it != j.end()) {
    m.kwargs = *it;
  }
  return m;
}

Message Message::makeControl(const std::string& code,
                             nlohmann::json kwargs) {
  Message m;
  m.ctrl = code;
  m.kwargs = std::move(kwargs);
  return m;
}

Message Message::makeAction(const std::string& action) {
  Message m;
  m.action = action;
  return m;
}

Message Message::makeRender(nlohmann::json mode) {
  Message m;
  m.ctrl = ctrl::kRender;
  m.mode = std::move(mode);
  return m;
}

}  // namespace gymbridge
