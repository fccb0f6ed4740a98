#pragma once

#include "gymbridge/render/i_renderer.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace gymbridge {

// -----------------------------------------------------------------------------
// SummaryRenderer - JSON renderings of steps and episodes
// -----------------------------------------------------------------------------
//
// @details
// Modes:
//   "human"   - raw state window of the step
//   "agent"   - processed state of the step
//   "episode" - observer summaries and length of the last finished run
//
// Disabled renderer: every render() returns "Rendering disabled".
// Mode not in renderModes(): "<mode> mode not supported".
// A mode that has never been drawn returns null.
// -----------------------------------------------------------------------------
class SummaryRenderer final : public IRenderer {
 public:
  static constexpr const char* kHuman = "human";
  static constexpr const char* kAgent = "agent";
  static constexpr const char* kEpisode = "episode";

  SummaryRenderer(bool enabled, std::vector<std::string> render_modes);

  bool enabled() const override { return enabled_; }
  const std::vector<std::string>& renderModes() const override {
    return modes_;
  }

  nlohmann::json render(const std::vector<std::string>& modes,
                        const StepSnapshot* step = nullptr,
                        bool send = true) override;

  void renderEpisode(const IBacktestEngine& engine) override;

  std::size_t episodesRendered() const { return episodes_rendered_; }

 private:
  bool supports(const std::string& mode) const;
  nlohmann::json renderOne(const std::string& mode, const StepSnapshot* step);

  bool enabled_;
  std::vector<std::string> modes_;
  std::map<std::string, nlohmann::json> cache_;
  std::size_t episodes_rendered_{0};
};

}  // namespace gymbridge
