#include "gymbridge/render/summary_renderer.hpp"
#include "gymbridge/sim/i_backtest_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gymbridge {

SummaryRenderer::SummaryRenderer(bool enabled,
                                 std::vector<std::string> render_modes)
    : enabled_(enabled), modes_(std::move(render_modes)) {
  for (const auto& mode : modes_) {
    if (mode != kHuman && mode != kAgent && mode != kEpisode) {
      throw std::invalid_argument("SummaryRenderer: unknown render mode " +
                                  mode);
    }
  }
}

bool SummaryRenderer::supports(const std::string& mode) const {
  return std::find(modes_.begin(), modes_.end(), mode) != modes_.end();
}

nlohmann::json SummaryRenderer::renderOne(const std::string& mode,
                                          const StepSnapshot* step) {
  if (!supports(mode)) {
    return mode + " mode not supported";
  }
  if (step != nullptr && mode != kEpisode) {
    nlohmann::json out;
    out["mode"] = mode;
    out["state"] = mode == kHuman ? step->raw_state : step->state;
    out["reward"] = step->reward;
    out["done"] = step->done;
    out["info"] = step->info;
    cache_[mode] = std::move(out);
  }
  auto it = cache_.find(mode);
  return it != cache_.end() ? it->second : nlohmann::json(nullptr);
}

// -----------------------------------------------------------------------------
// render()
// -----------------------------------------------------------------------------
nlohmann::json SummaryRenderer::render(const std::vector<std::string>& modes,
                                       const StepSnapshot* step, bool send) {
  if (!enabled_) {
    return "Rendering disabled";
  }

  nlohmann::json out = nlohmann::json::object();
  for (const auto& mode : modes) {
    out[mode] = renderOne(mode, step);
  }

  if (!send) {
    return nullptr;
  }
  if (modes.size() == 1) {
    return out[modes.front()];
  }
  return out;
}

void SummaryRenderer::renderEpisode(const IBacktestEngine& engine) {
  if (!enabled_ || !supports(kEpisode)) {
    return;
  }
  nlohmann::json out;
  out["mode"] = kEpisode;
  out["length"] = engine.length();
  out["observers"] = engine.observerSummary();
  cache_[kEpisode] = std::move(out);
  ++episodes_rendered_;
}

}  // namespace gymbridge
