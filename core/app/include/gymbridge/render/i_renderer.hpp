#pragma once

#include "gymbridge/render/step_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gymbridge {

class IBacktestEngine;

// -----------------------------------------------------------------------------
// IRenderer - visualization collaborator of the server
// -----------------------------------------------------------------------------
//
// @brief  Produces a rendering per requested mode. The server forwards the
//         result of render() to the controller unchanged.
//
// @details
// render(modes, step, send):
//   step == nullptr - return the cached rendering for the mode(s)
//   send == false   - refresh the cache only; the return value is unused
// A single requested mode returns its rendering directly; several modes
// return an object keyed by mode.
//
// renderEpisode(engine) is called once after every finished run.
// -----------------------------------------------------------------------------
class IRenderer {
 public:
  virtual ~IRenderer() = default;

  virtual bool enabled() const = 0;
  virtual const std::vector<std::string>& renderModes() const = 0;

  virtual nlohmann::json render(const std::vector<std::string>& modes,
                                const StepSnapshot* step = nullptr,
                                bool send = true) = 0;

  virtual void renderEpisode(const IBacktestEngine& engine) = 0;
};

}  // namespace gymbridge
