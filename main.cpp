// -----------------------------------------------------------------------------
// gymbridge_env_server - environment server entry point
// -----------------------------------------------------------------------------
//
//   gymbridge_env_server [config.json]
//
//   1) Load ServerConfig (defaults when no path is given).
//   2) Build the template engine: BarBacktestEngine with the "trades"
//      analyzer. Every episode runs on a clone of it.
//   3) Build the renderer from the render section.
//   4) EnvServer::run() blocks on the controller channel until "stop".
//
// Exit status: 0 after "stop", 1 on a configuration or fatal session error.
// Fatal errors are logged under the session's task tag.
//
// Thread layout:
//   main thread → EnvServer::run() (controller loop, episodes, data requests)
// -----------------------------------------------------------------------------

#include "gymbridge/config/server_config.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/protocol/errors.hpp"
#include "gymbridge/render/summary_renderer.hpp"
#include "gymbridge/server/env_server.hpp"
#include "gymbridge/sim/bar_backtest_engine.hpp"
#include "gymbridge/sim/trade_stats_analyzer.hpp"
#include "gymbridge/time/live_time_provider.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
  gymbridge::ServerConfig config;
  try {
    if (argc > 1) {
      config = gymbridge::ServerConfig::fromJson(
          gymbridge::loadJsonFile(argv[1]));
    } else {
      config.validate();
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  gymbridge::Logger log("EnvServer_" + std::to_string(config.task),
                        gymbridge::parseLogLevel(config.log_level));
  gymbridge::LiveTimeProvider clock;

  try {
    auto engine = std::make_unique<gymbridge::BarBacktestEngine>(config.engine);
    engine->addAnalyzer("trades",
                        std::make_unique<gymbridge::TradeStatsAnalyzer>());

    auto renderer = std::make_unique<gymbridge::SummaryRenderer>(
        config.render.enabled, config.render.render_modes);

    gymbridge::EnvServer server(config, std::move(engine), std::move(renderer),
                                log, clock);
    server.run();
  } catch (const gymbridge::DataError& e) {
    log.error(std::string("Data provider failure: ") + e.what());
    return 1;
  } catch (const gymbridge::ProtocolError& e) {
    log.error(std::string("Controller protocol violation: ") + e.what());
    return 1;
  } catch (const std::exception& e) {
    log.error(std::string("Session aborted: ") + e.what());
    return 1;
  }

  return 0;
}
