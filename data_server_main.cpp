// -----------------------------------------------------------------------------
// gymbridge_data_server - data provider entry point
// -----------------------------------------------------------------------------
//
//   gymbridge_data_server [config.json]
//
// Loads the CSV named by DataServerConfig::csv_path and serves trials on the
// configured address until a {ctrl: "stop"} request or Ctrl-C.
//
// Thread layout:
//   main thread → DataServer::run() (ZMQ recv loop, 50 ms poll)
// -----------------------------------------------------------------------------

#include "gymbridge/config/server_config.hpp"
#include "gymbridge/data/data_sample.hpp"
#include "gymbridge/data/data_server.hpp"
#include "gymbridge/log/logger.hpp"
#include "gymbridge/time/live_time_provider.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

// Set once before the handler is installed; lets SIGINT unblock run().
static gymbridge::DataServer* g_server_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_server_ptr != nullptr) {
    g_server_ptr->requestStop();
  }
}

int main(int argc, char** argv) {
  gymbridge::DataServerConfig config;
  try {
    if (argc > 1) {
      config = gymbridge::DataServerConfig::fromJson(
          gymbridge::loadJsonFile(argv[1]));
    } else {
      config.validate();
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  gymbridge::Logger log("DataServer", gymbridge::parseLogLevel(config.log_level));
  gymbridge::LiveTimeProvider clock;

  try {
    auto dataset = gymbridge::loadCsvSample(config.csv_path, config.train_ratio,
                                            config.seed);
    log.info("Loaded " + std::to_string(dataset->size()) + " bars from " +
             config.csv_path);

    gymbridge::DataServerOptions options;
    options.endpoint = config.network_address;
    options.trial_length = config.trial_length;
    options.ready_after_s = config.ready_after_s;

    gymbridge::DataServer server(std::move(dataset), options, log, clock);
    server.bind();

    g_server_ptr = &server;
    std::signal(SIGINT, sigint_handler);

    log.info("Serving data at " + config.network_address);
    server.run();

    g_server_ptr = nullptr;
    log.info("Served " + std::to_string(server.trialsServed()) +
             " trial(s), exiting");
  } catch (const std::exception& e) {
    g_server_ptr = nullptr;
    log.error(std::string("Data server aborted: ") + e.what());
    return 1;
  }

  return 0;
}
