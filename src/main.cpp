#include "adapters/CsvFileReplayAdapter.hpp"
#include "brokers/SimulatedBroker.hpp"
#include "gambler/Engine.hpp"
#include "gambler/RunConfig.hpp"
#include "gambler/RunRecorder.hpp"
#include "gambler/RunStore.hpp"
#include "strategies/DeclineHold.hpp"
#include "server/FrontendBridge.hpp"
#include <memory>
#include <vector>
#include <iostream>
#include <iomanip>
#include <csignal>
#include <stdexcept>
#include <string>

static gambler::Engine* g_engine = nullptr;

void signal_handler(int) {
  if (g_engine) {
    g_engine->request_shutdown();
  }
}

static void print_usage() {
  std::cout << "Usage: backgambler [--config <file.json>] --data-file <csv[.gz]>\n"
            << "                   [--symbol <sym>] [--from YYYY-MM-DD] [--to YYYY-MM-DD]\n"
            << "                   [--cash <n>] [--commission <ratio>] [--stake <n>]\n"
            << "                   [--decline-bars <n>] [--hold-bars <n>]\n"
            << "                   [--db <path>] [--ws-port <port>]\n";
}

static int run(const std::vector<std::string>& args) {
  // 1. configuration: JSON file first, flags on top
  gambler::RunConfig cfg;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "--config") {
      cfg = gambler::load_run_config(args[i + 1]);
    }
  }
  cfg = gambler::apply_cli_overrides(cfg, args);
  gambler::validate(cfg);

  // 2. engine first, so the broker can publish on its bus
  auto engine = std::make_unique<gambler::Engine>(cfg.symbol);
  g_engine = engine.get();

  broker::BrokerConfig broker_cfg;
  broker_cfg.cash = cfg.cash;
  broker_cfg.commission = cfg.commission;
  broker_cfg.stake = cfg.stake;
  auto brkr = std::make_unique<broker::SimulatedBroker>(engine->get_bus(), broker_cfg);

  // 3. market data from the CSV file
  adapter::CsvFileReplayAdapter::Options feed_opts;
  feed_opts.symbol = cfg.symbol;
  feed_opts.from_date = cfg.from_date;
  feed_opts.to_date = cfg.to_date;
  auto feed = std::make_unique<adapter::CsvFileReplayAdapter>(cfg.data_file, feed_opts);
  std::cout << "[Main] Using data file: " << cfg.data_file << "\n";

  // 4. strategy
  strategy::DeclineHoldParams params;
  params.decline_bars = cfg.decline_bars;
  params.hold_bars = cfg.hold_bars;
  auto strat = std::make_unique<strategy::DeclineHoldStrategy>(cfg.symbol, params);

  engine->set_broker(std::move(brkr));
  engine->set_market_data(std::move(feed));
  engine->set_strategy(std::move(strat));

  // 5. optional persistence
  std::shared_ptr<gambler::RunStore> store;
  std::unique_ptr<gambler::RunRecorder> recorder;
  if (!cfg.db_path.empty()) {
    gambler::RunStoreConfig store_cfg;
    store_cfg.db_path = cfg.db_path;
    store = std::make_shared<gambler::RunStore>(store_cfg);
    recorder = std::make_unique<gambler::RunRecorder>(engine->get_bus(), store,
                                                      gambler::run_config_to_json(cfg));
    recorder->start();
  }

  // 6. optional frontend bridge
  std::unique_ptr<server::FrontendBridge> bridge;
  if (cfg.ws_port > 0) {
    bridge = std::make_unique<server::FrontendBridge>(engine->get_bus(), cfg.ws_port);
    bridge->start();
  }

  // Set up signal handlers for clean shutdown
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::cout << "[Main] Starting backtest...\n";
  gambler::RunStats stats = engine->run();

  // portfolio values are logged by the engine
  std::cout << std::fixed << std::setprecision(2)
            << "[Main] PnL " << stats.pnl << " (" << stats.pnl_ratio * 100.0
            << "% of initial cash " << stats.initial_cash << ")\n"
            << "[Main] " << cfg.symbol << " max PnL " << stats.position.max_pnl
            << ", min PnL " << stats.position.min_pnl
            << ", max cash " << stats.position.max_cash
            << ", commission paid " << stats.position.commission << "\n";

  // 7. shut down cleanly
  if (bridge) bridge->stop();
  if (recorder) recorder->stop();
  g_engine = nullptr;

  std::cout << "[Main] Cleanup complete. Exiting.\n";
  return 0;
}

int main(int argc, char* argv[]) {

#ifdef GAMBLER_DEBUG
  std::cout << "debug is on! let's go\n";
#endif

  std::vector<std::string> args(argv + 1, argv + argc);
  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
  }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "[Main] Error: " << e.what() << "\n";
    print_usage();
    return 1;
  }
}
