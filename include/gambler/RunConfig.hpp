#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

/*
RunConfig:
  Everything one backtest run needs. Loaded from a JSON file (all keys optional),
  then overridden from the command line, then validated.

  {
    "data_file": "data/orcl-1995-2014.txt",
    "symbol": "ORCL",
    "from": "2000-01-01", "to": "2000-12-31",
    "cash": 100000.0, "commission": 0.0, "stake": 1.0,
    "decline_bars": 2, "hold_bars": 5,
    "db_path": "backtest.db",
    "ws_port": 0
  }
*/

namespace gambler {

using json = nlohmann::json;

struct RunConfig {
    std::string data_file;
    std::string symbol{"ORCL"};
    std::string from_date;          // YYYY-MM-DD, inclusive; empty = unbounded
    std::string to_date;            // YYYY-MM-DD, inclusive; empty = unbounded
    double      cash{100'000.0};
    double      commission{0.0};
    double      stake{1.0};
    std::size_t decline_bars{2};
    std::size_t hold_bars{5};
    std::string db_path;            // empty = do not persist the run
    int         ws_port{0};         // 0 = no frontend bridge
};

// Throws std::invalid_argument on a wrongly typed value.
RunConfig run_config_from_json(const json& j, RunConfig base = {});

// Throws std::runtime_error if the file cannot be read or parsed.
RunConfig load_run_config(const std::string& path);

// Apply "--flag value" pairs. Throws std::invalid_argument on an unknown flag,
// a missing value or a value that does not parse.
RunConfig apply_cli_overrides(RunConfig cfg, const std::vector<std::string>& args);

// Throws std::invalid_argument describing the first problem found.
void validate(const RunConfig& cfg);

json run_config_to_json(const RunConfig& cfg);

} // namespace gambler
