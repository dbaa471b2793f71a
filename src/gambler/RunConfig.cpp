#include "gambler/RunConfig.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace gambler {

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if constexpr (std::is_integral_v<T>) {
        // nlohmann silently wraps -1 into an unsigned target and truncates 2.5
        if (!it->is_number_integer() ||
            (std::is_unsigned_v<T> && !it->is_number_unsigned())) {
            throw std::invalid_argument(std::string("config key '") + key +
                                        "': expected " +
                                        (std::is_unsigned_v<T> ? "a non-negative integer" : "an integer") +
                                        ", got " + it->dump());
        }
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

bool is_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

double parse_double(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

long long parse_integer(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

std::size_t parse_count(const std::string& flag, const std::string& value) {
    long long v = parse_integer(flag, value);
    if (v < 0) throw std::invalid_argument(flag + " must not be negative");
    return static_cast<std::size_t>(v);
}

} // namespace

RunConfig run_config_from_json(const json& j, RunConfig base) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }
    read_key(j, "data_file", base.data_file);
    read_key(j, "symbol", base.symbol);
    read_key(j, "from", base.from_date);
    read_key(j, "to", base.to_date);
    read_key(j, "cash", base.cash);
    read_key(j, "commission", base.commission);
    read_key(j, "stake", base.stake);
    read_key(j, "decline_bars", base.decline_bars);
    read_key(j, "hold_bars", base.hold_bars);
    read_key(j, "db_path", base.db_path);
    read_key(j, "ws_port", base.ws_port);
    return base;
}

RunConfig load_run_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config '" + path + "': " + e.what());
    }
    std::cout << "[RunConfig] Loaded " << path << "\n";
    return run_config_from_json(j);
}

RunConfig apply_cli_overrides(RunConfig cfg, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            ++i;  // handled by the caller before overrides
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + arg);
        }
        const std::string& value = args[++i];
        if (arg == "--data-file") {
            cfg.data_file = value;
        } else if (arg == "--symbol") {
            cfg.symbol = value;
        } else if (arg == "--from") {
            cfg.from_date = value;
        } else if (arg == "--to") {
            cfg.to_date = value;
        } else if (arg == "--cash") {
            cfg.cash = parse_double(arg, value);
        } else if (arg == "--commission") {
            cfg.commission = parse_double(arg, value);
        } else if (arg == "--stake") {
            cfg.stake = parse_double(arg, value);
        } else if (arg == "--decline-bars") {
            cfg.decline_bars = parse_count(arg, value);
        } else if (arg == "--hold-bars") {
            cfg.hold_bars = parse_count(arg, value);
        } else if (arg == "--db") {
            cfg.db_path = value;
        } else if (arg == "--ws-port") {
            cfg.ws_port = static_cast<int>(parse_integer(arg, value));
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return cfg;
}

void validate(const RunConfig& cfg) {
    if (cfg.data_file.empty()) throw std::invalid_argument("data_file is required");
    if (cfg.symbol.empty()) throw std::invalid_argument("symbol must not be empty");
    if (!(cfg.cash > 0.0)) throw std::invalid_argument("cash must be positive");
    if (cfg.commission < 0.0) throw std::invalid_argument("commission must not be negative");
    if (!(cfg.stake > 0.0)) throw std::invalid_argument("stake must be positive");
    if (cfg.decline_bars < 1) throw std::invalid_argument("decline_bars must be at least 1");
    if (cfg.hold_bars < 1) throw std::invalid_argument("hold_bars must be at least 1");
    if (!cfg.from_date.empty() && !is_date(cfg.from_date)) {
        throw std::invalid_argument("from must be YYYY-MM-DD, got '" + cfg.from_date + "'");
    }
    if (!cfg.to_date.empty() && !is_date(cfg.to_date)) {
        throw std::invalid_argument("to must be YYYY-MM-DD, got '" + cfg.to_date + "'");
    }
    // ISO dates compare correctly as strings
    if (!cfg.from_date.empty() && !cfg.to_date.empty() && cfg.from_date > cfg.to_date) {
        throw std::invalid_argument("from (" + cfg.from_date + ") is after to (" + cfg.to_date + ")");
    }
    if (cfg.ws_port < 0 || cfg.ws_port > 65535) {
        throw std::invalid_argument("ws_port must be in 0..65535");
    }
}

json run_config_to_json(const RunConfig& cfg) {
    return json{
        {"data_file", cfg.data_file},
        {"symbol", cfg.symbol},
        {"from", cfg.from_date},
        {"to", cfg.to_date},
        {"cash", cfg.cash},
        {"commission", cfg.commission},
        {"stake", cfg.stake},
        {"decline_bars", cfg.decline_bars},
        {"hold_bars", cfg.hold_bars},
        {"db_path", cfg.db_path},
        {"ws_port", cfg.ws_port},
    };
}

} // namespace gambler
