#include "gambler/RunConfig.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

using gambler::RunConfig;

TEST(RunConfigTest, DefaultsWhenKeysAbsent) {
    RunConfig cfg = gambler::run_config_from_json(gambler::json::object());
    EXPECT_EQ(cfg.symbol, "ORCL");
    EXPECT_DOUBLE_EQ(cfg.cash, 100000.0);
    EXPECT_DOUBLE_EQ(cfg.commission, 0.0);
    EXPECT_DOUBLE_EQ(cfg.stake, 1.0);
    EXPECT_EQ(cfg.decline_bars, 2u);
    EXPECT_EQ(cfg.hold_bars, 5u);
    EXPECT_TRUE(cfg.db_path.empty());
    EXPECT_EQ(cfg.ws_port, 0);
}

TEST(RunConfigTest, ReadsKeysAndIgnoresUnknown) {
    auto j = gambler::json::parse(R"({
        "data_file": "orcl.csv", "symbol": "MSFT", "from": "2000-01-01", "to": "2000-12-31",
        "cash": 5000, "commission": 0.001, "stake": 10, "decline_bars": 3, "hold_bars": 7,
        "db_path": "runs.db", "ws_port": 3000, "colour": "blue"
    })");
    RunConfig cfg = gambler::run_config_from_json(j);
    EXPECT_EQ(cfg.data_file, "orcl.csv");
    EXPECT_EQ(cfg.symbol, "MSFT");
    EXPECT_EQ(cfg.from_date, "2000-01-01");
    EXPECT_EQ(cfg.to_date, "2000-12-31");
    EXPECT_DOUBLE_EQ(cfg.cash, 5000.0);
    EXPECT_DOUBLE_EQ(cfg.commission, 0.001);
    EXPECT_DOUBLE_EQ(cfg.stake, 10.0);
    EXPECT_EQ(cfg.decline_bars, 3u);
    EXPECT_EQ(cfg.hold_bars, 7u);
    EXPECT_EQ(cfg.db_path, "runs.db");
    EXPECT_EQ(cfg.ws_port, 3000);
    EXPECT_NO_THROW(gambler::validate(cfg));
}

TEST(RunConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"cash": "lots"})")),
                 std::invalid_argument);
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"symbol": 42})")),
                 std::invalid_argument);
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::array()), std::invalid_argument);
}

TEST(RunConfigTest, BarCountsMustBeNonNegativeIntegers) {
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"hold_bars": -1})")),
                 std::invalid_argument);
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"decline_bars": -2})")),
                 std::invalid_argument);
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"hold_bars": 2.5})")),
                 std::invalid_argument);
    EXPECT_THROW(gambler::run_config_from_json(gambler::json::parse(R"({"ws_port": 80.5})")),
                 std::invalid_argument);

    RunConfig cfg = gambler::run_config_from_json(
        gambler::json::parse(R"({"hold_bars": 18446744073709551615, "ws_port": -1})"));
    EXPECT_EQ(cfg.hold_bars, std::numeric_limits<std::size_t>::max());
    EXPECT_EQ(cfg.ws_port, -1);
    cfg.data_file = "orcl.csv";
    EXPECT_THROW(gambler::validate(cfg), std::invalid_argument);    // port out of range
}

TEST(RunConfigTest, CliOverridesConfig) {
    RunConfig base;
    base.data_file = "from-file.csv";
    base.cash = 1.0;
    RunConfig cfg = gambler::apply_cli_overrides(base, {
        "--config", "ignored.json", "--cash", "2500.5", "--symbol", "IBM",
        "--hold-bars", "3", "--ws-port", "8080", "--from", "2001-01-01"});
    EXPECT_EQ(cfg.data_file, "from-file.csv");
    EXPECT_DOUBLE_EQ(cfg.cash, 2500.5);
    EXPECT_EQ(cfg.symbol, "IBM");
    EXPECT_EQ(cfg.hold_bars, 3u);
    EXPECT_EQ(cfg.ws_port, 8080);
    EXPECT_EQ(cfg.from_date, "2001-01-01");
}

TEST(RunConfigTest, BadCliArguments) {
    RunConfig base;
    EXPECT_THROW(gambler::apply_cli_overrides(base, {"--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(gambler::apply_cli_overrides(base, {"--cash"}), std::invalid_argument);
    EXPECT_THROW(gambler::apply_cli_overrides(base, {"--cash", "12x"}), std::invalid_argument);
    EXPECT_THROW(gambler::apply_cli_overrides(base, {"--hold-bars", "-1"}), std::invalid_argument);
    EXPECT_THROW(gambler::apply_cli_overrides(base, {"--hold-bars", "2.5"}), std::invalid_argument);
}

TEST(RunConfigTest, Validation) {
    RunConfig ok;
    ok.data_file = "orcl.csv";
    EXPECT_NO_THROW(gambler::validate(ok));

    auto expect_invalid = [&ok](auto mutate) {
        RunConfig cfg = ok;
        mutate(cfg);
        EXPECT_THROW(gambler::validate(cfg), std::invalid_argument);
    };
    expect_invalid([](RunConfig& c) { c.data_file.clear(); });
    expect_invalid([](RunConfig& c) { c.cash = 0.0; });
    expect_invalid([](RunConfig& c) { c.commission = -0.1; });
    expect_invalid([](RunConfig& c) { c.stake = 0.0; });
    expect_invalid([](RunConfig& c) { c.decline_bars = 0; });
    expect_invalid([](RunConfig& c) { c.hold_bars = 0; });
    expect_invalid([](RunConfig& c) { c.from_date = "2000/01/01"; });
    expect_invalid([](RunConfig& c) { c.from_date = "2001-01-01"; c.to_date = "2000-01-01"; });
    expect_invalid([](RunConfig& c) { c.ws_port = 70000; });
}

TEST(RunConfigTest, LoadFromFile) {
    const auto path = (std::filesystem::temp_directory_path() / "gambler_run_config.json").string();
    {
        std::ofstream out(path);
        out << R"({"data_file": "x.csv", "stake": 3})";
    }
    RunConfig cfg = gambler::load_run_config(path);
    EXPECT_EQ(cfg.data_file, "x.csv");
    EXPECT_DOUBLE_EQ(cfg.stake, 3.0);

    {
        std::ofstream out(path);
        out << "{not json";
    }
    EXPECT_THROW(gambler::load_run_config(path), std::runtime_error);
    std::remove(path.c_str());

    EXPECT_THROW(gambler::load_run_config(path), std::runtime_error);
}

TEST(RunConfigTest, ToJsonRoundTripsThroughLoader) {
    RunConfig cfg;
    cfg.data_file = "orcl.csv";
    cfg.hold_bars = 9;
    RunConfig back = gambler::run_config_from_json(gambler::run_config_to_json(cfg));
    EXPECT_EQ(back.data_file, "orcl.csv");
    EXPECT_EQ(back.hold_bars, 9u);
}
