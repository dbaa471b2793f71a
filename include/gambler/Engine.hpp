#pragma once

#include "EventBus.hpp"
#include "IStrategy.hpp"
#include "IBroker.hpp"
#include "IMarketData.hpp"
#include "PriceHistory.hpp"

#include <memory>
#include <atomic>
#include <string>
#include <cstddef>


namespace gambler {

// Published on topics::kRunStart
struct RunInfo {
    std::string run_id;
    std::string symbol;
    double      starting_value{0.0};
};

// Returned by Engine::run and published on topics::kRunEnd
struct RunStats {
    std::string run_id;
    std::string symbol;
    std::size_t bars{0};
    std::size_t bars_dropped{0};        // out-of-order bars
    std::size_t orders_submitted{0};
    std::size_t orders_completed{0};
    std::size_t orders_failed{0};       // Canceled, Margin or Rejected
    std::size_t requests_refused{0};    // requested while an order was open
    bool        abandoned_order{false}; // an order was still open at the end
    double      starting_value{0.0};
    double      final_value{0.0};
    double      initial_cash{0.0};
    double      pnl{0.0};
    double      pnl_ratio{0.0};         // pnl / initial_cash
    PositionStats position{};           // the run's symbol
};

class Engine {
public:
    explicit Engine(std::string symbol, std::string run_id = {});

    void set_strategy(std::unique_ptr<IStrategy> strat);
    void set_broker(std::unique_ptr<IBroker> brkr);
    void set_market_data(std::unique_ptr<IMarketData> md);

    // Get a reference to the EventBus for external subscribers (e.g., FrontendBridge)
    EventBus& get_bus() { return bus_; }

    const PriceHistory& history() const { return history_; }

    // Zero-based index of the newest bar in the history.
    std::size_t current_bar_index() const { return history_.empty() ? 0 : history_.size() - 1; }

    const std::string& run_id() const { return run_id_; }
    IBroker* broker() { return broker_.get(); }
    IStrategy* strategy() { return strategy_.get(); }

    // Replay the market data through strategy and broker; returns when the feed
    // is exhausted or shutdown was requested. Throws std::runtime_error if a
    // component is missing or run() was already called.
    RunStats run();

    // Request shutdown - safe to call from signal handlers
    void request_shutdown() { shutdown_requested_ = true; }

    // Check if shutdown was requested
    bool is_shutdown_requested() const { return shutdown_requested_; }

private:
    EventBus bus_;
    std::string symbol_;
    std::string run_id_;
    std::unique_ptr<IStrategy>   strategy_;
    std::unique_ptr<IBroker>     broker_;
    std::unique_ptr<IMarketData> market_data_;
    PriceHistory history_;
    RunStats stats_;
    bool ran_{false};
    std::atomic<bool> shutdown_requested_{false};

    void on_bar(const Bar& bar);
    void on_order_status(const OrderStatusEvent& ev);
};

std::string generate_run_id();

}
