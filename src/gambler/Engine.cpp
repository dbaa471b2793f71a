/*
 * The core Engine class, responsible for tying together the strategy, the broker,
 * the market data feed and the event bus for one backtest run.
 */

#include "gambler/Engine.hpp"
#include "gambler/Types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gambler {

std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t_now), "%Y%m%d_%H%M%S")
        << '_' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

Engine::Engine(std::string symbol, std::string run_id)
    : symbol_(std::move(symbol)),
      run_id_(run_id.empty() ? generate_run_id() : std::move(run_id)) {}

void Engine::set_strategy(std::unique_ptr<IStrategy> strat) {
    strategy_ = std::move(strat);
}

// The broker must publish its order updates on this engine's bus.
void Engine::set_broker(std::unique_ptr<IBroker> brkr) {
    broker_ = std::move(brkr);
}

void Engine::set_market_data(std::unique_ptr<IMarketData> md) {
    market_data_ = std::move(md);

    // Tell the feed which symbol to emit, and wire its callback to publish on the bus
    market_data_->subscribe_bars(symbol_, [this](const Bar& b) {
        Event ev{ topics::kBar, b };
        bus_.publish(ev);
    });
}

RunStats Engine::run() {

    if (!strategy_ || !broker_ || !market_data_) {
        throw std::runtime_error("[Engine] Missing strategy, broker, or market data stream.");
    }
    if (ran_) {
        throw std::runtime_error("[Engine] run() may only be called once per engine");
    }
    ran_ = true;

    stats_ = RunStats{};
    stats_.run_id = run_id_;
    stats_.symbol = symbol_;
    stats_.starting_value = broker_->get_value();

    std::cout << std::fixed << std::setprecision(2)
              << "[Engine] Run " << run_id_ << " on " << symbol_
              << ", starting portfolio value: " << stats_.starting_value << "\n";

    bus_.publish(Event{ topics::kRunStart, RunInfo{run_id_, symbol_, stats_.starting_value} });

    // Order updates first reach the strategy through the bus, like everything else.
    auto status_sub = bus_.subscribe(topics::kOrderStatus, [this](const Event& ev) {
        try {
            on_order_status(std::any_cast<OrderStatusEvent>(ev.data));
        } catch (const std::bad_any_cast&) {
            std::cerr << "[Engine] bad_any_cast when handling OrderStatus\n";
        }
    });

    auto bar_sub = bus_.subscribe(topics::kBar, [this](const Event& ev) {
        try {
            on_bar(std::any_cast<Bar>(ev.data));
        } catch (const std::bad_any_cast&) {
            std::cerr << "[Engine] bad_any_cast when handling Bar\n";
        }
    });

    market_data_->start();
    const std::size_t replayed = market_data_->replay();
    market_data_->stop();

    bus_.unsubscribe(topics::kBar, bar_sub);
    bus_.unsubscribe(topics::kOrderStatus, status_sub);

    if (shutdown_requested_) {
        std::cout << "[Engine] Shutdown requested - stopped run early.\n";
    }

    // No cancellation is sent for an order that never completed.
    if (broker_->open_orders() > 0 || strategy_->has_pending_order()) {
        stats_.abandoned_order = true;
        std::cout << "[Engine] Abandoning pending order at end of data\n";
    }

    stats_.final_value = broker_->get_value();
    stats_.initial_cash = broker_->get_initial_cash();
    stats_.position = broker_->position_stats(symbol_);
    stats_.pnl = stats_.position.pnl;
    if (stats_.initial_cash != 0.0) {
        stats_.pnl_ratio = stats_.pnl / stats_.initial_cash;
    }
    std::cout << std::fixed << std::setprecision(2)
              << "[Engine] Replayed " << replayed << " bars (" << stats_.bars << " processed, "
              << stats_.bars_dropped << " dropped), " << stats_.orders_submitted
              << " orders submitted, " << stats_.orders_completed << " completed, "
              << stats_.orders_failed << " failed\n"
              << "[Engine] Final portfolio value: " << stats_.final_value << "\n";

    bus_.publish(Event{ topics::kRunEnd, stats_ });
    return stats_;
}

void Engine::on_bar(const Bar& bar) {
    if (shutdown_requested_) {
        market_data_->stop();
        return;
    }

    try {
        history_.append(bar);
    } catch (const std::invalid_argument& e) {
        ++stats_.bars_dropped;
        std::cerr << "[Engine] Dropping bar: " << e.what() << "\n";
        return;
    }
    ++stats_.bars;
    const std::size_t index = current_bar_index();
    bus_.publish(Event{ topics::kBarAccepted, bar });

    // Fills happen at the open, so the strategy hears about them before deciding.
    broker_->process_bar(bar, index);

    auto request = strategy_->on_bar(history_, index);
    if (request) {
        if (broker_->open_orders() > 0) {
            ++stats_.requests_refused;
            std::cerr << "[Engine] Refusing " << side_to_string(request->side)
                      << " request: an order is already open\n";
            OrderStatusEvent refused;
            refused.symbol = bar.symbol;
            refused.side = request->side;
            refused.status = OrderStatus::Rejected;
            refused.timestamp = bar.ts;
            refused.reason = "Another order is still open";
            bus_.publish(Event{ topics::kOrderStatus, refused });
        } else {
            broker_->submit_order(*request, bar, index);
            ++stats_.orders_submitted;
        }
    }

    broker_->mark_to_market(bar);

#ifdef GAMBLER_DEBUG
    std::cout << "[debug] [Engine] bar " << index << " " << format_date(bar.ts)
              << " close=" << bar.close << " value=" << broker_->get_value() << "\n";
#endif
}

void Engine::on_order_status(const OrderStatusEvent& ev) {
    if (ev.status == OrderStatus::Completed) {
        ++stats_.orders_completed;
    } else if (is_terminal(ev.status) && ev.id != 0) {
        ++stats_.orders_failed;
    }
    strategy_->on_order_update(ev, current_bar_index());
}

} // namespace gambler
