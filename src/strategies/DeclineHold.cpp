#include "strategies/DeclineHold.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using gambler::OrderRequest;
using gambler::OrderStatus;
using gambler::OrderStatusEvent;
using gambler::OrderType;
using gambler::PriceHistory;
using gambler::Side;

namespace strategy {

const char* phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Flat: return "Flat";
        case Phase::EnteringLong: return "EnteringLong";
        case Phase::Long: return "Long";
        case Phase::ExitingLong: return "ExitingLong";
    }
    return "Unknown";
}

bool is_declining(const PriceHistory& history, std::size_t steps) {
    if (steps == 0 || !history.has_lookback(steps)) return false;
    for (std::size_t k = 0; k < steps; ++k) {
        const int newer = -static_cast<int>(k);
        if (!(history.close(newer) < history.close(newer - 1))) return false;
    }
    return true;
}

BarDecision decide_on_bar(DeclineHoldState state,
                          const PriceHistory& history,
                          std::size_t current_bar_index,
                          const DeclineHoldParams& params) {
    BarDecision decision{std::move(state), std::nullopt};
    DeclineHoldState& s = decision.state;

    // an order is in flight: we cannot send a 2nd one
    if (s.pending) return decision;

    switch (s.phase) {
        case Phase::Flat:
            if (is_declining(history, params.decline_bars)) {
                decision.request = OrderRequest{Side::Buy, OrderType::Market};
                s.pending = PendingOrder{0, Side::Buy};
                s.phase = Phase::EnteringLong;
            }
            break;
        case Phase::Long:
            // entry <= current, so the difference cannot wrap
            if (current_bar_index >= s.position.entry_bar_index &&
                current_bar_index - s.position.entry_bar_index >= params.hold_bars) {
                decision.request = OrderRequest{Side::Sell, OrderType::Market};
                s.pending = PendingOrder{0, Side::Sell};
                s.phase = Phase::ExitingLong;
            }
            break;
        case Phase::EnteringLong:
        case Phase::ExitingLong:
            break;
    }
    return decision;
}

DeclineHoldState apply_order_update(DeclineHoldState state,
                                    const OrderStatusEvent& ev,
                                    std::size_t current_bar_index) {
    if (!state.pending) return state;

    PendingOrder& pending = *state.pending;
    if (pending.side != ev.side) return state;
    if (pending.id != 0 && pending.id != ev.id) return state;

    if (!gambler::is_terminal(ev.status)) {
        // Submitted/Accepted: informational, but tells us the broker id
        if (pending.id == 0) pending.id = ev.id;
        return state;
    }

    if (ev.status == OrderStatus::Completed) {
        if (ev.side == Side::Buy) {
            state.position.quantity = ev.filled_qty;
            state.position.entry_bar_index = current_bar_index;
            state.phase = Phase::Long;
        } else {
            state.position = Position{};
            state.phase = Phase::Flat;
        }
    } else {
        // Canceled/Margin/Rejected: back to where we were, no retry
        state.phase = (state.phase == Phase::EnteringLong) ? Phase::Flat : Phase::Long;
    }
    state.pending.reset();
    return state;
}


DeclineHoldStrategy::DeclineHoldStrategy(std::string symbol, DeclineHoldParams params)
  : symbol_(std::move(symbol)), params_(params) {
    if (params_.decline_bars == 0) {
        throw std::invalid_argument("DeclineHoldStrategy: decline_bars must be at least 1");
    }
    if (params_.hold_bars == 0) {
        throw std::invalid_argument("DeclineHoldStrategy: hold_bars must be at least 1");
    }
}

std::optional<OrderRequest> DeclineHoldStrategy::on_bar(const PriceHistory& history,
                                                         std::size_t current_bar_index) {
    if (history.empty()) return std::nullopt;
    const auto& bar = history.current();
    if (bar.symbol != symbol_) return std::nullopt;
    last_bar_time_ = bar.ts;

#ifdef GAMBLER_DEBUG
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << "Close, " << bar.close;
        log(ss.str());
    }
#endif

    auto decision = decide_on_bar(std::move(state_), history, current_bar_index, params_);
    state_ = std::move(decision.state);

    if (decision.request) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2)
           << (decision.request->side == Side::Buy ? "BUY CREATE, " : "SELL CREATE, ")
           << bar.close;
        log(ss.str());
    }
    return decision.request;
}

void DeclineHoldStrategy::on_order_update(const OrderStatusEvent& ev,
                                          std::size_t current_bar_index) {
    if (ev.symbol != symbol_) return;
    const Phase before = state_.phase;
    state_ = apply_order_update(std::move(state_), ev, current_bar_index);

    if (state_.phase == before) return;
    last_bar_time_ = ev.timestamp;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (ev.status == OrderStatus::Completed) {
        ss << (ev.side == Side::Buy ? "BUY EXECUTED, " : "SELL EXECUTED, ") << ev.fill_price;
    } else {
        ss << "Order " << gambler::order_status_to_string(ev.status);
        if (!ev.reason.empty()) ss << " (" << ev.reason << ")";
    }
    log(ss.str());
}

void DeclineHoldStrategy::log(const std::string& txt) const {
    std::cout << "[DeclineHold] " << gambler::format_date(last_bar_time_) << ", " << txt << "\n";
}

} // namespace strategy
