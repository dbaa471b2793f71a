#pragma once
#include "gambler/IStrategy.hpp"
#include "gambler/Types.hpp"
#include <optional>
#include <string>
#include <cstddef>

namespace strategy {

// Buy after `decline_bars` consecutive lower closes, sell `hold_bars` bars
// after the buy filled. At most one order is in flight at any time.
//
//   Flat --buy--> EnteringLong --Completed--> Long --sell--> ExitingLong --Completed--> Flat
//   EnteringLong --Canceled/Margin/Rejected--> Flat
//   ExitingLong  --Canceled/Margin/Rejected--> Long
enum class Phase {
    Flat,
    EnteringLong,
    Long,
    ExitingLong
};

const char* phase_to_string(Phase phase);

struct Position {
    double      quantity{0.0};          // 0 = flat, > 0 = long
    std::size_t entry_bar_index{0};     // meaningful only while quantity > 0
};

struct PendingOrder {
    gambler::OrderId id{0};             // 0 until the broker reports it
    gambler::Side    side{gambler::Side::Buy};
};

struct DeclineHoldParams {
    std::size_t decline_bars{2};
    std::size_t hold_bars{5};
};

struct DeclineHoldState {
    Phase                       phase{Phase::Flat};
    Position                    position{};
    std::optional<PendingOrder> pending{};
};

struct BarDecision {
    DeclineHoldState                    state;
    std::optional<gambler::OrderRequest> request;
};

// close[0] < close[-1] < ... < close[-steps]. False when history is too short.
bool is_declining(const gambler::PriceHistory& history, std::size_t steps);

BarDecision decide_on_bar(DeclineHoldState state,
                          const gambler::PriceHistory& history,
                          std::size_t current_bar_index,
                          const DeclineHoldParams& params);

DeclineHoldState apply_order_update(DeclineHoldState state,
                                    const gambler::OrderStatusEvent& ev,
                                    std::size_t current_bar_index);


class DeclineHoldStrategy : public gambler::IStrategy {
public:
    // Throws std::invalid_argument if decline_bars or hold_bars is zero.
    explicit DeclineHoldStrategy(std::string symbol, DeclineHoldParams params = {});

    std::optional<gambler::OrderRequest> on_bar(const gambler::PriceHistory& history,
                                                std::size_t current_bar_index) override;

    void on_order_update(const gambler::OrderStatusEvent& ev,
                         std::size_t current_bar_index) override;

    double get_net_position() const override { return state_.position.quantity; }
    bool has_pending_order() const override { return state_.pending.has_value(); }

    const DeclineHoldState& state() const { return state_; }
    const DeclineHoldParams& params() const { return params_; }

private:
    std::string       symbol_;
    DeclineHoldParams params_;
    DeclineHoldState  state_{};
    gambler::TimePoint last_bar_time_{};

    void log(const std::string& txt) const;
};

} // namespace strategy
