#include "strategies/DeclineHold.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <random>
#include <vector>

using gambler::Bar;
using gambler::OrderStatus;
using gambler::OrderStatusEvent;
using gambler::PriceHistory;
using gambler::Side;
using namespace strategy;

namespace {

Bar make_bar(std::size_t day, double close) {
    Bar b;
    b.symbol = "ORCL";
    b.ts = gambler::TimePoint(std::chrono::hours(24 * (10957 + day)));   // from 2000-01-01
    b.open = close;
    b.high = close;
    b.low = close;
    b.close = close;
    b.volume = 1000.0;
    return b;
}

PriceHistory history_of(const std::vector<double>& closes) {
    PriceHistory h;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        h.append(make_bar(i, closes[i]));
    }
    return h;
}

OrderStatusEvent status_event(gambler::OrderId id, Side side, OrderStatus status,
                              double qty = 0.0, double price = 0.0) {
    OrderStatusEvent ev;
    ev.id = id;
    ev.symbol = "ORCL";
    ev.side = side;
    ev.status = status;
    ev.filled_qty = qty;
    ev.fill_price = price;
    return ev;
}

// Drives a strategy bar by bar the way the engine does: fills and failures
// for orders placed on the previous bar are delivered before on_bar.
class Driver {
public:
    explicit Driver(DeclineHoldStrategy& strat) : strat_(strat) {}

    // `fail_with` decides the terminal status of the next order; Completed by default.
    // With `resolve` false an open order stays Accepted through this bar.
    std::optional<gambler::OrderRequest> step(double close,
                                              OrderStatus fail_with = OrderStatus::Completed,
                                              bool resolve = true) {
        history_.append(make_bar(history_.size(), close));
        const std::size_t idx = history_.size() - 1;

        if (open_ && resolve) {
            const double qty = open_->side == Side::Buy ? 1.0 : held_;
            auto ev = status_event(open_id_, open_->side, fail_with,
                                   fail_with == OrderStatus::Completed ? qty : 0.0, close);
            if (fail_with == OrderStatus::Completed) {
                held_ = open_->side == Side::Buy ? 1.0 : 0.0;
            }
            open_.reset();
            strat_.on_order_update(ev, idx);
        }

        auto request = strat_.on_bar(history_, idx);
        if (request) {
            open_ = *request;
            ++next_id_;
            open_id_ = next_id_;
            strat_.on_order_update(status_event(open_id_, request->side, OrderStatus::Submitted), idx);
            strat_.on_order_update(status_event(open_id_, request->side, OrderStatus::Accepted), idx);
        }
        return request;
    }

private:
    DeclineHoldStrategy& strat_;
    PriceHistory history_;
    std::optional<gambler::OrderRequest> open_;
    gambler::OrderId open_id_{0};
    gambler::OrderId next_id_{0};
    double held_{0.0};
};

} // namespace

TEST(DeclineHoldTest, IsDecliningNeedsStrictlyLowerCloses) {
    EXPECT_TRUE(is_declining(history_of({10, 9, 8}), 2));
    EXPECT_FALSE(is_declining(history_of({10, 9, 9}), 2));
    EXPECT_FALSE(is_declining(history_of({10, 10, 9}), 2));
    EXPECT_FALSE(is_declining(history_of({8, 9, 10}), 2));
}

TEST(DeclineHoldTest, IsDecliningNeedsEnoughHistory) {
    EXPECT_FALSE(is_declining(history_of({}), 2));
    EXPECT_FALSE(is_declining(history_of({10}), 2));
    EXPECT_FALSE(is_declining(history_of({10, 9}), 2));
    EXPECT_TRUE(is_declining(history_of({10, 9}), 1));
    EXPECT_FALSE(is_declining(history_of({10, 9}), 0));
}

TEST(DeclineHoldTest, FlatBuysOnTwoLowerCloses) {
    auto h = history_of({10, 9, 8});
    auto decision = decide_on_bar(DeclineHoldState{}, h, 2, DeclineHoldParams{});

    ASSERT_TRUE(decision.request.has_value());
    EXPECT_EQ(decision.request->side, Side::Buy);
    EXPECT_EQ(decision.request->type, gambler::OrderType::Market);
    EXPECT_EQ(decision.state.phase, Phase::EnteringLong);
    ASSERT_TRUE(decision.state.pending.has_value());
    EXPECT_EQ(decision.state.pending->side, Side::Buy);
    EXPECT_EQ(decision.state.position.quantity, 0.0);
}

TEST(DeclineHoldTest, EqualClosesDoNotCountAsDecline) {
    auto h = history_of({10, 10, 9});
    auto decision = decide_on_bar(DeclineHoldState{}, h, 2, DeclineHoldParams{});
    EXPECT_FALSE(decision.request.has_value());
    EXPECT_EQ(decision.state.phase, Phase::Flat);
}

TEST(DeclineHoldTest, NothingHappensWhilePending) {
    DeclineHoldState state;
    state.phase = Phase::EnteringLong;
    state.pending = PendingOrder{7, Side::Buy};

    auto h = history_of({10, 9, 8, 7});
    auto decision = decide_on_bar(state, h, 3, DeclineHoldParams{});
    EXPECT_FALSE(decision.request.has_value());
    EXPECT_EQ(decision.state.phase, Phase::EnteringLong);
    EXPECT_EQ(decision.state.pending->id, 7u);
}

TEST(DeclineHoldTest, LongSellsAfterHoldBars) {
    DeclineHoldState state;
    state.phase = Phase::Long;
    state.position = Position{1.0, 3};

    auto h = history_of({10, 9, 8, 7, 8, 9, 10, 11, 12});
    DeclineHoldParams params;

    // entry 3, hold 5: bars 4..7 keep holding
    for (std::size_t idx = 4; idx < 8; ++idx) {
        auto decision = decide_on_bar(state, h, idx, params);
        EXPECT_FALSE(decision.request.has_value()) << "bar " << idx;
        EXPECT_EQ(decision.state.phase, Phase::Long);
    }

    auto decision = decide_on_bar(state, h, 8, params);
    ASSERT_TRUE(decision.request.has_value());
    EXPECT_EQ(decision.request->side, Side::Sell);
    EXPECT_EQ(decision.state.phase, Phase::ExitingLong);
    EXPECT_EQ(decision.state.position.quantity, 1.0);
}

TEST(DeclineHoldTest, LongDoesNotBuyAgainOnDecline) {
    DeclineHoldState state;
    state.phase = Phase::Long;
    state.position = Position{1.0, 2};

    auto h = history_of({10, 9, 8, 7, 6});
    auto decision = decide_on_bar(state, h, 4, DeclineHoldParams{});
    EXPECT_FALSE(decision.request.has_value());
    EXPECT_EQ(decision.state.phase, Phase::Long);
}

TEST(DeclineHoldTest, BuyCompletedEntersLong) {
    DeclineHoldState state;
    state.phase = Phase::EnteringLong;
    state.pending = PendingOrder{0, Side::Buy};

    state = apply_order_update(state, status_event(1, Side::Buy, OrderStatus::Submitted), 2);
    state = apply_order_update(state, status_event(1, Side::Buy, OrderStatus::Accepted), 2);
    EXPECT_EQ(state.phase, Phase::EnteringLong);
    ASSERT_TRUE(state.pending.has_value());
    EXPECT_EQ(state.pending->id, 1u);

    state = apply_order_update(state, status_event(1, Side::Buy, OrderStatus::Completed, 1.0, 7.5), 3);
    EXPECT_EQ(state.phase, Phase::Long);
    EXPECT_FALSE(state.pending.has_value());
    EXPECT_EQ(state.position.quantity, 1.0);
    EXPECT_EQ(state.position.entry_bar_index, 3u);
}

TEST(DeclineHoldTest, SellCompletedGoesFlat) {
    DeclineHoldState state;
    state.phase = Phase::ExitingLong;
    state.position = Position{1.0, 3};
    state.pending = PendingOrder{2, Side::Sell};

    state = apply_order_update(state, status_event(2, Side::Sell, OrderStatus::Completed, 1.0, 12.0), 9);
    EXPECT_EQ(state.phase, Phase::Flat);
    EXPECT_FALSE(state.pending.has_value());
    EXPECT_EQ(state.position.quantity, 0.0);
}

TEST(DeclineHoldTest, FailedBuyReturnsToFlat) {
    for (auto status : {OrderStatus::Canceled, OrderStatus::Margin, OrderStatus::Rejected}) {
        DeclineHoldState state;
        state.phase = Phase::EnteringLong;
        state.pending = PendingOrder{4, Side::Buy};

        state = apply_order_update(state, status_event(4, Side::Buy, status), 3);
        EXPECT_EQ(state.phase, Phase::Flat) << gambler::order_status_to_string(status);
        EXPECT_FALSE(state.pending.has_value());
        EXPECT_EQ(state.position.quantity, 0.0);
    }
}

TEST(DeclineHoldTest, FailedSellKeepsPosition) {
    for (auto status : {OrderStatus::Canceled, OrderStatus::Margin, OrderStatus::Rejected}) {
        DeclineHoldState state;
        state.phase = Phase::ExitingLong;
        state.position = Position{1.0, 3};
        state.pending = PendingOrder{5, Side::Sell};

        state = apply_order_update(state, status_event(5, Side::Sell, status), 9);
        EXPECT_EQ(state.phase, Phase::Long) << gambler::order_status_to_string(status);
        EXPECT_FALSE(state.pending.has_value());
        EXPECT_EQ(state.position.quantity, 1.0);
        EXPECT_EQ(state.position.entry_bar_index, 3u);
    }
}

TEST(DeclineHoldTest, RepeatedTerminalStatusIsIgnored) {
    DeclineHoldState state;
    state.phase = Phase::EnteringLong;
    state.pending = PendingOrder{4, Side::Buy};

    state = apply_order_update(state, status_event(4, Side::Buy, OrderStatus::Rejected), 3);
    auto again = apply_order_update(state, status_event(4, Side::Buy, OrderStatus::Rejected), 3);
    EXPECT_EQ(again.phase, Phase::Flat);
    EXPECT_FALSE(again.pending.has_value());

    again = apply_order_update(state, status_event(4, Side::Buy, OrderStatus::Canceled), 4);
    EXPECT_EQ(again.phase, Phase::Flat);
}

TEST(DeclineHoldTest, UpdatesForOtherOrdersAreIgnored) {
    DeclineHoldState state;
    state.phase = Phase::EnteringLong;
    state.pending = PendingOrder{4, Side::Buy};

    // stale id
    auto next = apply_order_update(state, status_event(3, Side::Buy, OrderStatus::Completed, 1.0, 5.0), 3);
    EXPECT_EQ(next.phase, Phase::EnteringLong);
    EXPECT_EQ(next.position.quantity, 0.0);

    // wrong side
    next = apply_order_update(state, status_event(4, Side::Sell, OrderStatus::Completed, 1.0, 5.0), 3);
    EXPECT_EQ(next.phase, Phase::EnteringLong);

    // nothing pending
    DeclineHoldState flat;
    next = apply_order_update(flat, status_event(4, Side::Buy, OrderStatus::Completed, 1.0, 5.0), 3);
    EXPECT_EQ(next.phase, Phase::Flat);
    EXPECT_EQ(next.position.quantity, 0.0);
}

TEST(DeclineHoldTest, HugeHoldNeverSells) {
    DeclineHoldState state;
    state.phase = Phase::Long;
    state.position = Position{1.0, 3};

    auto h = history_of({10, 9, 8, 7, 8, 9, 10});
    DeclineHoldParams params{2, std::numeric_limits<std::size_t>::max()};
    for (std::size_t idx = 3; idx < 7; ++idx) {
        auto decision = decide_on_bar(state, h, idx, params);
        EXPECT_FALSE(decision.request.has_value()) << "bar " << idx;
        EXPECT_EQ(decision.state.phase, Phase::Long);
    }

    // largest representable bar index still waits for the full hold
    params.hold_bars = std::numeric_limits<std::size_t>::max() - 2;
    auto decision = decide_on_bar(state, h, std::numeric_limits<std::size_t>::max() - 1, params);
    EXPECT_FALSE(decision.request.has_value());
    decision = decide_on_bar(state, h, std::numeric_limits<std::size_t>::max(), params);
    EXPECT_FALSE(decision.request.has_value());
    params.hold_bars = std::numeric_limits<std::size_t>::max() - 3;
    decision = decide_on_bar(state, h, std::numeric_limits<std::size_t>::max(), params);
    EXPECT_TRUE(decision.request.has_value());
}

TEST(DeclineHoldTest, ExitingLongCannotSellAgain) {
    DeclineHoldState state;
    state.phase = Phase::ExitingLong;
    state.position = Position{1.0, 0};
    state.pending = PendingOrder{9, Side::Sell};

    auto h = history_of({10, 9, 8, 7, 6, 5, 4, 3});
    auto decision = decide_on_bar(state, h, 7, DeclineHoldParams{});
    EXPECT_FALSE(decision.request.has_value());
    EXPECT_EQ(decision.state.phase, Phase::ExitingLong);
}

TEST(DeclineHoldTest, NoSecondOrderWhileBuyIsOpen) {
    DeclineHoldStrategy strat("ORCL");
    Driver drive(strat);

    drive.step(10);
    drive.step(9);
    ASSERT_TRUE(drive.step(8));                      // bar 2: buy, stays Accepted

    // closes keep falling, yet no further buy while the first is open
    for (double close : {7.0, 6.0, 5.0, 4.0}) {
        EXPECT_FALSE(drive.step(close, OrderStatus::Completed, false)) << "close " << close;
        EXPECT_EQ(strat.state().phase, Phase::EnteringLong);
        EXPECT_TRUE(strat.has_pending_order());
        EXPECT_EQ(strat.get_net_position(), 0.0);
    }

    EXPECT_FALSE(drive.step(3.0));                   // bar 7: fills, entry recorded here
    EXPECT_EQ(strat.state().phase, Phase::Long);
    EXPECT_EQ(strat.state().position.entry_bar_index, 7u);
}

TEST(DeclineHoldTest, NoSecondOrderWhileSellIsOpen) {
    DeclineHoldStrategy strat("ORCL");
    Driver drive(strat);

    drive.step(10);
    drive.step(9);
    drive.step(8);                                   // bar 2: buy
    drive.step(7);                                   // bar 3: filled, entry 3
    for (int i = 0; i < 4; ++i) drive.step(8 + i);   // bars 4..7
    ASSERT_TRUE(drive.step(12));                     // bar 8: sell, stays Accepted

    // hold is long over and closes decline, still nothing new is issued
    for (double close : {11.0, 10.0, 9.0, 8.0}) {
        EXPECT_FALSE(drive.step(close, OrderStatus::Completed, false)) << "close " << close;
        EXPECT_EQ(strat.state().phase, Phase::ExitingLong);
        EXPECT_EQ(strat.get_net_position(), 1.0);
    }

    drive.step(9.0);                                 // sell fills, no decline into this bar
    EXPECT_EQ(strat.state().phase, Phase::Flat);
    EXPECT_FALSE(strat.has_pending_order());
}

TEST(DeclineHoldTest, FillOnSameBarEntersThereAndSellsFiveBarsLater) {
    DeclineHoldStrategy strat("ORCL");
    const std::vector<double> closes{10, 9, 8, 7, 8, 9, 10, 11, 12};
    PriceHistory h;

    std::vector<std::size_t> sells;
    for (std::size_t idx = 0; idx < closes.size(); ++idx) {
        h.append(make_bar(idx, closes[idx]));
        auto request = strat.on_bar(h, idx);
        if (!request) continue;
        if (request->side == Side::Buy) {
            EXPECT_EQ(idx, 2u);
            strat.on_order_update(status_event(1, Side::Buy, OrderStatus::Submitted), idx);
            strat.on_order_update(status_event(1, Side::Buy, OrderStatus::Completed, 1.0, closes[idx]), idx);
            EXPECT_EQ(strat.state().phase, Phase::Long);
            EXPECT_EQ(strat.state().position.entry_bar_index, 2u);
        } else {
            sells.push_back(idx);
        }
    }
    EXPECT_EQ(sells, (std::vector<std::size_t>{7}));
    EXPECT_EQ(strat.state().phase, Phase::ExitingLong);
}

TEST(DeclineHoldTest, StrategyRejectsZeroParams) {
    EXPECT_THROW(DeclineHoldStrategy("ORCL", DeclineHoldParams{0, 5}), std::invalid_argument);
    EXPECT_THROW(DeclineHoldStrategy("ORCL", DeclineHoldParams{2, 0}), std::invalid_argument);
    EXPECT_NO_THROW(DeclineHoldStrategy("ORCL", DeclineHoldParams{1, 1}));
}

TEST(DeclineHoldTest, StrategyIgnoresOtherSymbols) {
    DeclineHoldStrategy strat("MSFT");
    auto h = history_of({10, 9, 8});
    EXPECT_FALSE(strat.on_bar(h, 2).has_value());
    EXPECT_EQ(strat.state().phase, Phase::Flat);
}

TEST(DeclineHoldTest, FullRoundTrip) {
    DeclineHoldStrategy strat("ORCL");
    Driver drive(strat);

    EXPECT_FALSE(drive.step(10));                    // bar 0
    EXPECT_FALSE(drive.step(9));                     // bar 1
    auto buy = drive.step(8);                        // bar 2: two lower closes
    ASSERT_TRUE(buy);
    EXPECT_EQ(buy->side, Side::Buy);
    EXPECT_TRUE(strat.has_pending_order());

    // bar 3: buy fills at the open, still declining but already long
    EXPECT_FALSE(drive.step(7));
    EXPECT_EQ(strat.state().phase, Phase::Long);
    EXPECT_EQ(strat.state().position.entry_bar_index, 3u);
    EXPECT_EQ(strat.get_net_position(), 1.0);

    for (int i = 0; i < 4; ++i) {                    // bars 4..7
        EXPECT_FALSE(drive.step(8 + i));
    }
    auto sell = drive.step(12);                      // bar 8 = entry + 5
    ASSERT_TRUE(sell);
    EXPECT_EQ(sell->side, Side::Sell);
    EXPECT_EQ(strat.state().phase, Phase::ExitingLong);

    EXPECT_FALSE(drive.step(13));                    // bar 9: sell fills
    EXPECT_EQ(strat.state().phase, Phase::Flat);
    EXPECT_EQ(strat.get_net_position(), 0.0);
    EXPECT_FALSE(strat.has_pending_order());
}

TEST(DeclineHoldTest, MarginThenBuysAgain) {
    DeclineHoldStrategy strat("ORCL");
    Driver drive(strat);

    drive.step(10);
    drive.step(9);
    ASSERT_TRUE(drive.step(8));                      // bar 2: buy

    // bar 3: Margin, back to Flat, closes keep falling so it buys again
    auto again = drive.step(7, OrderStatus::Margin);
    EXPECT_EQ(strat.get_net_position(), 0.0);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->side, Side::Buy);
    EXPECT_EQ(strat.state().phase, Phase::EnteringLong);
}

TEST(DeclineHoldTest, MarginWithoutDeclineStaysFlat) {
    DeclineHoldStrategy strat("ORCL");
    Driver drive(strat);

    drive.step(10);
    drive.step(9);
    ASSERT_TRUE(drive.step(8));
    EXPECT_FALSE(drive.step(9, OrderStatus::Margin));
    EXPECT_EQ(strat.state().phase, Phase::Flat);
    EXPECT_FALSE(strat.has_pending_order());
}

TEST(DeclineHoldTest, RandomWalkKeepsStateConsistent) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> move(-1.0, 1.0);
    std::uniform_int_distribution<int> outcome(0, 9);

    DeclineHoldStrategy strat("ORCL", DeclineHoldParams{2, 3});
    Driver drive(strat);
    double close = 100.0;

    for (int i = 0; i < 2000; ++i) {
        close += move(rng);
        const int roll = outcome(rng);
        const OrderStatus result = roll == 0 ? OrderStatus::Margin
                                 : roll == 1 ? OrderStatus::Rejected
                                 : OrderStatus::Completed;
        auto request = drive.step(close, result);

        const auto& s = strat.state();
        switch (s.phase) {
            case Phase::Flat:
                EXPECT_EQ(s.position.quantity, 0.0);
                EXPECT_FALSE(s.pending.has_value());
                break;
            case Phase::Long:
                EXPECT_GT(s.position.quantity, 0.0);
                EXPECT_FALSE(s.pending.has_value());
                break;
            case Phase::EnteringLong:
                EXPECT_EQ(s.position.quantity, 0.0);
                ASSERT_TRUE(s.pending.has_value());
                EXPECT_EQ(s.pending->side, Side::Buy);
                break;
            case Phase::ExitingLong:
                EXPECT_GT(s.position.quantity, 0.0);
                ASSERT_TRUE(s.pending.has_value());
                EXPECT_EQ(s.pending->side, Side::Sell);
                break;
        }
        // a request always leaves exactly one order pending
        if (request) {
            EXPECT_TRUE(strat.has_pending_order());
        }
    }
}
