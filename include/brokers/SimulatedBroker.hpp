#pragma once
#include "gambler/IBroker.hpp"
#include "gambler/EventBus.hpp"
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace broker {

struct BrokerConfig {
    double cash{100'000.0};
    double commission{0.0};     // fraction of traded value, e.g. 0.001
    double stake{1.0};          // units bought per buy order
};

struct Fill {
    gambler::OrderId   order_id{0};
    std::string        symbol;
    gambler::Side      side{gambler::Side::Buy};
    double             qty{0.0};
    double             price{0.0};
    double             commission{0.0};
    gambler::TimePoint ts{};
};

// Per-symbol bookkeeping. PnL statistics are refreshed on every fill and mark.
struct PositionBook {
    double qty{0.0};
    double qty_bought{0.0};
    double qty_sold{0.0};
    double value_bought{0.0};
    double value_sold{0.0};
    double commission{0.0};
    double last_close{0.0};
    bool   has_close{false};
    std::vector<Fill> fills;

    double last_pnl{0.0};
    double max_pnl{std::numeric_limits<double>::lowest()};
    double min_pnl{std::numeric_limits<double>::max()};
    double max_cash{0.0};       // most cash tied up in the position at once
    double pnl_ratio{0.0};      // last_pnl / max_cash

    // Throws std::invalid_argument when a sell exceeds the held quantity.
    void apply_fill(const Fill& fill);
    void mark(double close);

    double avg_price() const;
    double pnl() const;
    gambler::PositionStats stats() const;

private:
    void update_pnl();
};

// Fills market orders at the open of the bar after submission.
// Buys of `stake` units fail with Margin when cash does not cover them;
// sells close the whole position and fail with Rejected when flat.
class SimulatedBroker : public gambler::IBroker {
public:
    explicit SimulatedBroker(BrokerConfig config = {});
    SimulatedBroker(gambler::EventBus& bus, BrokerConfig config = {});
    ~SimulatedBroker() override;

    gambler::OrderId submit_order(const gambler::OrderRequest& request,
                                  const gambler::Bar& bar,
                                  std::size_t bar_index) override;
    void process_bar(const gambler::Bar& bar, std::size_t bar_index) override;
    void mark_to_market(const gambler::Bar& bar) override;
    bool cancel_order(gambler::OrderId id) override;

    std::size_t open_orders() const override;
    double get_cash() const override;
    double get_value() const override;
    double get_position(const std::string& symbol) const override;
    double get_initial_cash() const override { return config_.cash; }
    gambler::PositionStats position_stats(const std::string& symbol) const override;

    const BrokerConfig& config() const { return config_; }
    // Throws std::out_of_range for a symbol never traded or marked.
    PositionBook book(const std::string& symbol) const;

private:
    gambler::EventBus* bus_{nullptr};
    BrokerConfig config_;
    double cash_;
    gambler::OrderId next_order_id_{1};
    std::map<gambler::OrderId, gambler::Order> working_;   // ordered by id = submission order
    std::unordered_map<std::string, PositionBook> books_;
    mutable std::mutex mutex_;

    // must hold mutex_
    gambler::OrderId generate_order_id();
    gambler::OrderStatusEvent execute(gambler::Order& order, const gambler::Bar& bar);

    // called without mutex_ so handlers may query the broker
    void publish(const std::vector<gambler::OrderStatusEvent>& events) const;
};

} // namespace broker
