#pragma once
#include "gambler/Types.hpp"
#include "gambler/PriceHistory.hpp"
#include <optional>
#include <cstddef>

namespace gambler {

class IStrategy {
public:
    // Called once per bar, after every order update produced by that bar.
    // Returns the order to submit, if any.
    virtual std::optional<OrderRequest> on_bar(const PriceHistory& history,
                                               std::size_t current_bar_index) = 0;

    // Called for every status change of an order the strategy asked for.
    virtual void on_order_update(const OrderStatusEvent& ev,
                                 std::size_t current_bar_index) = 0;

    // Get current net position held by the strategy
    virtual double get_net_position() const { return 0.0; }

    // True while an order the strategy issued has not reached a terminal status
    virtual bool has_pending_order() const { return false; }

    virtual ~IStrategy() = default;
};

}
