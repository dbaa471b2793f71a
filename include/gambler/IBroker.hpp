#pragma once
#include "gambler/Types.hpp"
#include <string>
#include <cstddef>

/*
the interface in which brokers -- the classes that execute orders and keep the account -- inherit.
Status changes are reported as OrderStatusEvent on the engine's EventBus.
*/

namespace gambler {
class IBroker {
public:
    // Accept a market order issued while `bar` is the current bar.
    // Returns the id assigned to the order.
    virtual OrderId submit_order(const OrderRequest& request, const Bar& bar,
                                 std::size_t bar_index) = 0;

    // A new bar opened: execute working orders submitted on earlier bars.
    virtual void process_bar(const Bar& bar, std::size_t bar_index) = 0;

    // Update position values with the bar's close.
    virtual void mark_to_market(const Bar& bar) = 0;

    // Cancel a working order; false if the id is not working.
    virtual bool cancel_order(OrderId id) = 0;

    virtual std::size_t open_orders() const = 0;
    virtual double get_cash() const = 0;
    // cash + positions valued at their last close
    virtual double get_value() const = 0;
    virtual double get_position(const std::string& symbol) const = 0;
    virtual double get_initial_cash() const = 0;
    // All zero for a symbol never traded or marked.
    virtual PositionStats position_stats(const std::string& symbol) const = 0;

    virtual ~IBroker() = default;
};

} // namespace gambler
