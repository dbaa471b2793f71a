// order types shared by the engine, brokers and strategies

#pragma once
#include "gambler/MarketDataTypes.hpp"
#include <string>
#include <cstdint>

namespace gambler {

using OrderId = std::uint64_t;

enum class Side {
    Buy,
    Sell
};

enum class OrderType {
    Market
};

enum class OrderStatus {
    Submitted,
    Accepted,
    Completed,
    Canceled,
    Margin,
    Rejected
};

inline const char* side_to_string(Side side) {
    return side == Side::Buy ? "Buy" : "Sell";
}

// Convert OrderStatus to string for logging/serialization
inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Submitted: return "Submitted";
        case OrderStatus::Accepted: return "Accepted";
        case OrderStatus::Completed: return "Completed";
        case OrderStatus::Canceled: return "Canceled";
        case OrderStatus::Margin: return "Margin";
        case OrderStatus::Rejected: return "Rejected";
    }
    return "Unknown";
}

// After a terminal status the order is no longer pending.
inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::Completed || status == OrderStatus::Canceled ||
           status == OrderStatus::Margin || status == OrderStatus::Rejected;
}

// What a strategy asks the engine for. Quantity is the broker's business.
struct OrderRequest {
    Side      side{Side::Buy};
    OrderType type{OrderType::Market};
};

// What the broker reports back about an order.
struct OrderStatusEvent {
    OrderId     id{0};
    std::string symbol;
    Side        side{Side::Buy};
    OrderStatus status{OrderStatus::Submitted};
    double      filled_qty{0.0};
    double      fill_price{0.0};
    double      commission{0.0};
    TimePoint   timestamp{};            // bar time, not wall-clock
    std::string reason{};               // populated for Margin/Rejected/Canceled
};

// Running PnL figures of one position.
struct PositionStats {
    double pnl{0.0};
    double pnl_ratio{0.0};          // pnl / max_cash
    double max_pnl{0.0};
    double min_pnl{0.0};
    double max_cash{0.0};
    double commission{0.0};
};

// Broker-side record of a working order.
struct Order {
    OrderId     id{0};
    std::string symbol;
    double      qty{0.0};
    Side        side{Side::Buy};
    OrderType   type{OrderType::Market};
    OrderStatus status{OrderStatus::Submitted};
    std::size_t submitted_bar{0};       // engine bar index at submission
    TimePoint   timestamp{};
};

} // namespace gambler
