#include "brokers/SimulatedBroker.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using gambler::Bar;
using gambler::Order;
using gambler::OrderId;
using gambler::OrderStatus;
using gambler::OrderStatusEvent;
using gambler::Side;

namespace broker {

namespace {

OrderStatusEvent make_event(const Order& order, double filled_qty, double fill_price,
                            double commission, std::string reason) {
    OrderStatusEvent ev;
    ev.id = order.id;
    ev.symbol = order.symbol;
    ev.side = order.side;
    ev.status = order.status;
    ev.filled_qty = filled_qty;
    ev.fill_price = fill_price;
    ev.commission = commission;
    ev.timestamp = order.timestamp;
    ev.reason = std::move(reason);
    return ev;
}

} // namespace

void PositionBook::apply_fill(const Fill& fill) {
    const double value = fill.qty * fill.price;
    if (fill.side == Side::Sell) {
        if (fill.qty > qty) {
            std::ostringstream ss;
            ss << "not enough quantity: holding " << qty << ", selling " << fill.qty;
            throw std::invalid_argument(ss.str());
        }
        qty -= fill.qty;
        qty_sold += fill.qty;
        value_sold += value;
    } else {
        qty += fill.qty;
        qty_bought += fill.qty;
        value_bought += value;
        max_cash = std::max(max_cash, value + fill.commission - last_pnl);
    }
    commission += fill.commission;
    fills.push_back(fill);
    update_pnl();
}

void PositionBook::mark(double close) {
    last_close = close;
    has_close = true;
    update_pnl();
}

void PositionBook::update_pnl() {
    last_pnl = pnl();
    max_pnl = std::max(max_pnl, last_pnl);
    min_pnl = std::min(min_pnl, last_pnl);
    if (max_cash != 0.0) {
        pnl_ratio = last_pnl / max_cash;
    }
}

double PositionBook::avg_price() const {
    const double traded = qty_bought + qty_sold;
    return traded > 0.0 ? (value_bought + value_sold) / traded : 0.0;
}

double PositionBook::pnl() const {
    const double px = has_close ? last_close : avg_price();
    return qty * px + value_sold - value_bought - commission;
}

gambler::PositionStats PositionBook::stats() const {
    gambler::PositionStats out;
    out.pnl = pnl();
    out.pnl_ratio = pnl_ratio;
    out.max_cash = max_cash;
    out.commission = commission;
    // never updated: no extremes to report
    if (max_pnl >= min_pnl) {
        out.max_pnl = max_pnl;
        out.min_pnl = min_pnl;
    }
    return out;
}


SimulatedBroker::SimulatedBroker(BrokerConfig config)
    : config_(config), cash_(config.cash) {}

SimulatedBroker::SimulatedBroker(gambler::EventBus& bus, BrokerConfig config)
    : bus_(&bus), config_(config), cash_(config.cash) {}

SimulatedBroker::~SimulatedBroker() = default;

OrderId SimulatedBroker::generate_order_id() {
    return next_order_id_++;
}

OrderId SimulatedBroker::submit_order(const gambler::OrderRequest& request,
                                      const Bar& bar, std::size_t bar_index) {
    std::vector<OrderStatusEvent> events;
    OrderId id = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        Order order;
        order.id = generate_order_id();
        order.symbol = bar.symbol;
        order.side = request.side;
        order.type = request.type;
        order.qty = request.side == Side::Buy ? config_.stake : 0.0;  // sells size at execution
        order.submitted_bar = bar_index;
        order.timestamp = bar.ts;

        order.status = OrderStatus::Submitted;
        events.push_back(make_event(order, 0.0, 0.0, 0.0, {}));
        order.status = OrderStatus::Accepted;
        events.push_back(make_event(order, 0.0, 0.0, 0.0, {}));

        id = order.id;
        working_.emplace(id, std::move(order));
    }

    std::cout << "[SimulatedBroker] Accepted " << gambler::side_to_string(request.side)
              << " order #" << id << " for " << bar.symbol << "\n";
    publish(events);
    return id;
}

void SimulatedBroker::process_bar(const Bar& bar, std::size_t bar_index) {
    std::vector<OrderStatusEvent> events;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto it = working_.begin(); it != working_.end();) {
            Order& order = it->second;
            if (order.symbol != bar.symbol || order.submitted_bar >= bar_index) {
                ++it;
                continue;
            }
            events.push_back(execute(order, bar));
            it = working_.erase(it);
        }
    }
    publish(events);
}

OrderStatusEvent SimulatedBroker::execute(Order& order, const Bar& bar) {
    const double price = bar.open;
    order.timestamp = bar.ts;
    auto& pb = books_[order.symbol];

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    if (order.side == Side::Buy) {
        const double value = order.qty * price;
        const double commission = value * config_.commission;
        if (value + commission > cash_) {
            order.status = OrderStatus::Margin;
            ss << "[SimulatedBroker] Margin: cannot buy " << order.qty << " " << order.symbol
               << " @ " << price << " with cash=" << cash_;
            std::cout << ss.str() << '\n';
            return make_event(order, 0.0, 0.0, 0.0, "Insufficient cash");
        }
        cash_ -= value + commission;
        pb.apply_fill({order.id, order.symbol, order.side, order.qty, price, commission, bar.ts});
        order.status = OrderStatus::Completed;
        ss << "[SimulatedBroker] Bought " << order.qty << " of " << order.symbol
           << " @ " << price << " -> cash=" << cash_;
        std::cout << ss.str() << '\n';
        return make_event(order, order.qty, price, commission, {});
    }

    // Sell logic: sell entire position at the open
    const double position = pb.qty;
    if (position <= 0.0) {
        order.status = OrderStatus::Rejected;
        std::cout << "[SimulatedBroker] No position to sell for " << order.symbol << "\n";
        return make_event(order, 0.0, 0.0, 0.0, "No position to sell");
    }
    const double value = position * price;
    const double commission = value * config_.commission;
    cash_ += value - commission;
    order.qty = position;
    pb.apply_fill({order.id, order.symbol, order.side, position, price, commission, bar.ts});
    order.status = OrderStatus::Completed;
    ss << "[SimulatedBroker] Sold " << position << " of " << order.symbol
       << " @ " << price << " -> cash=" << cash_;
    std::cout << ss.str() << '\n';
    return make_event(order, position, price, commission, {});
}

void SimulatedBroker::mark_to_market(const Bar& bar) {
    std::lock_guard<std::mutex> lk(mutex_);
    books_[bar.symbol].mark(bar.close);
}

bool SimulatedBroker::cancel_order(OrderId id) {
    std::vector<OrderStatusEvent> events;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = working_.find(id);
        if (it == working_.end()) return false;
        it->second.status = OrderStatus::Canceled;
        events.push_back(make_event(it->second, 0.0, 0.0, 0.0, "Canceled"));
        working_.erase(it);
    }
    std::cout << "[SimulatedBroker] Canceled order #" << id << "\n";
    publish(events);
    return true;
}

std::size_t SimulatedBroker::open_orders() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return working_.size();
}

double SimulatedBroker::get_cash() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cash_;
}

double SimulatedBroker::get_value() const {
    std::lock_guard<std::mutex> lk(mutex_);
    double value = cash_;
    for (const auto& [symbol, pb] : books_) {
        value += pb.qty * (pb.has_close ? pb.last_close : pb.avg_price());
    }
    return value;
}

double SimulatedBroker::get_position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = books_.find(symbol);
    return it == books_.end() ? 0.0 : it->second.qty;
}

gambler::PositionStats SimulatedBroker::position_stats(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = books_.find(symbol);
    return it == books_.end() ? gambler::PositionStats{} : it->second.stats();
}

PositionBook SimulatedBroker::book(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        throw std::out_of_range("SimulatedBroker: no book for " + symbol);
    }
    return it->second;
}

void SimulatedBroker::publish(const std::vector<OrderStatusEvent>& events) const {
    if (!bus_) return;
    for (const auto& ev : events) {
        bus_->publish(gambler::Event{gambler::topics::kOrderStatus, ev});
    }
}

} // namespace broker
