#include "gambler/JsonCodec.hpp"
#include <stdexcept>

namespace gambler {

void to_json(json& j, const Bar& bar) {
    j = json{
        {"symbol", bar.symbol},
        {"time", format_iso8601(bar.ts)},
        {"ms", to_epoch_ms(bar.ts)},
        {"open", bar.open},
        {"high", bar.high},
        {"low", bar.low},
        {"close", bar.close},
        {"volume", bar.volume},
    };
}

void from_json(const json& j, Bar& bar) {
    bar.symbol = j.value("symbol", std::string{});
    bar.ts = from_epoch_ms(j.at("ms").get<long long>());
    bar.open = j.at("open").get<double>();
    bar.high = j.at("high").get<double>();
    bar.low = j.at("low").get<double>();
    bar.close = j.at("close").get<double>();
    bar.volume = j.value("volume", 0.0);
}

void to_json(json& j, const OrderStatusEvent& ev) {
    j = json{
        {"orderId", ev.id},
        {"symbol", ev.symbol},
        {"side", side_to_string(ev.side)},
        {"status", order_status_to_string(ev.status)},
        {"filledQty", ev.filled_qty},
        {"fillPrice", ev.fill_price},
        {"commission", ev.commission},
        {"timestamp", format_iso8601(ev.timestamp)},
        {"ms", to_epoch_ms(ev.timestamp)},
    };
    if (!ev.reason.empty()) j["reason"] = ev.reason;
}

void to_json(json& j, const RunInfo& info) {
    j = json{
        {"runId", info.run_id},
        {"symbol", info.symbol},
        {"startingValue", info.starting_value},
    };
}

void to_json(json& j, const RunStats& stats) {
    j = json{
        {"runId", stats.run_id},
        {"symbol", stats.symbol},
        {"bars", stats.bars},
        {"barsDropped", stats.bars_dropped},
        {"ordersSubmitted", stats.orders_submitted},
        {"ordersCompleted", stats.orders_completed},
        {"ordersFailed", stats.orders_failed},
        {"requestsRefused", stats.requests_refused},
        {"abandonedOrder", stats.abandoned_order},
        {"startingValue", stats.starting_value},
        {"finalValue", stats.final_value},
        {"initialCash", stats.initial_cash},
        {"pnl", stats.pnl},
        {"pnlRatio", stats.pnl_ratio},
        {"position", {
            {"pnl", stats.position.pnl},
            {"pnlRatio", stats.position.pnl_ratio},
            {"maxPnl", stats.position.max_pnl},
            {"minPnl", stats.position.min_pnl},
            {"maxCash", stats.position.max_cash},
            {"commission", stats.position.commission},
        }},
    };
}

OrderStatus order_status_from_string(const std::string& s) {
    for (auto status : {OrderStatus::Submitted, OrderStatus::Accepted, OrderStatus::Completed,
                        OrderStatus::Canceled, OrderStatus::Margin, OrderStatus::Rejected}) {
        if (s == order_status_to_string(status)) return status;
    }
    throw std::invalid_argument("Unknown order status: " + s);
}

json make_message(const std::string& type, const json& data) {
    json msg;
    msg["type"] = type;
    msg["data"] = data;
    return msg;
}

} // namespace gambler
