#pragma once
#include "gambler/MarketDataTypes.hpp"
#include "gambler/Types.hpp"
#include "gambler/Engine.hpp"
#include <nlohmann/json.hpp>

/*
JSON shapes shared by the run store and the frontend bridge.
Timestamps are written twice: ISO8601 for people and epoch milliseconds for charts.
*/

namespace gambler {

using json = nlohmann::json;

void to_json(json& j, const Bar& bar);
void from_json(const json& j, Bar& bar);

void to_json(json& j, const OrderStatusEvent& ev);
void to_json(json& j, const RunInfo& info);
void to_json(json& j, const RunStats& stats);

// Parses "Completed" etc.; throws std::invalid_argument for anything else.
OrderStatus order_status_from_string(const std::string& s);

// {"type": type, "data": data}
json make_message(const std::string& type, const json& data);

} // namespace gambler
