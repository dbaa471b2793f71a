#pragma once
#include <string>
#include <any>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace gambler {

// Topics published during a backtest run.
namespace topics {
inline constexpr const char* kBar = "Bar";                  // data: Bar
inline constexpr const char* kBarAccepted = "BarAccepted";  // data: Bar, once it is in the history
inline constexpr const char* kOrderStatus = "OrderStatus";  // data: OrderStatusEvent
inline constexpr const char* kRunStart = "RunStart";        // data: RunInfo
inline constexpr const char* kRunEnd = "RunEnd";            // data: RunStats
}

struct Event {
    std::string type;
    std::any data;
};


class EventBus {
public:
    using Handler   = std::function<void(const Event&)>;
    using HandlerId = std::uint64_t;

    // Subscribe to a topic. Returns an id you can use to unsubscribe.
    HandlerId subscribe(const std::string& topic, Handler handler);

    // Unsubscribe; returns true if a handler was removed.
    bool unsubscribe(const std::string& topic, HandlerId id);

    // Publish an event to all handlers for its topic, in subscription order.
    void publish(const Event& ev) const;

    std::size_t handler_count(const std::string& topic) const;

private:
    std::unordered_map<std::string,
        std::vector<std::pair<HandlerId, Handler>>> handlers_;
    HandlerId next_id_{1};
};

} // namespace gambler
