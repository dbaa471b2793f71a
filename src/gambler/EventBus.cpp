#include "gambler/EventBus.hpp"
#include <algorithm>
#ifdef GAMBLER_DEBUG
    #include <iostream>
#endif

namespace gambler {

EventBus::HandlerId EventBus::subscribe(const std::string& topic, Handler handler) {
    const HandlerId id = next_id_++;
    handlers_[topic].emplace_back(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(const std::string& topic, HandlerId id) {
    auto topic_it = handlers_.find(topic);
    if (topic_it == handlers_.end()) return false;

    auto& subscribers = topic_it->second;
    auto found = std::find_if(subscribers.begin(), subscribers.end(),
                              [id](const auto& entry) { return entry.first == id; });
    if (found == subscribers.end()) return false;

    subscribers.erase(found);
    if (subscribers.empty()) handlers_.erase(topic_it);
    return true;
}

void EventBus::publish(const Event& ev) const {
    auto topic_it = handlers_.find(ev.type);

#ifdef GAMBLER_DEBUG
    std::cout << "[EventBus] " << ev.type << " -> "
              << (topic_it == handlers_.end() ? 0 : topic_it->second.size()) << " handler(s)\n";
#endif

    if (topic_it == handlers_.end()) return;

    // Handlers may subscribe or unsubscribe while we dispatch.
    const auto subscribers = topic_it->second;
    for (const auto& [id, handler] : subscribers) {
        handler(ev);
    }
}

std::size_t EventBus::handler_count(const std::string& topic) const {
    auto topic_it = handlers_.find(topic);
    return topic_it == handlers_.end() ? 0 : topic_it->second.size();
}

} // namespace gambler
