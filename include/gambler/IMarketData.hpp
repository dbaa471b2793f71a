#pragma once
#include "gambler/MarketDataTypes.hpp"
#include <functional>
#include <string>
#include <cstddef>

/*
The interface that adapters -- the classes that ingest data sources like bar files -- inherit
*/

namespace gambler {

class IMarketData {
public:
    virtual ~IMarketData() = default;

    // Register the callback that receives bars for `symbol`.
    virtual void subscribe_bars(
        const std::string& symbol,
        std::function<void(const Bar&)> callback) = 0;

    virtual void start() { }
    virtual void stop() { }

    // Emit every bar, in timestamp order, to the subscribers.
    // Returns the number of bars emitted.
    virtual std::size_t replay() = 0;
};

}
