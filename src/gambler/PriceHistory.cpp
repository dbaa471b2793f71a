#include "gambler/PriceHistory.hpp"
#include <stdexcept>
#include <string>

namespace gambler {

void PriceHistory::append(const Bar& bar) {
    if (!bars_.empty() && bar.ts <= bars_.back().ts) {
        throw std::invalid_argument("PriceHistory: bar at " + format_iso8601(bar.ts) +
                                    " is not after " + format_iso8601(bars_.back().ts));
    }
    bars_.push_back(bar);
}

const Bar& PriceHistory::at(int offset) const {
    if (offset > 0) {
        throw std::out_of_range("PriceHistory: cannot look forward (offset " +
                                std::to_string(offset) + ")");
    }
    const std::size_t back = static_cast<std::size_t>(-static_cast<long long>(offset));
    if (back >= bars_.size()) {
        throw std::out_of_range("PriceHistory: offset " + std::to_string(offset) +
                                " with only " + std::to_string(bars_.size()) + " bars");
    }
    return bars_[bars_.size() - 1 - back];
}

} // namespace gambler
