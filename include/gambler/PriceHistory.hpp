#pragma once
#include "gambler/MarketDataTypes.hpp"
#include <vector>
#include <cstddef>

/*
PriceHistory:
  Append-only sequence of the bars seen so far in a run. The engine appends;
  strategies read through a const reference.

  Offsets are relative to the current bar: 0 is the current bar, -1 the one
  before it, and so on. Positive offsets (looking forward) are never allowed.
*/

namespace gambler {

class PriceHistory {
public:
    // Throws std::invalid_argument unless bar.ts is strictly after the last bar.
    void append(const Bar& bar);

    // Throws std::out_of_range if offset > 0 or the history is too short.
    const Bar& at(int offset) const;
    double close(int offset) const { return at(offset).close; }

    // True if `lookback` bars before the current one are available.
    bool has_lookback(std::size_t lookback) const { return bars_.size() > lookback; }

    const Bar& current() const { return at(0); }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const std::vector<Bar>& bars() const { return bars_; }

private:
    std::vector<Bar> bars_;
};

} // namespace gambler
