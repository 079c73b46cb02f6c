#pragma once
#include <cstddef>
#include <vector>
#include "core/types.hpp"

namespace data {

// Source of candles for the live runner. Implementations throw
// ProviderError on any failure (transport, timeout, status, payload).
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // Most recent `limit` candles, oldest first
    virtual std::vector<Candle> get_candles(const Symbol& s, Timeframe tf, std::size_t limit) = 0;

    virtual Candle get_latest_candle(const Symbol& s, Timeframe tf) = 0;
};

} // namespace data
