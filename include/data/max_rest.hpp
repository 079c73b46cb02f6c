#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data/market_data.hpp"

namespace data {

struct RestConfig {
    std::string base_url{"https://max-api.maicoin.com"};
    int timeout_ms{10000};
};

// MAX exchange public kline endpoint:
// GET /api/v2/k?market=btctwd&period=<minutes>&limit=<n>
// -> [[ts_sec, open, high, low, close, volume], ...]
class MaxRestProvider final : public IMarketDataProvider {
public:
    explicit MaxRestProvider(RestConfig cfg);

    std::vector<Candle> get_candles(const Symbol& s, Timeframe tf, std::size_t limit) override;
    Candle get_latest_candle(const Symbol& s, Timeframe tf) override;

    // Exposed for tests; throws ProviderError on malformed payloads.
    static std::vector<Candle> parse_klines(const nlohmann::json& j);

private:
    nlohmann::json http_get(const std::string& path, const std::string& query);

    RestConfig cfg_;
};

} // namespace data
