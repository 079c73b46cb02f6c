#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include "core/types.hpp"

// Indicator values of one candle. Only produced once every module is warm.
struct IndicatorFrame {
    std::int64_t open_time_ms{0};
    double close{0.0};

    double macd{0.0};
    double macd_signal{0.0};
    double macd_hist{0.0};

    double rsi{50.0};

    double bb_upper{0.0};
    double bb_middle{0.0};
    double bb_lower{0.0};

    double obv{0.0};
    double obv_trend{0.0};

    double volume_ratio{0.0};
    double volume_trend_pct{0.0};

    double ma_fast{0.0};
    double ma_slow{0.0};
};

// Module interface - every indicator module implements it.
class IModule {
public:
    virtual ~IModule() = default;

    // Unique id (e.g. "MACD", "RSI", "BOLL", "VOLUME", "OBV", "MA_TREND")
    virtual std::string id() const = 0;

    // Bars needed before the module's fields are meaningful
    virtual std::size_t warmup_bars() const = 0;

    virtual void reset() = 0;

    // Called for every new candle; writes the module's fields into `out`
    virtual void on_bar(const Candle&, IndicatorFrame& out) = 0;
};
