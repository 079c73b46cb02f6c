#include "data/candle_validator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace data {

void CandleValidator::check(const Candle& c) const {
    const double v[] = {c.open, c.high, c.low, c.close, c.volume};
    for (double x : v)
        if (!std::isfinite(x)) throw DataError(fmt::format("candle {}: non-finite value", c.open_time_ms));
    if (c.volume < 0.0)
        throw DataError(fmt::format("candle {}: negative volume {}", c.open_time_ms, c.volume));
    if (c.open <= 0.0 || c.high <= 0.0 || c.low <= 0.0 || c.close <= 0.0)
        throw DataError(fmt::format("candle {}: non-positive price", c.open_time_ms));
    if (c.high < std::max({c.open, c.close, c.low}) || c.low > std::min(c.open, c.close))
        throw DataError(fmt::format("candle {}: high/low inconsistent (h={} l={} o={} c={})",
                                    c.open_time_ms, c.high, c.low, c.open, c.close));
    if (last_ && c.open_time_ms <= *last_)
        throw DataError(fmt::format("candle {}: not after previous {}", c.open_time_ms, *last_));
}

void CandleValidator::accept(const Candle& c) {
    check(c);
    last_ = c.open_time_ms;
}

} // namespace data
