#include "strategy/scoring.hpp"
#include "indicators/bollinger.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace strategy {

const char* to_string(Component c) {
    switch (c) {
        case Component::Volume:      return "vol";
        case Component::VolumeTrend: return "vtrend";
        case Component::Rsi:         return "rsi";
        case Component::Bollinger:   return "bb";
        case Component::Obv:         return "obv";
        default:                     return "trend";
    }
}

std::string ScoreBreakdown::describe() const {
    std::string s = fmt::format("{}/100:", score);
    for (const auto& c : components) {
        const char mark = c.satisfied ? '+' : '-';
        switch (c.component) {
            case Component::VolumeTrend: s += fmt::format(" {} {:.1f}%{}", to_string(c.component), c.value, mark); break;
            case Component::Rsi:         s += fmt::format(" {} {:.0f}{}", to_string(c.component), c.value, mark); break;
            case Component::Obv:         s += fmt::format(" {} {:.0f}{}", to_string(c.component), c.value, mark); break;
            case Component::Trend:       s += fmt::format(" {}{}", to_string(c.component), mark); break;
            default:                     s += fmt::format(" {} {:.2f}{}", to_string(c.component), c.value, mark); break;
        }
    }
    return s;
}

ScoreBreakdown score(const IndicatorFrame& f, Direction d, const RubricConfig& r) {
    const bool buy = (d == Direction::Buy);
    const DirectionalBands& b = buy ? r.buy : r.sell;
    const ComponentWeights& w = r.weights;
    const double pos = ind::band_position(f.close, f.bb_lower, f.bb_upper);

    ScoreBreakdown out;
    out.components[0] = {Component::Volume, w.volume,
                         f.volume_ratio >= b.volume_ratio_min, f.volume_ratio};
    out.components[1] = {Component::VolumeTrend, w.volume_trend,
                         f.volume_trend_pct > b.volume_trend_min_pct, f.volume_trend_pct};
    out.components[2] = {Component::Rsi, w.rsi,
                         f.rsi >= b.rsi_low && f.rsi <= b.rsi_high, f.rsi};
    out.components[3] = {Component::Bollinger, w.bollinger,
                         pos >= b.bb_pos_low && pos <= b.bb_pos_high, pos};
    out.components[4] = {Component::Obv, w.obv,
                         buy ? f.obv_trend > 0.0 : f.obv_trend < 0.0, f.obv_trend};
    out.components[5] = {Component::Trend, w.trend,
                         buy ? f.ma_fast > f.ma_slow : f.ma_fast < f.ma_slow, f.ma_fast - f.ma_slow};

    int total = 0;
    for (const auto& c : out.components) if (c.satisfied) total += c.weight;
    out.score = std::clamp(total, 0, 100);
    return out;
}

} // namespace strategy
