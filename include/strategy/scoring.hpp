#pragma once
#include <array>
#include <string>
#include "core/types.hpp"
#include "core/module.hpp"
#include "core/config.hpp"

namespace strategy {

enum class Component { Volume, VolumeTrend, Rsi, Bollinger, Obv, Trend };
const char* to_string(Component c);

struct ComponentScore {
    Component component{Component::Volume};
    int weight{0};
    bool satisfied{false};
    double value{0.0};   // indicator value the check was made on
};

struct ScoreBreakdown {
    int score{0};        // 0..100
    std::array<ComponentScore, 6> components{};

    // e.g. "vol 1.52+ vtrend 18.0%+ rsi 48+ bb 0.31+ obv -120- trend+"
    std::string describe() const;
};

// Confidence of a crossover candidate. Binary per component, asymmetric
// by direction, capped at 100. Pure.
ScoreBreakdown score(const IndicatorFrame& f, Direction d, const RubricConfig& r);

} // namespace strategy
