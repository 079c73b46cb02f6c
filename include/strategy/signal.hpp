#pragma once
#include <cstdint>
#include "core/types.hpp"
#include "strategy/scoring.hpp"

namespace strategy {

// Accepted trading decision at a crossover candle
struct Signal {
    std::int64_t open_time_ms{0};
    Direction direction{Direction::Buy};
    double price{0.0};
    int confidence_score{0};
    ScoreBreakdown breakdown{};
};

} // namespace strategy
