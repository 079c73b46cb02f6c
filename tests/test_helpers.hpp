#pragma once
#include <cstdint>
#include <vector>
#include "core/types.hpp"
#include "core/module.hpp"
#include "core/config.hpp"

namespace testutil {

constexpr std::int64_t kStart = 1700000000000LL;
constexpr std::int64_t kHour  = 3600000LL;

// Sine-wave closes with varying volume; one candle per hour
std::vector<Candle> sine_candles(std::size_t n, double period = 40.0, double amp = 10.0,
                                 double base = 100.0);

// Frame with the given MACD values; every scoring field is neutral
// (fails all components) so tests switch on only what they need.
IndicatorFrame frame(std::int64_t t, double close, double macd, double signal);

// Set scoring fields so that a buy/sell component passes
void pass_volume(IndicatorFrame& f);                 // ratio 1.5
void pass_volume_trend(IndicatorFrame& f, Direction d);
void pass_rsi(IndicatorFrame& f);                    // 50
void pass_bollinger(IndicatorFrame& f, Direction d); // bands around close
void pass_obv(IndicatorFrame& f, Direction d);
void pass_trend(IndicatorFrame& f, Direction d);

// Accepts every applicable crossover
RubricConfig permissive_rubric();

} // namespace testutil
