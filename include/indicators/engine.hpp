#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "core/module.hpp"
#include "core/config.hpp"

namespace ind {

// Runs every indicator module on each candle and assembles the frame.
// update() returns std::nullopt until the slowest module is warm.
class IndicatorEngine {
public:
    explicit IndicatorEngine(const IndicatorPeriods& p = IndicatorPeriods{});

    std::optional<IndicatorFrame> update(const Candle& c);

    size_t warmup_bars() const { return warmup_; }
    size_t bars_seen() const { return bars_; }
    void reset();

private:
    std::vector<std::unique_ptr<IModule>> mods_;
    size_t warmup_{0};
    size_t bars_{0};
};

// Bars needed before the first defined frame
size_t warmup_length(const IndicatorPeriods& p);

// Frame of the last candle of `window`, computed from scratch;
// std::nullopt when the window is shorter than the warm-up length.
std::optional<IndicatorFrame> compute(const std::vector<Candle>& window, const IndicatorPeriods& p);

} // namespace ind
