#pragma once
#include "core/module.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

// MACD = EMA(close, fast) - EMA(close, slow), signal = EMA(macd, signal_p)
class MacdModule final : public IModule {
    size_t fast_p_, slow_p_, signal_p_;
    Ema fast_, slow_, signal_;
public:
    MacdModule(size_t fast_p=12, size_t slow_p=26, size_t signal_p=9)
    : fast_p_(fast_p), slow_p_(slow_p), signal_p_(signal_p),
      fast_(fast_p), slow_(slow_p), signal_(signal_p) {}

    std::string id() const override { return "MACD"; }
    size_t warmup_bars() const override { return slow_p_ + signal_p_; }
    void reset() override { fast_.reset(); slow_.reset(); signal_.reset(); }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

} // namespace ind
