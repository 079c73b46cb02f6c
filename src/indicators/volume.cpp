#include "indicators/volume.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {
void VolumeModule::on_bar(const Candle& b, IndicatorFrame& out){
    volumes.push_back(b.volume);
    while (volumes.size()>period) volumes.pop_front();
    if (volumes.size()<period) return;

    const double avg = compute_sma(volumes, period);
    const double ratio = (avg>0.0? b.volume/avg : 0.0);
    ratios.push_back(ratio);
    while (ratios.size()>lookback+1) ratios.pop_front();

    out.volume_ratio = ratio;
    if (ratios.size()<=lookback) return;
    const double then = ratios.front();
    out.volume_trend_pct = (then>0.0? (ratio/then - 1.0)*100.0 : 0.0);
}
void ObvModule::on_bar(const Candle& b, IndicatorFrame& out){
    if (has_prev_) {
        if (b.close>prev_close_) obv_ += b.volume;
        else if (b.close<prev_close_) obv_ -= b.volume;
    }
    prev_close_ = b.close; has_prev_ = true;

    history.push_back(obv_);
    while (history.size()>lookback+1) history.pop_front();
    out.obv = obv_;
    out.obv_trend = (history.size()>lookback? obv_ - history.front() : 0.0);
}
} // namespace ind
