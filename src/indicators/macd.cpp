#include "indicators/macd.hpp"

namespace ind {
void MacdModule::on_bar(const Candle& b, IndicatorFrame& out){
    fast_.update(b.close);
    if (!slow_.update(b.close) || !fast_.ready()) return;
    const double macd = fast_.value() - slow_.value();
    if (!signal_.update(macd)) { out.macd = macd; return; }
    out.macd        = macd;
    out.macd_signal = signal_.value();
    out.macd_hist   = macd - signal_.value();
}
} // namespace ind
