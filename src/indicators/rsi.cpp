#include "indicators/rsi.hpp"
#include <cmath>
#include <limits>

namespace ind {
double compute_rsi(const std::deque<double>& c, size_t p){
    if (p==0 || c.size() <= p) return 50.0;
    double g=0.0,l=0.0;
    for (size_t i=c.size()-p; i<c.size(); ++i){
        const double d = c[i]-c[i-1];
        if (d>=0) g+=d; else l-=d;
    }
    if (g==0 && l==0) return std::numeric_limits<double>::quiet_NaN();
    if (l==0) return 100.0;
    const double rs  = (g/p) / (l/p);
    const double rsi = 100.0 - (100.0/(1.0+rs));
    return std::clamp(rsi, 0.0, 100.0);
}
void RsiModule::on_bar(const Candle& b, IndicatorFrame& out){
    closes.push_back(b.close);
    while (closes.size()>period+1) closes.pop_front();
    out.rsi = compute_rsi(closes, period);
}
} // namespace ind
