#include "indicators/bollinger.hpp"
#include <cmath>

namespace ind {
BB compute_bb(const std::deque<double>& v, size_t p, double k){
    if (p==0 || v.size()<p) {
        const double last = v.empty()? 0.0 : v.back();
        return {last, last, last};
    }
    double mid=0.0;
    for (size_t i=v.size()-p;i<v.size();++i) mid += v[i];
    mid/=p;
    double var=0.0;
    for (size_t i=v.size()-p;i<v.size();++i){ const double d=v[i]-mid; var+=d*d; }
    const double sd = p>1 ? std::sqrt(std::max(0.0, var/(p-1))) : 0.0;
    return {mid, mid + k*sd, mid - k*sd};
}
double band_position(double close, double lower, double upper){
    if (upper==lower) return 0.5;
    return (close - lower) / (upper - lower);
}
void BollModule::on_bar(const Candle& b, IndicatorFrame& out){
    closes.push_back(b.close);
    while (closes.size()>period) closes.pop_front();
    const auto bb = compute_bb(closes, period, k_);
    out.bb_middle = bb.mid;
    out.bb_upper  = bb.upper;
    out.bb_lower  = bb.lower;
}
} // namespace ind
