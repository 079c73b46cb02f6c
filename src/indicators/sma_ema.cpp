#include "indicators/sma_ema.hpp"
#include <numeric>
#include <cmath>

namespace ind {
double compute_sma(const std::deque<double>& v, size_t p){
    if (p==0 || v.size()<p) return v.empty()?0.0:v.back();
    double s=0; for (size_t i=v.size()-p;i<v.size();++i) s+=v[i];
    return s/static_cast<double>(p);
}
double compute_ema(const std::deque<double>& v, size_t p){
    if (p==0 || v.size()<p) return v.empty()?0.0:v.back();
    const double k = 2.0/(p+1.0);
    double e = std::accumulate(v.begin(), v.begin()+p, 0.0) / static_cast<double>(p);
    for (size_t i=p;i<v.size();++i) e = v[i]*k + e*(1.0-k);
    return e;
}
bool Ema::update(double x){
    ++count_;
    if (count_ < period_) { sum_ += x; return false; }
    if (count_ == period_) { sum_ += x; value_ = sum_/static_cast<double>(period_); return true; }
    value_ = x*k_ + value_*(1.0-k_);
    return true;
}
void MaTrendModule::on_bar(const Candle& b, IndicatorFrame& out){
    closes.push_back(b.close);
    while (closes.size()>slow_p) closes.pop_front();
    out.ma_fast = compute_sma(closes, fast_p);
    out.ma_slow = compute_sma(closes, slow_p);
}
} // namespace ind
