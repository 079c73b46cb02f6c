#include "data/max_rest.hpp"
#include "core/errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

using json = nlohmann::json;

namespace data {

static double to_d(const json& v){
    double x = 0.0;
    if (v.is_string()){
        const std::string& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        x = std::strtod(s.c_str(), &end);
        if (s.empty() || end != s.c_str() + s.size())
            throw ProviderError(fmt::format("kline field is not numeric: {}", v.dump()));
    } else if (v.is_number()){
        x = v.get<double>();
    } else {
        throw ProviderError(fmt::format("kline field is not numeric: {}", v.dump()));
    }
    if (!std::isfinite(x)) throw ProviderError(fmt::format("kline field is not finite: {}", v.dump()));
    return x;
}

// seconds -> ms; must stay inside int64 after scaling
static std::int64_t to_time_ms(const json& v){
    const double t = to_d(v);
    if (!(t >= 0.0 && t < 9.0e15))
        throw ProviderError(fmt::format("kline timestamp out of range: {}", v.dump()));
    return static_cast<std::int64_t>(t) * 1000;
}

MaxRestProvider::MaxRestProvider(RestConfig cfg) : cfg_(std::move(cfg)) {}

json MaxRestProvider::http_get(const std::string& path, const std::string& query){
    const std::string url = cfg_.base_url + path + (query.empty()? "" : "?" + query);
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Timeout{cfg_.timeout_ms},
                               cpr::VerifySsl{true});
    if (r.error.code != cpr::ErrorCode::OK)
        throw ProviderError(fmt::format("GET {} : {}", path, r.error.message));
    if (r.status_code>=400){
        spdlog::warn("GET {} : {} {}", path, r.status_code, r.text);
        throw ProviderError(fmt::format("GET {} : HTTP {}", path, r.status_code));
    }
    try{
        return json::parse(r.text);
    } catch (const json::exception& e){
        throw ProviderError(fmt::format("GET {} : bad payload: {}", path, e.what()));
    }
}

std::vector<Candle> MaxRestProvider::parse_klines(const json& j){
    if (!j.is_array()) throw ProviderError("kline payload is not an array");
    std::vector<Candle> v;
    v.reserve(j.size());
    for (const auto& row : j){
        if (!row.is_array() || row.size() < 6)
            throw ProviderError(fmt::format("kline row malformed: {}", row.dump()));
        Candle c;
        c.open_time_ms = to_time_ms(row[0]);
        c.open   = to_d(row[1]);
        c.high   = to_d(row[2]);
        c.low    = to_d(row[3]);
        c.close  = to_d(row[4]);
        c.volume = to_d(row[5]);
        v.push_back(c);
    }
    std::sort(v.begin(), v.end(), [](const Candle& a, const Candle& b){ return a.open_time_ms < b.open_time_ms; });
    return v;
}

std::vector<Candle> MaxRestProvider::get_candles(const Symbol& s, Timeframe tf, std::size_t limit){
    const std::string q = fmt::format("market={}&period={}&limit={}", s.name(), minutes(tf), limit);
    auto candles = parse_klines(http_get("/api/v2/k", q));
    spdlog::debug("fetched {} {} candles for {}", candles.size(), to_string(tf), s.name());
    return candles;
}

Candle MaxRestProvider::get_latest_candle(const Symbol& s, Timeframe tf){
    auto v = get_candles(s, tf, 1);
    if (v.empty()) throw ProviderError(fmt::format("no candle returned for {}", s.name()));
    return v.back();
}

} // namespace data
