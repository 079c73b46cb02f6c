#include "core/config.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace config {

RubricConfig preset(const std::string& name) {
    RubricConfig r;
    if (name == "final85") return r;
    if (name == "balanced78") {
        r.name = name;
        r.confidence_threshold = 78;
        r.sell.volume_ratio_min = 1.3;
        return r;
    }
    if (name == "strict85") {
        r.name = name;
        r.confidence_threshold = 85;
        return r;
    }
    throw ConfigError(fmt::format("unknown preset '{}'", name));
}

std::vector<std::string> preset_names() {
    return {"final85", "balanced78", "strict85"};
}

constexpr std::size_t kMaxCount = 100000;
constexpr std::size_t kMaxFetchLimit = 10000;   // MAX /api/v2/k cap

static void check_bands(const DirectionalBands& b, const char* side) {
    if (!(b.rsi_low <= b.rsi_high) || b.rsi_low < 0.0 || b.rsi_high > 100.0)
        throw ConfigError(fmt::format("{} rsi band [{}, {}] invalid", side, b.rsi_low, b.rsi_high));
    if (!(b.bb_pos_low <= b.bb_pos_high))
        throw ConfigError(fmt::format("{} bollinger band [{}, {}] invalid", side, b.bb_pos_low, b.bb_pos_high));
    if (!std::isfinite(b.volume_ratio_min) || !std::isfinite(b.volume_trend_min_pct))
        throw ConfigError(fmt::format("{} volume bounds must be finite", side));
}

void validate(const RubricConfig& r) {
    const auto& w = r.weights;
    if (w.volume < 0 || w.volume_trend < 0 || w.rsi < 0 || w.bollinger < 0 || w.obv < 0 || w.trend < 0)
        throw ConfigError("rubric weights must be non-negative");
    if (w.base_sum() != 100)
        throw ConfigError(fmt::format("rubric base weights sum to {}, expected 100", w.base_sum()));
    if (w.trend > 100)
        throw ConfigError(fmt::format("trend bonus {} exceeds 100", w.trend));
    if (r.confidence_threshold < 0 || r.confidence_threshold > 100)
        throw ConfigError(fmt::format("confidence threshold {} outside [0,100]", r.confidence_threshold));
    if (r.max_modifier < 0 || r.max_modifier > 100)
        throw ConfigError(fmt::format("max modifier {} outside [0,100]", r.max_modifier));

    const auto& p = r.periods;
    if (p.macd_fast == 0 || p.macd_slow == 0 || p.macd_signal == 0 || p.rsi == 0 || p.bollinger == 0
        || p.volume == 0 || p.volume_trend_lookback == 0 || p.obv_trend_lookback == 0
        || p.ma_fast == 0 || p.ma_slow == 0)
        throw ConfigError("indicator periods must be positive");
    for (auto n : {p.macd_fast, p.macd_slow, p.macd_signal, p.rsi, p.bollinger, p.volume,
                   p.volume_trend_lookback, p.obv_trend_lookback, p.ma_fast, p.ma_slow})
        if (n > kMaxCount) throw ConfigError(fmt::format("indicator period {} above {}", n, kMaxCount));
    if (p.macd_fast >= p.macd_slow)
        throw ConfigError(fmt::format("macd fast {} must be below slow {}", p.macd_fast, p.macd_slow));
    if (p.ma_fast >= p.ma_slow)
        throw ConfigError(fmt::format("ma fast {} must be below slow {}", p.ma_fast, p.ma_slow));
    if (!(p.bollinger_k > 0.0))
        throw ConfigError("bollinger k must be positive");

    check_bands(r.buy, "buy");
    check_bands(r.sell, "sell");

    if (!(r.quantity > 0.0) || !std::isfinite(r.quantity))
        throw ConfigError(fmt::format("quantity {} must be positive", r.quantity));
    if (!(r.fee_rate >= 0.0 && r.fee_rate < 1.0))
        throw ConfigError(fmt::format("fee rate {} outside [0,1)", r.fee_rate));
}

void validate(const LiveConfig& l) {
    if (l.poll_interval_sec <= 0) throw ConfigError("poll interval must be positive");
    if (l.fetch_limit == 0) throw ConfigError("fetch limit must be positive");
    if (l.fetch_limit > kMaxFetchLimit)
        throw ConfigError(fmt::format("fetch limit {} above {}", l.fetch_limit, kMaxFetchLimit));
    if (l.window_margin > kMaxCount)
        throw ConfigError(fmt::format("window margin {} above {}", l.window_margin, kMaxCount));
    if (l.max_consecutive_failures <= 0) throw ConfigError("max consecutive failures must be positive");
    if (l.retry_base_ms <= 0) throw ConfigError("retry base must be positive");
    if (l.timeout_ms <= 0) throw ConfigError("timeout must be positive");
    if (l.base_url.empty()) throw ConfigError("base url must not be empty");
}

Timeframe parse_timeframe(const std::string& s) {
    if (s=="M1") return Timeframe::M1;
    if (s=="M5") return Timeframe::M5;
    if (s=="M15") return Timeframe::M15;
    if (s=="M30") return Timeframe::M30;
    if (s=="H1") return Timeframe::H1;
    if (s=="H4") return Timeframe::H4;
    if (s=="D1") return Timeframe::D1;
    throw ConfigError(fmt::format("unknown timeframe '{}'", s));
}

OutOfStatePolicy parse_policy(const std::string& s) {
    if (s=="ignore") return OutOfStatePolicy::Ignore;
    if (s=="report") return OutOfStatePolicy::Report;
    throw ConfigError(fmt::format("unknown out-of-state policy '{}'", s));
}

// Counts and periods. nlohmann converts -1 to a huge size_t, so signed
// values are checked here before they reach the unsigned field.
static std::size_t read_count(const json& j, const char* key, std::size_t def) {
    if (!j.contains(key)) return def;
    const auto& v = j[key];
    if (!v.is_number_integer())
        throw ConfigError(fmt::format("'{}' must be an integer, got {}", key, v.dump()));
    if (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)
        throw ConfigError(fmt::format("'{}' must not be negative, got {}", key, v.dump()));
    return v.get<std::size_t>();
}

static void read_bands(const json& j, DirectionalBands& b) {
    b.volume_ratio_min     = j.value("volume_ratio_min", b.volume_ratio_min);
    b.volume_trend_min_pct = j.value("volume_trend_min_pct", b.volume_trend_min_pct);
    b.rsi_low     = j.value("rsi_low", b.rsi_low);
    b.rsi_high    = j.value("rsi_high", b.rsi_high);
    b.bb_pos_low  = j.value("bb_pos_low", b.bb_pos_low);
    b.bb_pos_high = j.value("bb_pos_high", b.bb_pos_high);
}

RubricConfig rubric_from_json(const json& j, RubricConfig r) {
    try {
        if (!j.is_object()) throw ConfigError("rubric must be an object");
        r.name = j.value("name", r.name);
        r.confidence_threshold = j.value("confidence_threshold", r.confidence_threshold);
        r.quantity = j.value("quantity", r.quantity);
        r.fee_rate = j.value("fee_rate", r.fee_rate);
        r.max_modifier = j.value("max_modifier", r.max_modifier);
        if (j.contains("out_of_state"))
            r.out_of_state = parse_policy(j["out_of_state"].get<std::string>());

        if (j.contains("weights")) {
            const auto& w = j["weights"];
            r.weights.volume       = w.value("volume", r.weights.volume);
            r.weights.volume_trend = w.value("volume_trend", r.weights.volume_trend);
            r.weights.rsi          = w.value("rsi", r.weights.rsi);
            r.weights.bollinger    = w.value("bollinger", r.weights.bollinger);
            r.weights.obv          = w.value("obv", r.weights.obv);
            r.weights.trend        = w.value("trend", r.weights.trend);
        }
        if (j.contains("buy"))  read_bands(j["buy"], r.buy);
        if (j.contains("sell")) read_bands(j["sell"], r.sell);

        if (j.contains("periods")) {
            const auto& p = j["periods"];
            auto& d = r.periods;
            d.macd_fast   = read_count(p, "macd_fast", d.macd_fast);
            d.macd_slow   = read_count(p, "macd_slow", d.macd_slow);
            d.macd_signal = read_count(p, "macd_signal", d.macd_signal);
            d.rsi         = read_count(p, "rsi", d.rsi);
            d.bollinger   = read_count(p, "bollinger", d.bollinger);
            d.bollinger_k = p.value("bollinger_k", d.bollinger_k);
            d.volume      = read_count(p, "volume", d.volume);
            d.volume_trend_lookback = read_count(p, "volume_trend_lookback", d.volume_trend_lookback);
            d.obv_trend_lookback    = read_count(p, "obv_trend_lookback", d.obv_trend_lookback);
            d.ma_fast     = read_count(p, "ma_fast", d.ma_fast);
            d.ma_slow     = read_count(p, "ma_slow", d.ma_slow);
        }
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("rubric: {}", e.what()));
    }
    validate(r);
    return r;
}

AppConfig from_json(const json& j) {
    AppConfig c;
    try {
        if (!j.is_object()) throw ConfigError("config root must be an object");
        if (j.contains("instrument")) {
            const auto& s = j["instrument"];
            c.instrument.base  = s.value("base", c.instrument.base);
            c.instrument.quote = s.value("quote", c.instrument.quote);
        }
        if (j.contains("timeframe")) c.timeframe = parse_timeframe(j["timeframe"].get<std::string>());

        RubricConfig base = preset(j.value("preset", std::string{"final85"}));
        c.rubric = j.contains("rubric") ? rubric_from_json(j["rubric"], base) : base;

        if (j.contains("live")) {
            const auto& l = j["live"];
            auto& d = c.live;
            d.poll_interval_sec        = l.value("poll_interval_sec", d.poll_interval_sec);
            d.fetch_limit              = read_count(l, "fetch_limit", d.fetch_limit);
            d.window_margin            = read_count(l, "window_margin", d.window_margin);
            d.max_consecutive_failures = l.value("max_consecutive_failures", d.max_consecutive_failures);
            d.retry_base_ms            = l.value("retry_base_ms", d.retry_base_ms);
            d.timeout_ms               = l.value("timeout_ms", d.timeout_ms);
            d.drop_forming_candle      = l.value("drop_forming_candle", d.drop_forming_candle);
            d.base_url                 = l.value("base_url", d.base_url);
        }
        c.trade_log = j.value("trade_log", c.trade_log);
        c.log_level = j.value("log_level", c.log_level);
        c.log_file  = j.value("log_file", c.log_file);
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("config: {}", e.what()));
    }
    validate(c.rubric);
    validate(c.live);
    if (spdlog::level::from_str(c.log_level) == spdlog::level::off && c.log_level != "off")
        throw ConfigError(fmt::format("unknown log level '{}'", c.log_level));
    return c;
}

AppConfig load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw ConfigError(fmt::format("cannot open config '{}'", path));
    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("config '{}' is not valid JSON: {}", path, e.what()));
    }
    auto c = from_json(j);
    spdlog::info("config loaded: {} {} preset={} threshold={}",
                 c.instrument.name(), to_string(c.timeframe), c.rubric.name, c.rubric.confidence_threshold);
    return c;
}

} // namespace config
