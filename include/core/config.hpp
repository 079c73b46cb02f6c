#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

struct IndicatorPeriods {
    std::size_t macd_fast{12};
    std::size_t macd_slow{26};
    std::size_t macd_signal{9};
    std::size_t rsi{14};
    std::size_t bollinger{20};
    double bollinger_k{2.0};
    std::size_t volume{20};
    std::size_t volume_trend_lookback{3};
    std::size_t obv_trend_lookback{5};
    std::size_t ma_fast{20};
    std::size_t ma_slow{50};
};

// Base weights (volume..obv) must sum to 100; trend is a bonus on top,
// the total score is capped at 100.
struct ComponentWeights {
    int volume{30};
    int volume_trend{25};
    int rsi{20};
    int bollinger{15};
    int obv{10};
    int trend{5};

    int base_sum() const { return volume + volume_trend + rsi + bollinger + obv; }
};

// Acceptance bands of one direction
struct DirectionalBands {
    double volume_ratio_min{1.4};
    double volume_trend_min_pct{15.0};  // strict: trend > min
    double rsi_low{35.0};
    double rsi_high{65.0};
    double bb_pos_low{0.15};
    double bb_pos_high{0.5};
};

// What to do with a crossover that arrives in the wrong state
enum class OutOfStatePolicy { Ignore, Report };

struct RubricConfig {
    std::string name{"final85"};
    ComponentWeights weights{};
    int confidence_threshold{80};
    DirectionalBands buy{};
    DirectionalBands sell{1.4, -10.0, 35.0, 65.0, 0.5, 0.85};
    IndicatorPeriods periods{};
    double quantity{0.01};
    double fee_rate{0.0};
    OutOfStatePolicy out_of_state{OutOfStatePolicy::Ignore};
    int max_modifier{10};   // bound of an advisory score adjustment
};

struct LiveConfig {
    int poll_interval_sec{300};
    std::size_t fetch_limit{5};
    std::size_t window_margin{20};
    int max_consecutive_failures{5};
    int retry_base_ms{2000};
    int timeout_ms{10000};
    bool drop_forming_candle{true};
    std::string base_url{"https://max-api.maicoin.com"};
};

struct AppConfig {
    Symbol instrument{};
    Timeframe timeframe{Timeframe::H1};
    RubricConfig rubric{};
    LiveConfig live{};
    std::string trade_log;     // empty -> no trade records
    std::string log_level{"info"};
    std::string log_file;      // empty -> console only
};

namespace config {

// Named strategy variants; throws ConfigError on unknown names.
RubricConfig preset(const std::string& name);
std::vector<std::string> preset_names();

// Throws ConfigError on the first violation found.
void validate(const RubricConfig& r);
void validate(const LiveConfig& l);

Timeframe parse_timeframe(const std::string& s);
OutOfStatePolicy parse_policy(const std::string& s);

// Overrides on top of `base`, then validated.
RubricConfig rubric_from_json(const nlohmann::json& j, RubricConfig base);
AppConfig from_json(const nlohmann::json& j);
AppConfig load_file(const std::string& path);

} // namespace config
