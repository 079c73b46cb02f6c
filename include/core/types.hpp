#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

// Candle timeframe
enum class Timeframe { M1, M5, M15, M30, H1, H4, D1 };

inline int minutes(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return 1;
        case Timeframe::M5:  return 5;
        case Timeframe::M15: return 15;
        case Timeframe::M30: return 30;
        case Timeframe::H1:  return 60;
        case Timeframe::H4:  return 240;
        default:             return 1440;
    }
}

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "M1";
        case Timeframe::M5:  return "M5";
        case Timeframe::M15: return "M15";
        case Timeframe::M30: return "M30";
        case Timeframe::H1:  return "H1";
        case Timeframe::H4:  return "H4";
        default:             return "D1";
    }
}

// Instrument, e.g. btc/twd -> "btctwd"
struct Symbol {
    std::string base{"btc"};
    std::string quote{"twd"};
    std::string name() const {
        std::string s = base + quote;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

// OHLCV candle
struct Candle {
    std::int64_t open_time_ms{}; // candle open time (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

inline bool operator==(const Candle& a, const Candle& b) {
    return a.open_time_ms == b.open_time_ms && a.open == b.open && a.high == b.high
        && a.low == b.low && a.close == b.close && a.volume == b.volume;
}

// Trade direction
enum class Direction { Buy, Sell };

inline const char* to_string(Direction d) {
    return d == Direction::Buy ? "BUY" : "SELL";
}
