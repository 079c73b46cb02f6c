#pragma once
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/module.hpp"
#include "strategy/detector.hpp"
#include "exec/ledger.hpp"

namespace runner {

// Receives every accepted signal (order execution, alerting, ...)
class ISignalSink {
public:
    virtual ~ISignalSink() = default;
    virtual void on_signal_accepted(const strategy::Signal& sig) = 0;
};

class LogSignalSink final : public ISignalSink {
public:
    explicit LogSignalSink(std::string instrument) : instrument_(std::move(instrument)) {}
    void on_signal_accepted(const strategy::Signal& sig) override;
private:
    std::string instrument_;
};

struct LedgerSnapshot {
    strategy::State state{strategy::State::Flat};
    std::optional<exec::Position> open;
    std::size_t closed_trades{0};
    double realized_pnl{0.0};
    double unrealized_pnl{0.0};
};

struct TickSummary {
    std::string instrument;
    std::size_t new_candles{0};
    std::optional<IndicatorFrame> indicators;              // last defined frame of the tick
    std::vector<strategy::DetectorEvent> rejected_candidates;
    LedgerSnapshot ledger;
};

// Monitoring hook; best effort, exceptions are logged by the caller.
class IObservabilitySink {
public:
    virtual ~IObservabilitySink() = default;
    virtual void on_tick_summary(const TickSummary& s) = 0;
};

struct TradeRecord {
    std::int64_t open_time_ms{0};
    Direction direction{Direction::Buy};
    double price{0.0};
    double quantity{0.0};
    int confidence_score{0};
    std::optional<double> realized_pnl;   // sells only
};

// Record of an accepted signal after the ledger has been updated
TradeRecord make_record(const strategy::Signal& sig, const exec::PositionLedger& ledger);

nlohmann::json to_json(const TradeRecord& r);

// Append-only JSON-lines file of trade records
class TradeRecordWriter {
public:
    // Throws ConfigError when the file cannot be opened.
    explicit TradeRecordWriter(const std::string& path);
    void append(const TradeRecord& r);
    std::size_t written() const { return written_; }
private:
    std::string path_;
    std::ofstream out_;
    std::size_t written_{0};
};

} // namespace runner
