#include "runner/sinks.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runner {

void LogSignalSink::on_signal_accepted(const strategy::Signal& sig) {
    spdlog::info("[{}] {} @ {:.2f} confidence {} ({})", instrument_, to_string(sig.direction),
                 sig.price, sig.confidence_score, sig.breakdown.describe());
}

TradeRecord make_record(const strategy::Signal& sig, const exec::PositionLedger& ledger) {
    TradeRecord r;
    r.open_time_ms = sig.open_time_ms;
    r.direction = sig.direction;
    r.price = sig.price;
    r.quantity = ledger.quantity();
    r.confidence_score = sig.confidence_score;
    if (sig.direction == Direction::Sell && !ledger.history().empty())
        r.realized_pnl = ledger.history().back().realized_pnl;
    return r;
}

json to_json(const TradeRecord& r) {
    json j = {
        {"timestamp", r.open_time_ms},
        {"direction", to_string(r.direction)},
        {"price", r.price},
        {"quantity", r.quantity},
        {"confidence_score", r.confidence_score},
    };
    j["realized_pnl"] = r.realized_pnl ? json(*r.realized_pnl) : json(nullptr);
    return j;
}

TradeRecordWriter::TradeRecordWriter(const std::string& path)
    : path_(path), out_(path, std::ios::app) {
    if (!out_.good()) throw ConfigError(fmt::format("cannot open trade log '{}'", path));
}

void TradeRecordWriter::append(const TradeRecord& r) {
    out_ << to_json(r).dump() << '\n';
    out_.flush();
    if (!out_.good()) {
        spdlog::error("trade log '{}': write failed", path_);
        return;
    }
    ++written_;
}

} // namespace runner
