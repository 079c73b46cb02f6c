#pragma once
#include <optional>
#include "core/types.hpp"
#include "core/config.hpp"
#include "data/candle_validator.hpp"
#include "indicators/engine.hpp"
#include "strategy/detector.hpp"
#include "exec/ledger.hpp"
#include "runner/sinks.hpp"

namespace runner {

// Everything one instrument owns. Instruments share nothing; one thread
// drives a context at a time.
struct InstrumentContext {
    InstrumentContext(Symbol s, const RubricConfig& r, strategy::ConfidenceModifier mod = {});

    Symbol symbol;
    RubricConfig rubric;
    data::CandleValidator validator;
    ind::IndicatorEngine engine;
    strategy::SignalDetector detector;
    exec::PositionLedger ledger;
};

struct StepResult {
    std::optional<IndicatorFrame> frame;
    std::optional<strategy::DetectorEvent> event;
};

// Validation + indicators. DataError leaves the context untouched.
std::optional<IndicatorFrame> ingest(InstrumentContext& ctx, const Candle& c);

// ingest() followed by the detector (ledger mutation on acceptance)
StepResult process(InstrumentContext& ctx, const Candle& c);

// ingest() and hand the frame to the detector as history only
std::optional<IndicatorFrame> prime(InstrumentContext& ctx, const Candle& c);

LedgerSnapshot snapshot(const InstrumentContext& ctx, double mark);

} // namespace runner
