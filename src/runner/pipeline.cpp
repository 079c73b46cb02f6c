#include "runner/pipeline.hpp"
#include <utility>

namespace runner {

InstrumentContext::InstrumentContext(Symbol s, const RubricConfig& r, strategy::ConfidenceModifier mod)
    : symbol(std::move(s)),
      rubric(r),
      validator(),
      engine(r.periods),
      detector(r, std::move(mod)),
      ledger(r.quantity, r.fee_rate) {}

std::optional<IndicatorFrame> ingest(InstrumentContext& ctx, const Candle& c) {
    ctx.validator.accept(c);
    return ctx.engine.update(c);
}

StepResult process(InstrumentContext& ctx, const Candle& c) {
    StepResult r;
    r.frame = ingest(ctx, c);
    if (r.frame) r.event = ctx.detector.on_frame(*r.frame, ctx.ledger);
    return r;
}

std::optional<IndicatorFrame> prime(InstrumentContext& ctx, const Candle& c) {
    auto f = ingest(ctx, c);
    if (f) ctx.detector.prime(*f);
    return f;
}

LedgerSnapshot snapshot(const InstrumentContext& ctx, double mark) {
    LedgerSnapshot s;
    s.state = ctx.detector.state();
    if (const auto* p = ctx.ledger.current()) s.open = *p;
    s.closed_trades = ctx.ledger.history().size();
    for (const auto& p : ctx.ledger.history()) s.realized_pnl += p.realized_pnl.value_or(0.0);
    s.unrealized_pnl = ctx.ledger.unrealized_pnl(mark);
    return s;
}

} // namespace runner
