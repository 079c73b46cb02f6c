#pragma once
#include <functional>
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "core/module.hpp"
#include "strategy/scoring.hpp"
#include "strategy/signal.hpp"
#include "exec/ledger.hpp"

namespace strategy {

enum class State { Flat, Holding };
enum class Trigger { None, Buy, Sell };
enum class EventKind { Accepted, Rejected, Inapplicable };

const char* to_string(State s);
const char* to_string(EventKind k);

// Outcome of a crossover candidate
struct DetectorEvent {
    EventKind kind{EventKind::Rejected};
    Direction direction{Direction::Buy};
    std::int64_t open_time_ms{0};
    double price{0.0};
    int score{0};                           // after the advisory modifier
    std::optional<ScoreBreakdown> breakdown; // empty for inapplicable triggers
    std::optional<Signal> signal;            // set when accepted
};

// Optional advisory adjustment; clamped to +-rubric.max_modifier.
using ConfidenceModifier = std::function<int(const IndicatorFrame&, Direction)>;

// Buy: signal-line cross from below under the zero line.
// Sell: cross from above over the zero line.
Trigger detect_trigger(const IndicatorFrame& prev, const IndicatorFrame& cur);

// FLAT/HOLDING state machine gating MACD crossovers on the rubric score.
class SignalDetector {
public:
    explicit SignalDetector(const RubricConfig& r, ConfidenceModifier mod = {});

    // Evaluates `f` against the previous frame. Accepted signals mutate the
    // ledger (StateError propagates). Returns the candidate's outcome, or
    // nothing when no trigger fired (or an inapplicable one was ignored).
    std::optional<DetectorEvent> on_frame(const IndicatorFrame& f, exec::PositionLedger& ledger);

    // Chronological; after the first actioned transition, later candidates of
    // the same transition are wrong-state.
    std::vector<DetectorEvent> on_batch(const std::vector<IndicatorFrame>& frames,
                                        exec::PositionLedger& ledger);

    // Remember `f` as previous frame without evaluating it
    void prime(const IndicatorFrame& f) { prev_ = f; }

    State state() const { return state_; }
    const RubricConfig& rubric() const { return rubric_; }
    void reset();

private:
    DetectorEvent evaluate(const IndicatorFrame& f, Direction d, exec::PositionLedger& ledger);

    RubricConfig rubric_;
    ConfidenceModifier mod_;
    State state_{State::Flat};
    std::optional<IndicatorFrame> prev_;
};

} // namespace strategy
