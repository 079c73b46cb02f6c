#pragma once
#include <cstdint>
#include <optional>
#include "core/types.hpp"

namespace data {

// Ingestion gate: finite positive prices, high/low consistent with open/close,
// non-negative volume, timestamps strictly increasing.
class CandleValidator {
public:
    // Throws DataError; does not change state.
    void check(const Candle& c) const;
    // check() then remember the timestamp
    void accept(const Candle& c);

    std::optional<std::int64_t> last_time() const { return last_; }
    void reset() { last_.reset(); }

private:
    std::optional<std::int64_t> last_;
};

} // namespace data
