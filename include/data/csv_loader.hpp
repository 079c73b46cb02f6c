#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

// Reads "timestamp,open,high,low,close,volume" rows (optional header line).
// Timestamps below 1e11 are taken as seconds and converted to ms.
// Unparsable rows are skipped with a warning; returns false when the file
// cannot be opened or holds no candle.
bool load_csv(const std::string& path, std::vector<Candle>& out);

} // namespace data
