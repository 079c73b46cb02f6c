#include "data/csv_loader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data {

static bool parse_row(const std::string& line, Candle& r) {
    std::stringstream ss(line);
    std::string x;
    double* fields[] = {&r.open, &r.high, &r.low, &r.close, &r.volume};
    if (!std::getline(ss,x,',')) return false;
    r.open_time_ms = std::stoll(x);
    for (double* f : fields) {
        if (!std::getline(ss,x,',')) return false;
        *f = std::stod(x);
    }
    if (r.open_time_ms < 100000000000LL) r.open_time_ms *= 1000;
    return true;
}

bool load_csv(const std::string& path, std::vector<Candle>& out) {
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    std::size_t lineno = 0, skipped = 0;
    while (std::getline(f, line)) {
        ++lineno;
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (line.empty()) continue;
        Candle r{};
        try {
            if (parse_row(line, r)) { out.push_back(r); continue; }
        } catch (const std::logic_error&) {   // stoll/stod
            if (lineno == 1) continue;        // header
        }
        ++skipped;
        spdlog::warn("{}:{}: unparsable row skipped", path, lineno);
    }
    if (skipped) spdlog::warn("{}: {} rows skipped", path, skipped);
    return !out.empty();
}

} // namespace data
