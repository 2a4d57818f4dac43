/**
 * @file  fuzz_price_csv.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string and the finance
 *        extractor downstream of it
 *
 * Build:
 *   cmake -DHYPE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_price_csv
 *
 * Run for 60 seconds:
 *   ./fuzz_price_csv -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception out of parse_csv_string.
 *   2. Every returned bar passes validate_bar().
 *   3. Never more bars than input lines.
 *   4. When at least MIN_PRICE_ROWS_FOR_ANALYSIS bars survive, the extractor
 *      returns a snapshot whose total_price_records equals the bar count and
 *      whose coverage_pct lies in [0, 100].
 *
 * Fuzzer strategy:
 *   Input is the CSV text verbatim.  The parser must handle:
 *     • Binary garbage and embedded NUL bytes
 *     • "NaN", "inf", "-1e309" cells
 *     • Impossible dates ("2024-02-30", "2024-13-01")
 *     • CRLF line endings and '#' comment lines
 *     • Rows with too few or too many columns
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "hype/data_loader.hpp"
#include "hype/extractors.hpp"

using namespace hype;
using namespace hype::io;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{
        reinterpret_cast<const char*>(data), size
    };

    const auto bars = DataLoader::parse_csv_string(input);

    // Invariant 2
    for (const auto& bar : bars) {
        assert(DataLoader::validate_bar(bar));
    }

    // Invariant 3
    const auto lines = static_cast<std::size_t>(std::count(input.begin(), input.end(), '\n')) + 1;
    assert(bars.size() <= lines);

    // Invariant 4
    if (bars.size() >= constants::MIN_PRICE_ROWS_FOR_ANALYSIS) {
        const metrics::FinanceExtractor extractor;
        const FinanceSnapshot s = extractor.extract(bars);
        assert(s.total_price_records == static_cast<std::int64_t>(bars.size()));
        assert(s.coverage_pct >= 0.0 && s.coverage_pct <= 100.0);
    }

    return 0;
}
