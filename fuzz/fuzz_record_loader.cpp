/**
 * @file  fuzz_record_loader.cpp
 * @brief libFuzzer target for parse_json and the RecordLoader decoders
 *
 * Build:
 *   cmake -DHYPE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_record_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_record_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception out of parse_json or any parse_*.
 *      Out-of-range timestamps and market caps decode to empty optionals.
 *   2. A document that is not an array decodes to nullopt for every stream.
 *   3. An array decodes for every stream, to at most doc.size() records.
 *   4. Every decoded TickerInfo has a non-empty ticker.
 *
 * Fuzzer strategy:
 *   Input is treated as JSON text.  Seed the corpus with exported arrays of
 *   papers, patents, posts and articles so that mutations reach the field
 *   readers:
 *     • Numbers where strings are expected and vice versa
 *     • created_utc values of 1e300, -1e300 and malformed ISO strings
 *     • `source` and `assignees` of every JSON type
 *     • Deep nesting and very long strings
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "hype/record_loader.hpp"
#include "hype/serialization.hpp"

using namespace hype;
using namespace hype::io;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto doc = parse_json(input);
    if (!doc) return 0;

    const auto papers   = RecordLoader::parse_papers(*doc);
    const auto patents  = RecordLoader::parse_patents(*doc);
    const auto posts    = RecordLoader::parse_posts(*doc);
    const auto articles = RecordLoader::parse_articles(*doc);
    const auto tickers  = RecordLoader::parse_ticker_info(*doc);

    if (!doc->isArray()) {
        // Invariant 2
        assert(!papers && !patents && !posts && !articles && !tickers);
    } else {
        // Invariant 3
        assert(papers && patents && posts && articles && tickers);
        assert(papers->size()   <= doc->size());
        assert(patents->size()  <= doc->size());
        assert(posts->size()    <= doc->size());
        assert(articles->size() <= doc->size());
        assert(tickers->size()  <= doc->size());

        // Invariant 4
        for (const auto& t : *tickers) {
            assert(!t.ticker.empty());
        }
    }

    return 0;
}
