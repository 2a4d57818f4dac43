/**
 * @file  fuzz_tokenizer.cpp
 * @brief libFuzzer target for toolkit::tokenize and LexicalAnalyzer
 *
 * Build:
 *   cmake -DHYPE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_tokenizer
 *
 * Run for 60 seconds:
 *   ./fuzz_tokenizer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no out-of-bounds read for any byte sequence.
 *   2. Every token is lowercase ASCII a-z and at least MIN_TOKEN_LENGTH long.
 *   3. Token bytes never exceed input bytes.
 *   4. top_keywords() returns at most TOP_KEYWORDS entries, none a stopword,
 *      counts strictly positive and non-increasing.
 *   5. emergence() never reports a word as both emerging and declining.
 *
 * Fuzzer strategy:
 *   The input is split on '\n' into a small corpus so emergence() sees an
 *   early and a recent half.  Interesting inputs:
 *     • High bytes and UTF-8 sequences adjacent to letters
 *     • Digits and underscores inside words (→ token dropped)
 *     • Embedded NUL bytes
 *     • Words exactly MIN_TOKEN_LENGTH − 1 and MIN_TOKEN_LENGTH long
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "hype/toolkit.hpp"

using namespace hype;
using namespace hype::toolkit;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    // Invariants 2, 3
    std::size_t token_bytes = 0;
    for (const auto& tok : tokenize(input)) {
        assert(tok.size() >= constants::MIN_TOKEN_LENGTH);
        for (const char c : tok) {
            assert(c >= 'a' && c <= 'z');
        }
        token_bytes += tok.size();
    }
    assert(token_bytes <= size);

    std::vector<std::string> corpus;
    std::size_t start = 0;
    while (start <= input.size()) {
        const std::size_t end = std::min(input.find('\n', start), input.size());
        corpus.emplace_back(input.substr(start, end - start));
        start = end + 1;
    }

    const LexicalAnalyzer analyzer(StopwordProfile::News, 1);

    // Invariant 4
    const CountList top = analyzer.top_keywords(corpus);
    assert(top.size() <= constants::TOP_KEYWORDS);
    const auto& stop = stopwords(StopwordProfile::News);
    for (std::size_t i = 0; i < top.size(); ++i) {
        assert(top[i].second > 0);
        assert(!stop.contains(top[i].first));
        if (i > 0) assert(top[i].second <= top[i - 1].second);
    }

    // Invariant 5
    const KeywordShift shift = analyzer.emergence(corpus);
    for (const auto& word : shift.emerging) {
        assert(std::find(shift.declining.begin(), shift.declining.end(), word)
               == shift.declining.end());
    }

    return 0;
}
