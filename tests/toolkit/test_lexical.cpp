#include <gtest/gtest.h>
#include "hype/toolkit.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace hype;
using namespace hype::toolkit;

namespace {

bool contains(const std::vector<std::string>& xs, const std::string& x) {
    return std::find(xs.begin(), xs.end(), x) != xs.end();
}

}  // namespace

// ─── tokenize ─────────────────────────────────────────────────────────────────

TEST(Lexical_Tokenize, LowercasesAndDropsShortTokens) {
    const auto toks = tokenize("Quantum DOTS are not new");
    EXPECT_EQ(toks, (std::vector<std::string>{"quantum", "dots"}));
}

TEST(Lexical_Tokenize, MixedAlnumRunsAreDropped) {
    // "gpt4" and "cuda_core" are single word runs with non-letters.
    const auto toks = tokenize("gpt4 cuda_core transformer");
    EXPECT_EQ(toks, (std::vector<std::string>{"transformer"}));
}

TEST(Lexical_Tokenize, PunctuationSplits) {
    const auto toks = tokenize("graphene,battery;(anode)-cathode");
    EXPECT_EQ(toks, (std::vector<std::string>{"graphene", "battery", "anode", "cathode"}));
}

TEST(Lexical_Tokenize, NonAsciiBytesJoinTheRun) {
    // "naïve" is one run containing non-ASCII bytes, so it is not alphabetic.
    const auto toks = tokenize("naïve approach");
    EXPECT_EQ(toks, (std::vector<std::string>{"approach"}));
}

TEST(Lexical_Tokenize, Empty) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("  ,;  ").empty());
}

// ─── Stopwords ────────────────────────────────────────────────────────────────

TEST(Lexical_Stopwords, ProfilesExtendBase) {
    EXPECT_TRUE(stopwords(StopwordProfile::Base).contains("this"));
    EXPECT_FALSE(stopwords(StopwordProfile::Base).contains("reddit"));
    EXPECT_TRUE(stopwords(StopwordProfile::Social).contains("reddit"));
    EXPECT_TRUE(stopwords(StopwordProfile::Social).contains("this"));
    EXPECT_TRUE(stopwords(StopwordProfile::News).contains("according"));
    EXPECT_FALSE(stopwords(StopwordProfile::News).contains("reddit"));
}

// ─── LexicalAnalyzer ──────────────────────────────────────────────────────────

TEST(Lexical_TopKeywords, StopwordsRemovedAndRanked) {
    const std::vector<std::string> texts = {
        "this graphene battery", "this graphene anode", "graphene with battery"};
    const LexicalAnalyzer lex(StopwordProfile::Base, 1);
    const CountList top = lex.top_keywords(texts);
    ASSERT_GE(top.size(), 2u);
    EXPECT_EQ(top[0], (std::pair<std::string, std::int64_t>{"graphene", 3}));
    EXPECT_EQ(top[1], (std::pair<std::string, std::int64_t>{"battery", 2}));
    for (const auto& [word, n] : top) {
        EXPECT_NE(word, "this");
        EXPECT_NE(word, "with");
    }
}

TEST(Lexical_Emergence, RecentOnlyTermEmerges) {
    std::vector<std::string> texts;
    for (int i = 0; i < 10; ++i) texts.emplace_back("legacy compiler design");
    for (int i = 0; i < 10; ++i) texts.emplace_back("transformer compiler design");

    const LexicalAnalyzer lex(StopwordProfile::Base, 5);
    const KeywordShift shift = lex.emergence(texts);
    EXPECT_TRUE(contains(shift.emerging, "transformer"));
    EXPECT_TRUE(contains(shift.declining, "legacy"));
    EXPECT_FALSE(contains(shift.emerging, "compiler"));
    EXPECT_FALSE(contains(shift.declining, "design"));
}

TEST(Lexical_Emergence, MinimumCountFilters) {
    std::vector<std::string> texts = {"alpha", "alpha", "beta", "beta"};
    const LexicalAnalyzer lex(StopwordProfile::Base, 5);
    const KeywordShift shift = lex.emergence(texts);
    EXPECT_TRUE(shift.emerging.empty());
    EXPECT_TRUE(shift.declining.empty());
}

TEST(Lexical_Emergence, EmptyCorpus) {
    const LexicalAnalyzer lex(StopwordProfile::News, 1);
    const KeywordShift shift = lex.emergence(std::vector<std::string>{});
    EXPECT_TRUE(shift.emerging.empty());
    EXPECT_TRUE(shift.declining.empty());
}
