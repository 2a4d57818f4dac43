/// @file src/toolkit/lexical.cpp
/// @brief Tokenizer, stopword profiles and keyword emergence.

#include "hype/toolkit.hpp"

namespace hype::toolkit {

namespace {

using StopwordSet = std::set<std::string, std::less<>>;

StopwordSet make_base() {
    return {
        "this", "that", "with", "from", "were", "have", "been", "their",
        "which", "these", "more", "other", "such", "into", "only", "also",
        "than", "some", "time", "very", "when", "them", "they", "there",
        "where", "what", "about", "after", "before", "would", "could",
        "should", "being", "between", "through", "during", "using",
    };
}

StopwordSet make_extended(std::initializer_list<const char*> extra) {
    StopwordSet s = make_base();
    for (const char* w : extra) s.emplace(w);
    return s;
}

// Python's \w for byte strings decoded as UTF-8: ASCII alnum, '_' and any
// non-ASCII byte (part of a multi-byte letter).
bool is_word_byte(unsigned char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c >= 0x80;
}

}  // namespace

// ─── Stopwords ────────────────────────────────────────────────────────────────

const std::set<std::string, std::less<>>& stopwords(StopwordProfile profile) {
    static const StopwordSet base   = make_base();
    static const StopwordSet social = make_extended({
        "just", "like", "know", "think", "want", "really", "anyone",
        "something", "getting", "going", "looking", "reddit", "post",
    });
    static const StopwordSet news = make_extended({
        "said", "says", "will", "year", "years", "according", "news",
        "report", "reported", "reports", "article", "read",
    });

    switch (profile) {
        case StopwordProfile::Social: return social;
        case StopwordProfile::News:   return news;
        case StopwordProfile::Base:   break;
    }
    return base;
}

// ─── tokenize ─────────────────────────────────────────────────────────────────

std::vector<std::string> tokenize(std::string_view text, std::size_t min_length) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        if (!is_word_byte(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        const std::size_t start = i;
        bool alphabetic = true;
        while (i < n && is_word_byte(static_cast<unsigned char>(text[i]))) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) {
                alphabetic = false;
            }
            ++i;
        }

        if (alphabetic && i - start >= min_length) {
            std::string tok(text.substr(start, i - start));
            for (auto& ch : tok) {
                if (ch >= 'A' && ch <= 'Z') ch = static_cast<char>(ch - 'A' + 'a');
            }
            tokens.push_back(std::move(tok));
        }
    }
    return tokens;
}

// ─── LexicalAnalyzer ──────────────────────────────────────────────────────────

LexicalAnalyzer::LexicalAnalyzer(StopwordProfile profile, std::int64_t min_count)
    : stopwords_(&stopwords(profile))
    , min_count_(min_count)
{}

FrequencyCounter LexicalAnalyzer::count_tokens(std::span<const std::string> texts) const {
    FrequencyCounter counter;
    for (const auto& text : texts) {
        for (const auto& tok : tokenize(text)) {
            counter.add(tok);
        }
    }
    return counter;
}

CountList LexicalAnalyzer::top_keywords(std::span<const std::string> texts) const {
    const FrequencyCounter counter = count_tokens(texts);

    // Stopwords are dropped from the frequency pool, not before ranking.
    CountList out;
    for (auto& entry : counter.most_common(constants::KEYWORD_POOL)) {
        if (stopwords_->contains(entry.first)) continue;
        out.push_back(std::move(entry));
        if (out.size() == constants::TOP_KEYWORDS) break;
    }
    return out;
}

std::vector<std::string>
LexicalAnalyzer::shifted(const FrequencyCounter& focus, const FrequencyCounter& other) const {
    std::vector<std::string> out;
    for (const auto& [word, n] : focus.most_common(constants::EMERGENCE_CANDIDATES)) {
        if (stopwords_->contains(word)) continue;
        if (n > other.count(word) * 2 && n >= min_count_) {
            out.push_back(word);
            if (out.size() == constants::EMERGENCE_LIMIT) break;
        }
    }
    return out;
}

KeywordShift LexicalAnalyzer::emergence(std::span<const std::string> texts) const {
    const std::size_t mid = texts.size() / 2;
    const FrequencyCounter early  = count_tokens(texts.first(mid));
    const FrequencyCounter recent = count_tokens(texts.subspan(mid));

    return KeywordShift{
        .emerging  = shifted(recent, early),
        .declining = shifted(early, recent),
    };
}

}  // namespace hype::toolkit
