/// @file src/io/serialization.cpp
/// @brief Snapshot and verdict JSON codecs built on the field visitors.

#include "hype/serialization.hpp"

#include "json_fields.hpp"

#include <exception>
#include <memory>

namespace hype::io {

using detail::FieldReader;
using detail::FieldWriter;

namespace {

template <typename S, typename Visit>
Json::Value write_fields(const S& s, Visit visit) {
    Json::Value out(Json::objectValue);
    FieldWriter w{out};
    visit(s, w);
    return out;
}

template <typename S, typename Visit>
std::optional<S> read_fields(const Json::Value& in, Visit visit) noexcept {
    try {
        if (!in.isObject()) return std::nullopt;
        S s;
        FieldReader r{in};
        visit(s, r);
        if (!r.ok) return std::nullopt;
        return s;
    } catch (const Json::Exception&) {
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Generic lambdas so one visitor list serves both const and mutable walks.
constexpr auto paper_fields   = [](auto& s, auto& v) { detail::visit_paper(s, v); };
constexpr auto patent_fields  = [](auto& s, auto& v) { detail::visit_patent(s, v); };
constexpr auto social_fields  = [](auto& s, auto& v) { detail::visit_social(s, v); };
constexpr auto news_fields    = [](auto& s, auto& v) { detail::visit_news(s, v); };
constexpr auto finance_fields = [](auto& s, auto& v) { detail::visit_finance(s, v); };

}  // anonymous namespace

// ─── Snapshots ────────────────────────────────────────────────────────────────

Json::Value to_json(const PaperSnapshot& s)   { return write_fields(s, paper_fields); }
Json::Value to_json(const PatentSnapshot& s)  { return write_fields(s, patent_fields); }
Json::Value to_json(const SocialSnapshot& s)  { return write_fields(s, social_fields); }
Json::Value to_json(const NewsSnapshot& s)    { return write_fields(s, news_fields); }
Json::Value to_json(const FinanceSnapshot& s) { return write_fields(s, finance_fields); }

template <>
std::optional<PaperSnapshot> from_json<PaperSnapshot>(const Json::Value& v) noexcept {
    return read_fields<PaperSnapshot>(v, paper_fields);
}

template <>
std::optional<PatentSnapshot> from_json<PatentSnapshot>(const Json::Value& v) noexcept {
    return read_fields<PatentSnapshot>(v, patent_fields);
}

template <>
std::optional<SocialSnapshot> from_json<SocialSnapshot>(const Json::Value& v) noexcept {
    return read_fields<SocialSnapshot>(v, social_fields);
}

template <>
std::optional<NewsSnapshot> from_json<NewsSnapshot>(const Json::Value& v) noexcept {
    return read_fields<NewsSnapshot>(v, news_fields);
}

template <>
std::optional<FinanceSnapshot> from_json<FinanceSnapshot>(const Json::Value& v) noexcept {
    return read_fields<FinanceSnapshot>(v, finance_fields);
}

// ─── Verdict ──────────────────────────────────────────────────────────────────

Json::Value to_json(const PhaseVerdict& v) {
    Json::Value out(Json::objectValue);
    out["phase"]      = std::string(to_string(v.phase));
    out["confidence"] = v.confidence;
    out["rationale"]  = v.rationale;

    Json::Value scores(Json::objectValue);
    Json::Value indicators(Json::objectValue);
    for (const Phase p : ALL_PHASES) {
        const std::string id(to_string(p));
        scores[id] = v.score(p);
        Json::Value hits(Json::arrayValue);
        for (const auto& hit : v.hits(p)) {
            Json::Value h(Json::objectValue);
            h["id"]     = hit.id;
            h["weight"] = hit.weight;
            hits.append(std::move(h));
        }
        indicators[id] = std::move(hits);
    }
    out["scores"]     = std::move(scores);
    out["indicators"] = std::move(indicators);
    return out;
}

template <>
std::optional<PhaseVerdict> from_json<PhaseVerdict>(const Json::Value& in) noexcept {
    try {
        if (!in.isObject()) return std::nullopt;
        if (!in["phase"].isString() || !in["rationale"].isString()) return std::nullopt;

        PhaseVerdict v;
        const auto phase = parse_phase(in["phase"].asString());
        if (!phase) return std::nullopt;
        v.phase = *phase;
        if (!detail::decode(in["confidence"], v.confidence)) return std::nullopt;
        v.rationale = in["rationale"].asString();

        const Json::Value& scores     = in["scores"];
        const Json::Value& indicators = in["indicators"];
        if (!scores.isObject() || !indicators.isObject()) return std::nullopt;

        for (const Phase p : ALL_PHASES) {
            const std::string id(to_string(p));
            if (!detail::decode(scores[id], v.scores[index_of(p)])) return std::nullopt;

            const Json::Value& hits = indicators[id];
            if (!hits.isArray()) return std::nullopt;
            for (const auto& h : hits) {
                if (!h.isObject() || !h["id"].isString()) return std::nullopt;
                IndicatorHit hit{.id = h["id"].asString()};
                if (!detail::decode(h["weight"], hit.weight)) return std::nullopt;
                v.indicators[index_of(p)].push_back(std::move(hit));
            }
        }
        return v;
    } catch (const Json::Exception&) {
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── Text ─────────────────────────────────────────────────────────────────────

std::string write_json(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["precision"]   = 17;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parse_json(std::string_view text) noexcept {
    try {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            return std::nullopt;
        }
        return root;
    } catch (const Json::Exception&) {
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace hype::io
