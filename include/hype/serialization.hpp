#pragma once

/// @file include/hype/serialization.hpp
/// @brief JSON encoding of snapshots and verdicts (jsoncpp).
///
/// # Module: Serialization
///
/// ## Responsibility
/// Convert snapshots and verdicts to and from flat JSON objects at the
/// persistence boundary. Field names match the snapshot members; labelled
/// count lists become arrays of `[label, count]` pairs; velocity maps become
/// objects keyed by bucket; absent optionals become `null`.
///
/// ## Guarantees
/// - `from_json(to_json(s)) == s` for every snapshot type
/// - `from_json` never throws; malformed or incomplete input → `nullopt`

#include "hype/snapshot.hpp"
#include "hype/types.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace hype::io {

[[nodiscard]] Json::Value to_json(const PaperSnapshot& s);
[[nodiscard]] Json::Value to_json(const PatentSnapshot& s);
[[nodiscard]] Json::Value to_json(const SocialSnapshot& s);
[[nodiscard]] Json::Value to_json(const NewsSnapshot& s);
[[nodiscard]] Json::Value to_json(const FinanceSnapshot& s);
[[nodiscard]] Json::Value to_json(const PhaseVerdict& v);

/// Decode a value produced by `to_json`.
template <typename T>
[[nodiscard]] std::optional<T> from_json(const Json::Value& value) noexcept;

template <> std::optional<PaperSnapshot>   from_json<PaperSnapshot>(const Json::Value&) noexcept;
template <> std::optional<PatentSnapshot>  from_json<PatentSnapshot>(const Json::Value&) noexcept;
template <> std::optional<SocialSnapshot>  from_json<SocialSnapshot>(const Json::Value&) noexcept;
template <> std::optional<NewsSnapshot>    from_json<NewsSnapshot>(const Json::Value&) noexcept;
template <> std::optional<FinanceSnapshot> from_json<FinanceSnapshot>(const Json::Value&) noexcept;
template <> std::optional<PhaseVerdict>    from_json<PhaseVerdict>(const Json::Value&) noexcept;

/// Serialise with full double precision.
[[nodiscard]] std::string write_json(const Json::Value& value, bool pretty = true);

/// Parse a JSON document; `nullopt` on syntax errors.
[[nodiscard]] std::optional<Json::Value> parse_json(std::string_view text) noexcept;

}  // namespace hype::io
