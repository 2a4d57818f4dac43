#pragma once

/// @file include/hype/config_loader.hpp
/// @brief JSON overlay for `AnalysisConfig`.
///
/// A config file only names what it changes:
///
/// ```json
/// {
///   "trend":       { "window": 3 },
///   "gates":       { "papers": 50 },
///   "paper_rules": { "basic_research_high": 65.0 },
///   "verbose":     true
/// }
/// ```
///
/// Sections are `trend`, `gates`, `paper`, `patent`, `social`, `news`,
/// `finance`, and the matching `*_rules`. Keys inside a section use the
/// struct member names. Unknown keys are ignored; a known key with the wrong
/// JSON type rejects the whole file.

#include "hype/config.hpp"

#include <json/json.h>

#include <optional>
#include <string>

namespace hype::io {

class ConfigLoader {
public:
    /// Apply the overlay in `path` on top of `base`.
    /// Returns `nullopt` if the file cannot be read, is not valid JSON, or
    /// holds a mistyped value.
    [[nodiscard]] static std::optional<AnalysisConfig>
    load(const std::string& path, const AnalysisConfig& base = {});

    /// Same, from an already-parsed document.
    [[nodiscard]] static std::optional<AnalysisConfig>
    apply(const Json::Value& overlay, const AnalysisConfig& base = {});

    /// Full config as JSON, every key present.
    [[nodiscard]] static Json::Value to_json(const AnalysisConfig& config);
};

}  // namespace hype::io
