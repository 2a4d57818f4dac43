#pragma once

/// @file src/core/trace.hpp
/// @brief Step tracing to stderr, enabled by `AnalysisConfig::verbose`.

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace hype::core::detail {

template <typename... Args>
void trace(bool enabled, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled) return;
    fmt::print(stderr, "[hype] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace hype::core::detail
