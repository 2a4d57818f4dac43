/// @file src/metrics/extract_common.cpp
/// @brief InsufficientDataError and shared extractor helpers.

#include "extract_common.hpp"

#include <fmt/format.h>

#include <cctype>

namespace hype {

InsufficientDataError::InsufficientDataError(std::string stream, std::size_t found,
                                             std::size_t required)
    : std::runtime_error(fmt::format("insufficient {} records: found {}, need at least {}",
                                     stream, found, required))
    , stream_(std::move(stream))
    , found_(found)
    , required_(required)
{}

}  // namespace hype

namespace hype::metrics::detail {

void require_records(const char* stream, std::size_t found, std::size_t required) {
    if (found < required) {
        throw InsufficientDataError(stream, found, required);
    }
}

bool non_blank(const std::optional<std::string>& s) noexcept {
    if (!s) return false;
    return std::any_of(s->begin(), s->end(),
                       [](unsigned char c) { return !std::isspace(c); });
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    for (std::size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        // UTF-8 À..Þ (U+00C0..U+00DE, except ×) fold to à..þ.
        if (c == 0xC3 && i + 1 < out.size()) {
            const auto next = static_cast<unsigned char>(out[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                out[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
            continue;
        }
        out[i] = static_cast<char>(std::tolower(c));
    }
    return out;
}

std::string join_text(std::initializer_list<const std::optional<std::string>*> parts,
                      std::string_view head) {
    std::string out(head);
    for (const auto* p : parts) {
        if (p && p->has_value()) {
            out += ' ';
            out += **p;
        }
    }
    return out;
}

}  // namespace hype::metrics::detail
