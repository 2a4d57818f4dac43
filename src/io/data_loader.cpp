/// @file src/io/data_loader.cpp
/// @brief CSV DataLoader for daily ticker price rows.

#include "hype/data_loader.hpp"
#include "hype/calendar.hpp"

#include <cmath>
#include <initializer_list>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace hype::io {

namespace {

constexpr std::size_t CSV_COLUMNS = 8;

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    const auto last  = token.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return token.substr(first, last - first + 1);
}

/// Empty cell → `nullopt` with `ok` untouched; garbage clears `ok`.
std::optional<double> parse_price(const std::string& token, bool& ok) {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size()) {
            ok = false;  // trailing garbage
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        ok = false;
    } catch (const std::out_of_range&) {
        ok = false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> parse_volume(const std::string& token, bool& ok) {
    const auto v = parse_price(token, ok);
    if (!v) return std::nullopt;
    if (!std::isfinite(*v) || *v != std::floor(*v) || std::abs(*v) > 9.2e18) {
        ok = false;
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*v);
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const PriceBar& bar) noexcept {
    if (bar.ticker.empty()) return false;
    if (!calendar::parse_date(bar.date)) return false;

    // Every present price is finite and positive.
    for (const auto& p : {bar.open, bar.high, bar.low, bar.close, bar.adj_close}) {
        if (p && (!std::isfinite(*p) || *p <= 0.0)) return false;
    }

    if (bar.low && bar.high && *bar.high < *bar.low) return false;

    if (bar.volume && *bar.volume < 0) return false;

    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<PriceBar>
DataLoader::parse_row(const std::string& line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<std::string> cells;
    cells.reserve(CSV_COLUMNS);
    {
        std::istringstream ss(line);
        std::string token;
        while (std::getline(ss, token, ',')) {
            cells.push_back(trim(token));
        }
        // getline drops a trailing empty cell.
        if (line.back() == ',') cells.emplace_back();
    }

    if (cells.size() != CSV_COLUMNS) {
        return std::nullopt;
    }

    bool ok = true;
    PriceBar bar{
        .ticker    = cells[0],
        .date      = cells[1],
        .open      = parse_price(cells[2], ok),
        .high      = parse_price(cells[3], ok),
        .low       = parse_price(cells[4], ok),
        .close     = parse_price(cells[5], ok),
        .adj_close = parse_price(cells[6], ok),
        .volume    = parse_volume(cells[7], ok),
    };

    if (!ok || !validate_bar(bar)) {
        return std::nullopt;
    }

    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<PriceBar>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<PriceBar> bars;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto bar = parse_row(line)) {
            bars.push_back(std::move(*bar));
        }
    }

    return bars;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<PriceBar>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace hype::io
