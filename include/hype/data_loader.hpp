#pragma once

/// @file include/hype/data_loader.hpp
/// @brief CSV loader for daily ticker price rows.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of daily market data into `std::vector<PriceBar>`.
/// Malformed rows are skipped; the loader never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// ticker,date,open,high,low,close,adj_close,volume
/// NVDA,2024-01-02,48.2,49.3,47.6,48.1,48.1,411254000
/// NVDA,2024-01-03,47.5,48.2,47.3,47.6,,320896000
/// ```
/// The first line is treated as a header and skipped. Empty price or volume
/// cells are read as missing values.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "hype/records.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hype::io {

class DataLoader {
public:
    /// Load price rows from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Vector of parsed rows, skipping malformed ones
    [[nodiscard]] static std::optional<std::vector<PriceBar>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse price rows from a CSV-formatted string. Same format as
    /// `load_csv`; the first line is treated as a header.
    [[nodiscard]] static std::vector<PriceBar>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// A row is valid if:
    /// - ticker is non-empty and date is a real `YYYY-MM-DD`
    /// - every present price is finite and positive
    /// - low <= high when both are present
    /// - volume, if present, is non-negative
    [[nodiscard]] static bool validate_bar(const PriceBar& bar) noexcept;

private:
    [[nodiscard]] static std::optional<PriceBar>
    parse_row(const std::string& line) noexcept;
};

}  // namespace hype::io
