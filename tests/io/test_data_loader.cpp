#include <gtest/gtest.h>
#include "hype/data_loader.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace hype;
using namespace hype::io;

namespace {

const char* HEADER = "ticker,date,open,high,low,close,adj_close,volume\n";

PriceBar good_bar() {
    return PriceBar{
        .ticker    = "NVDA",
        .date      = "2024-01-02",
        .open      = 48.2,
        .high      = 49.3,
        .low       = 47.6,
        .close     = 48.1,
        .adj_close = 48.1,
        .volume    = 411'254'000,
    };
}

}  // namespace

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

TEST(DataLoaderParseCsv, EmptyStringGivesEmptyVector) {
    EXPECT_TRUE(DataLoader::parse_csv_string("").empty());
}

TEST(DataLoaderParseCsv, HeaderOnlyGivesEmptyVector) {
    EXPECT_TRUE(DataLoader::parse_csv_string(HEADER).empty());
}

TEST(DataLoaderParseCsv, ValidRowIsParsed) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) + "NVDA,2024-01-02,48.2,49.3,47.6,48.1,48.1,411254000\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].ticker, "NVDA");
    EXPECT_EQ(bars[0].date, "2024-01-02");
    EXPECT_DOUBLE_EQ(*bars[0].close, 48.1);
    EXPECT_EQ(*bars[0].volume, 411'254'000);
}

TEST(DataLoaderParseCsv, EmptyCellsAreMissingValues) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) + "NVDA,2024-01-03,47.5,48.2,47.3,47.6,,\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_FALSE(bars[0].adj_close.has_value());
    EXPECT_FALSE(bars[0].volume.has_value());
    EXPECT_DOUBLE_EQ(*bars[0].close, 47.6);
}

TEST(DataLoaderParseCsv, MalformedRowSkipped) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) +
        "bad,row,here\n"
        "NVDA,2024-01-04,48.0,48.5,47.0,48.2,48.2,1000\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].date, "2024-01-04");
}

TEST(DataLoaderParseCsv, GarbageCellSkipsRow) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) +
        "NVDA,2024-01-04,48.0x,48.5,47.0,48.2,48.2,1000\n"
        "NVDA,2024-01-05,48.0,48.5,47.0,48.2,48.2,12.5\n");
    EXPECT_TRUE(bars.empty());
}

TEST(DataLoaderParseCsv, InvalidDateSkipped) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) + "NVDA,2024-02-30,48.0,48.5,47.0,48.2,48.2,1000\n");
    EXPECT_TRUE(bars.empty());
}

TEST(DataLoaderParseCsv, NaNInRowSkipped) {
    const auto bars = DataLoader::parse_csv_string(
        std::string(HEADER) +
        "NVDA,2024-01-04,nan,48.5,47.0,48.2,48.2,1000\n"
        "NVDA,2024-01-05,48.0,48.5,47.0,48.2,48.2,1000\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].date, "2024-01-05");
}

TEST(DataLoaderParseCsv, CommentsAndCarriageReturns) {
    const auto bars = DataLoader::parse_csv_string(
        "# exported 2024-02-01\r\n"
        "ticker,date,open,high,low,close,adj_close,volume\r\n"
        "# first session\r\n"
        "AMD,2024-01-02,138.0,141.0,137.0,138.6,138.6,6500000\r\n"
        "\r\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].ticker, "AMD");
    EXPECT_EQ(*bars[0].volume, 6'500'000);
}

// ─── DataLoader::validate_bar ────────────────────────────────────────────────

TEST(DataLoaderValidateBar, ValidBarPasses) {
    EXPECT_TRUE(DataLoader::validate_bar(good_bar()));
}

TEST(DataLoaderValidateBar, HighLessThanLowFails) {
    auto b = good_bar();
    b.high = 47.0;
    b.low  = 48.0;
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

TEST(DataLoaderValidateBar, NegativeVolumeFails) {
    auto b = good_bar();
    b.volume = -1;
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

TEST(DataLoaderValidateBar, NonPositiveOrInfinitePriceFails) {
    auto b = good_bar();
    b.close = 0.0;
    EXPECT_FALSE(DataLoader::validate_bar(b));
    b = good_bar();
    b.adj_close = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

TEST(DataLoaderValidateBar, MissingTickerFails) {
    auto b = good_bar();
    b.ticker.clear();
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

TEST(DataLoaderLoadCsv, MissingFileGivesNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/prices.csv").has_value());
}

TEST(DataLoaderLoadCsv, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "hypecycle_prices_test.csv";
    {
        std::ofstream out(path);
        out << HEADER
            << "NVDA,2024-01-02,48.2,49.3,47.6,48.1,48.1,411254000\n"
            << "NVDA,2024-01-03,47.5,48.2,47.3,47.6,47.6,320896000\n";
    }
    const auto bars = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 2u);
    EXPECT_EQ((*bars)[1].date, "2024-01-03");
}
