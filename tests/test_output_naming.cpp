// test_output_naming.cpp: date tags and output file names.

#include <gtest/gtest.h>

#include "io/output_naming.hpp"

#include <ctime>

using betarank::date_tag_from_filename;
using betarank::is_real_date;
using betarank::make_output_paths;

namespace {

std::tm fixed_today() {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon  = 6;     // July
    tm.tm_mday = 7;
    return tm;
}

}  // namespace

TEST(DateTag, CompactYearMonthDay) {
    EXPECT_EQ(date_tag_from_filename("raw_betas_20250707.csv", fixed_today()), "2025_07_07");
    EXPECT_EQ(date_tag_from_filename("/data/in/20241231-export.xlsx", fixed_today()), "2024_12_31");
}

TEST(DateTag, SeparatedYearMonthDay) {
    EXPECT_EQ(date_tag_from_filename("betas_2025-03-14.csv", fixed_today()), "2025_03_14");
    EXPECT_EQ(date_tag_from_filename("betas_2025_03_14.csv", fixed_today()), "2025_03_14");
}

TEST(DateTag, SeparatedMonthDayYear) {
    EXPECT_EQ(date_tag_from_filename("betas_03-14-2025.csv", fixed_today()), "2025_03_14");
    EXPECT_EQ(date_tag_from_filename("betas 07_07_2025.txt", fixed_today()), "2025_07_07");
}

TEST(DateTag, InvalidCompactDateFallsThroughToNextPattern) {
    // 20251340 is not a date; the dashed date later in the name is.
    EXPECT_EQ(date_tag_from_filename("x20251340_2025-02-01.csv", fixed_today()), "2025_02_01");
}

TEST(DateTag, ImpossibleDatesFallBackToToday) {
    EXPECT_EQ(date_tag_from_filename("betas_2025-02-30.csv", fixed_today()), "2025_07_07");
    EXPECT_EQ(date_tag_from_filename("raw_betas.csv", fixed_today()), "2025_07_07");
}

TEST(DateTag, OnlyTheStemIsSearched) {
    EXPECT_EQ(date_tag_from_filename("/archive/2020-01-01/raw_betas.csv", fixed_today()), "2025_07_07");
}

TEST(DateTag, LeapDay) {
    EXPECT_TRUE(is_real_date(2024, 2, 29));
    EXPECT_FALSE(is_real_date(2025, 2, 29));
    EXPECT_FALSE(is_real_date(2100, 2, 29));
    EXPECT_TRUE(is_real_date(2000, 2, 29));
    EXPECT_EQ(date_tag_from_filename("b_20240229.csv", fixed_today()), "2024_02_29");
}

TEST(OutputPaths, PrefixTagAndSheetSuffix) {
    const auto p = make_output_paths("out", "transformed_factor_betas", "2025_07_07");
    EXPECT_EQ(p.transformed.filename().string(),
              "transformed_factor_betas_2025_07_07_TransformedBetas.csv");
    EXPECT_EQ(p.standardized.filename().string(),
              "transformed_factor_betas_2025_07_07_StandardizedBetas.csv");
    EXPECT_EQ(p.transformed.parent_path().string(), "out");
}
