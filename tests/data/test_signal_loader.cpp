/// @file tests/data/test_signal_loader.cpp
/// @brief Unit tests for the CSV SignalLoader.

#include <gtest/gtest.h>
#include "rfmc/data_loader.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace rfmc;
using namespace rfmc::data;

// ─── parse_row ───────────────────────────────────────────────────────────────

TEST(SignalLoader, ParseRowSplitsIThenQ) {
    auto s = SignalLoader::parse_row("1,2,3,4,5,6");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->cols(), 3);
    EXPECT_DOUBLE_EQ((*s)(0, 0), 1.0);
    EXPECT_DOUBLE_EQ((*s)(0, 2), 3.0);
    EXPECT_DOUBLE_EQ((*s)(1, 0), 4.0);
    EXPECT_DOUBLE_EQ((*s)(1, 2), 6.0);
}

TEST(SignalLoader, ParseRowToleratesWhitespaceAndCarriageReturn) {
    auto s = SignalLoader::parse_row("  0.5 , -0.25\r");
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ((*s)(0, 0), 0.5);
    EXPECT_DOUBLE_EQ((*s)(1, 0), -0.25);
}

TEST(SignalLoader, ParseRowRejectsOddCount) {
    EXPECT_FALSE(SignalLoader::parse_row("1,2,3").has_value());
}

TEST(SignalLoader, ParseRowRejectsGarbage) {
    EXPECT_FALSE(SignalLoader::parse_row("1,abc").has_value());
    EXPECT_FALSE(SignalLoader::parse_row("1,2x").has_value());
    EXPECT_FALSE(SignalLoader::parse_row("1,,2,3").has_value());
}

TEST(SignalLoader, ParseRowRejectsNonFinite) {
    EXPECT_FALSE(SignalLoader::parse_row("1,inf").has_value());
    EXPECT_FALSE(SignalLoader::parse_row("nan,1").has_value());
}

TEST(SignalLoader, ParseRowSkipsCommentsAndBlank) {
    EXPECT_FALSE(SignalLoader::parse_row("# I0,I1,Q0,Q1").has_value());
    EXPECT_FALSE(SignalLoader::parse_row("   ").has_value());
}

// ─── parse_csv_string ────────────────────────────────────────────────────────

TEST(SignalLoader, ParseCsvStringSkipsMalformedRows) {
    const std::string csv =
        "# two signals of length 2\n"
        "1,2,3,4\n"
        "bad,row,here,!\n"
        "5,6,7,8\n";
    const ClassSource signals = SignalLoader::parse_csv_string(csv);
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_DOUBLE_EQ(signals[1](0, 0), 5.0);
    EXPECT_DOUBLE_EQ(signals[1](1, 1), 8.0);
}

TEST(SignalLoader, ParseCsvStringKeepsFirstWidth) {
    const std::string csv =
        "1,2,3,4\n"
        "1,2,3,4,5,6\n"
        "9,9,9,9";
    const ClassSource signals = SignalLoader::parse_csv_string(csv);
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals[0].cols(), 2);
    EXPECT_EQ(signals[1].cols(), 2);
    EXPECT_DOUBLE_EQ(signals[1](0, 0), 9.0);
}

TEST(SignalLoader, ParseCsvStringEmpty) {
    EXPECT_TRUE(SignalLoader::parse_csv_string("").empty());
    EXPECT_TRUE(SignalLoader::parse_csv_string("# nothing\n\n").empty());
}

// ─── load_csv ────────────────────────────────────────────────────────────────

TEST(SignalLoader, LoadCsvMissingFile) {
    EXPECT_FALSE(SignalLoader::load_csv("/nonexistent/rfmc_signals.csv").has_value());
}

TEST(SignalLoader, LoadCsvReadsFile) {
    const std::string path = ::testing::TempDir() + "rfmc_loader_test.csv";
    {
        std::ofstream out(path);
        out << "# class 0\n0.1,0.2,0.3,0.4\n-0.1,-0.2,-0.3,-0.4\n";
    }
    const auto signals = SignalLoader::load_csv(path);
    std::remove(path.c_str());

    ASSERT_TRUE(signals.has_value());
    ASSERT_EQ(signals->size(), 2u);
    EXPECT_DOUBLE_EQ((*signals)[1](1, 1), -0.4);
}
