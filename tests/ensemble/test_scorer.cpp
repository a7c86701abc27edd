/// @file tests/ensemble/test_scorer.cpp
/// @brief Unit tests for Scorer (log-loss, bounded score, accuracy).
///
/// Known values:
///   perfect one-hot            → log-loss 0,      score 100
///   uniform over 3 classes     → log-loss ln 3,   score 100 / (1 + ln 3) ≈ 47.65
///   true-class probability 0   → log-loss −ln 1e-15 ≈ 34.54 (ε floor)
///
/// Rows that are not distributions (NaN, Inf, entries outside [0, 1], sum ≠ 1)
/// raise InvalidProbability rather than producing a score outside (0, 100].

#include <gtest/gtest.h>
#include "rfmc/errors.hpp"
#include "rfmc/scorer.hpp"

#include <cmath>
#include <limits>

using namespace rfmc;
using namespace rfmc::ensemble;

TEST(Scorer, PerfectPredictionScoresHundred) {
    const LabelVector y = {0, 2, 1};
    ProbabilityMatrix p(3, 3);
    p << 1, 0, 0,
         0, 0, 1,
         0, 1, 0;
    const Score s = Scorer::score(y, p, 3);
    EXPECT_DOUBLE_EQ(s.log_loss, 0.0);
    EXPECT_DOUBLE_EQ(s.bounded_score, 100.0);
    EXPECT_DOUBLE_EQ(s.accuracy, 1.0);
}

TEST(Scorer, UniformOverThreeClasses) {
    const LabelVector y = {0, 1, 2, 1};
    const ProbabilityMatrix p = ProbabilityMatrix::Constant(4, 3, 1.0 / 3.0);
    const Score s = Scorer::score(y, p, 3);
    EXPECT_NEAR(s.log_loss, std::log(3.0), 1e-12);
    EXPECT_NEAR(s.log_loss, 1.0986, 1e-4);
    EXPECT_NEAR(s.bounded_score, 100.0 / (1.0 + std::log(3.0)), 1e-9);
    EXPECT_NEAR(s.bounded_score, 47.65, 0.01);
}

TEST(Scorer, ZeroTrueProbabilityIsFlooredAtEpsilon) {
    ProbabilityMatrix p(1, 2);
    p << 1.0, 0.0;
    const double loss = Scorer::log_loss(LabelVector{1}, p, 2);
    EXPECT_NEAR(loss, -std::log(1e-15), 1e-9);
    EXPECT_TRUE(std::isfinite(loss));
}

TEST(Scorer, MeanOverRows) {
    ProbabilityMatrix p(2, 2);
    p << 0.5, 0.5,
         0.2, 0.8;
    const double loss = Scorer::log_loss(LabelVector{0, 1}, p, 2);
    EXPECT_NEAR(loss, -(std::log(0.5) + std::log(0.8)) / 2.0, 1e-12);
}

TEST(Scorer, BoundedScoreIsMonotone) {
    EXPECT_DOUBLE_EQ(Scorer::bounded_score(0.0), 100.0);
    EXPECT_DOUBLE_EQ(Scorer::bounded_score(1.0), 50.0);
    EXPECT_GT(Scorer::bounded_score(0.1), Scorer::bounded_score(0.2));
    EXPECT_GT(Scorer::bounded_score(1e6), 0.0);
}

TEST(Scorer, AccuracyCountsArgmaxHits) {
    ProbabilityMatrix p(4, 2);
    p << 0.9, 0.1,
         0.4, 0.6,
         0.6, 0.4,
         0.3, 0.7;
    EXPECT_DOUBLE_EQ(Scorer::accuracy(LabelVector{0, 1, 1, 1}, p, 2), 0.75);
}

TEST(Scorer, RowCountMismatch) {
    const ProbabilityMatrix p = ProbabilityMatrix::Constant(2, 3, 1.0 / 3.0);
    EXPECT_THROW((void)Scorer::score(LabelVector{0, 1, 2}, p, 3), DimensionMismatch);
}

TEST(Scorer, ColumnCountMismatch) {
    const ProbabilityMatrix p = ProbabilityMatrix::Constant(2, 2, 0.5);
    EXPECT_THROW((void)Scorer::score(LabelVector{0, 1}, p, 3), DimensionMismatch);
}

TEST(Scorer, LabelOutOfRange) {
    const ProbabilityMatrix p = ProbabilityMatrix::Constant(2, 3, 1.0 / 3.0);
    EXPECT_THROW((void)Scorer::log_loss(LabelVector{0, 3}, p, 3), DimensionMismatch);
    EXPECT_THROW((void)Scorer::accuracy(LabelVector{-1, 0}, p, 3), DimensionMismatch);
}

TEST(Scorer, EmptyLabelsRejected) {
    EXPECT_THROW((void)Scorer::score(LabelVector{}, ProbabilityMatrix(0, 3), 3), EmptySource);
}

// ─── Invalid probabilities ───────────────────────────────────────────────────

TEST(Scorer, NaNEntryRejected) {
    ProbabilityMatrix p(1, 2);
    p << std::numeric_limits<double>::quiet_NaN(), 0.5;
    EXPECT_THROW((void)Scorer::score(LabelVector{0}, p, 2), InvalidProbability);
    EXPECT_THROW((void)Scorer::log_loss(LabelVector{1}, p, 2), InvalidProbability);
}

TEST(Scorer, InfiniteEntryRejected) {
    ProbabilityMatrix p(1, 2);
    p << std::numeric_limits<double>::infinity(), 0.0;
    EXPECT_THROW((void)Scorer::score(LabelVector{0}, p, 2), InvalidProbability);
}

TEST(Scorer, EntryOutsideUnitIntervalRejected) {
    // Would give a negative log-loss and a score above 100.
    ProbabilityMatrix p(1, 2);
    p << 2.0, -1.0;
    EXPECT_THROW((void)Scorer::score(LabelVector{0}, p, 2), InvalidProbability);
    EXPECT_THROW((void)Scorer::accuracy(LabelVector{0}, p, 2), InvalidProbability);
}

TEST(Scorer, RowNotSummingToOneRejected) {
    ProbabilityMatrix p(2, 2);
    p << 0.5, 0.5,
         0.5, 0.4;
    EXPECT_THROW((void)Scorer::score(LabelVector{0, 1}, p, 2), InvalidProbability);
}

TEST(Scorer, RowSumWithinToleranceAccepted) {
    ProbabilityMatrix p(1, 3);
    p << 0.1, 0.2, 0.7 + 1e-9;
    const Score s = Scorer::score(LabelVector{2}, p, 3);
    EXPECT_LE(s.bounded_score, 100.0);
    EXPECT_GE(s.log_loss, 0.0);
}

TEST(Score, ToStringMentionsEveryMetric) {
    const Score s{.bounded_score = 47.6598, .log_loss = 1.0986, .accuracy = 0.5};
    const std::string text = s.to_string();
    EXPECT_NE(text.find("47.6598"), std::string::npos);
    EXPECT_NE(text.find("1.0986"), std::string::npos);
    EXPECT_NE(text.find("50.00%"), std::string::npos);
}
