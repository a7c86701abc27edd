#pragma once

/// @file include/rfmc/scorer.hpp
/// @brief Scorer — log-loss and bounded score for a probability matrix.
///
/// # Module: Scorer
///
/// ## Formulas
/// For M samples with true labels yₘ and predictions P (M × C):
///
///   logLoss      = (1/M) · Σₘ −ln(max(P[m, yₘ], ε))      ε = LOG_LOSS_EPSILON
///   boundedScore = 100 / (1 + logLoss)
///   accuracy     = (1/M) · #{m : argmax P[m] = yₘ}
///
/// boundedScore is monotonically decreasing in logLoss and lies in (0, 100]:
///   - perfect prediction (P[m, yₘ] = 1)  → logLoss = 0, score = 100
///   - uniform over 3 classes             → logLoss = ln 3, score ≈ 47.65
///
/// The ε floor keeps a confident wrong prediction finite: a zero probability
/// on the true class costs −ln(1e-15) ≈ 34.54 instead of +∞.
///
/// ## Errors
/// - EmptySource       — no samples
/// - DimensionMismatch — label count ≠ P.rows(), P.cols() ≠ num_classes, or a
///                       label outside [0, num_classes)
/// - InvalidProbability — a non-finite entry, an entry outside [0, 1], or a
///                       row not summing to 1, so the score stays in (0, 100]

#include "rfmc/types.hpp"

#include <string>

namespace rfmc::ensemble {

/// Evaluation of one probability matrix against the true labels.
struct Score {
    double bounded_score = 0.0;  ///< 100 / (1 + log_loss), in (0, 100]
    double log_loss      = 0.0;  ///< Mean cross-entropy of the true class, ≥ 0
    double accuracy      = 0.0;  ///< Fraction of argmax hits, in [0, 1]

    /// Human-readable summary line.
    [[nodiscard]] std::string to_string() const;
};

/// Stateless scoring utilities.
class Scorer {
public:
    /// Score `predicted` against `true_labels` over `num_classes` classes.
    [[nodiscard]] static Score score(const LabelVector& true_labels,
                                     const ProbabilityMatrix& predicted,
                                     std::size_t num_classes);

    /// Mean negative log-likelihood of the true class (ε-floored).
    [[nodiscard]] static double log_loss(const LabelVector& true_labels,
                                         const ProbabilityMatrix& predicted,
                                         std::size_t num_classes);

    /// 100 / (1 + log_loss).
    [[nodiscard]] static double bounded_score(double log_loss) noexcept;

    /// Fraction of rows whose argmax equals the true label.
    [[nodiscard]] static double accuracy(const LabelVector& true_labels,
                                         const ProbabilityMatrix& predicted,
                                         std::size_t num_classes);

private:
    /// Throws unless labels and predictions agree in count and class width and
    /// every prediction row is a distribution.
    static void check_dimensions(const LabelVector& true_labels,
                                 const ProbabilityMatrix& predicted,
                                 std::size_t num_classes);
};

}  // namespace rfmc::ensemble
