/// @file src/ensemble/scorer.cpp
/// @brief Scorer — ε-floored log-loss, bounded score and accuracy.

#include "rfmc/scorer.hpp"
#include "rfmc/classifier.hpp"
#include "rfmc/errors.hpp"
#include "rfmc/labels.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace rfmc::ensemble {

// ─── Score ────────────────────────────────────────────────────────────────────

std::string Score::to_string() const {
    return fmt::format("Score={:.4f}  LogLoss={:.4f}  Accuracy={:.2f}%",
                       bounded_score, log_loss, accuracy * 100.0);
}

// ─── Scorer — validation ──────────────────────────────────────────────────────

void Scorer::check_dimensions(const LabelVector& true_labels,
                              const ProbabilityMatrix& predicted,
                              std::size_t num_classes) {
    if (true_labels.empty()) {
        throw EmptySource("no labels to score");
    }
    if (true_labels.size() != static_cast<std::size_t>(predicted.rows())) {
        throw DimensionMismatch(fmt::format(
            "{} labels but {} prediction rows",
            true_labels.size(), predicted.rows()));
    }
    if (static_cast<std::size_t>(predicted.cols()) != num_classes) {
        throw DimensionMismatch(fmt::format(
            "prediction has {} class columns, expected {}",
            predicted.cols(), num_classes));
    }
    for (std::size_t m = 0; m < true_labels.size(); ++m) {
        const int y = true_labels[m];
        if (y < 0 || static_cast<std::size_t>(y) >= num_classes) {
            throw DimensionMismatch(fmt::format(
                "label {} at index {} outside [0, {})", y, m, num_classes));
        }
    }
    model::validate_probabilities(predicted);
}

// ─── Scorer — metrics ─────────────────────────────────────────────────────────

double Scorer::log_loss(const LabelVector& true_labels,
                        const ProbabilityMatrix& predicted,
                        std::size_t num_classes) {
    check_dimensions(true_labels, predicted, num_classes);

    double total = 0.0;
    for (std::size_t m = 0; m < true_labels.size(); ++m) {
        const double p = predicted(static_cast<Eigen::Index>(m), true_labels[m]);
        total -= std::log(std::max(p, constants::LOG_LOSS_EPSILON));
    }
    return total / static_cast<double>(true_labels.size());
}

double Scorer::bounded_score(double log_loss) noexcept {
    return constants::SCORE_SCALE / (1.0 + log_loss);
}

double Scorer::accuracy(const LabelVector& true_labels,
                        const ProbabilityMatrix& predicted,
                        std::size_t num_classes) {
    check_dimensions(true_labels, predicted, num_classes);

    const LabelVector hits = model::argmax(predicted);
    std::size_t correct = 0;
    for (std::size_t m = 0; m < true_labels.size(); ++m) {
        if (hits[m] == true_labels[m]) {
            ++correct;
        }
    }
    return static_cast<double>(correct) / static_cast<double>(true_labels.size());
}

Score Scorer::score(const LabelVector& true_labels,
                    const ProbabilityMatrix& predicted,
                    std::size_t num_classes) {
    const double loss = log_loss(true_labels, predicted, num_classes);
    return Score{
        .bounded_score = bounded_score(loss),
        .log_loss      = loss,
        .accuracy      = accuracy(true_labels, predicted, num_classes),
    };
}

}  // namespace rfmc::ensemble
