/// @file src/model/classifier.cpp
/// @brief TrainingHistory accessors and prediction shape validation.

#include "rfmc/classifier.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace rfmc::model {

// ─── TrainingHistory ──────────────────────────────────────────────────────────

std::size_t TrainingHistory::best_epoch() const noexcept {
    if (loss.empty()) {
        return 0;
    }
    const auto it = std::min_element(loss.begin(), loss.end());
    return static_cast<std::size_t>(std::distance(loss.begin(), it));
}

double TrainingHistory::final_loss() const noexcept {
    return loss.empty() ? 0.0 : loss.back();
}

// ─── validate_probabilities ───────────────────────────────────────────────────

void validate_probabilities(const ProbabilityMatrix& p) {
    for (Eigen::Index m = 0; m < p.rows(); ++m) {
        for (Eigen::Index c = 0; c < p.cols(); ++c) {
            const double v = p(m, c);
            if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
                throw InvalidProbability(fmt::format(
                    "entry ({}, {}) = {} is not a probability", m, c, v));
            }
        }
        const double total = p.row(m).sum();
        if (std::abs(total - 1.0) > constants::PROBABILITY_SUM_TOLERANCE) {
            throw InvalidProbability(fmt::format(
                "row {} sums to {}, expected 1", m, total));
        }
    }
}

// ─── validate_prediction ──────────────────────────────────────────────────────

void validate_prediction(const ProbabilityMatrix& p,
                         std::size_t rows,
                         std::size_t classes) {
    if (static_cast<std::size_t>(p.rows()) != rows ||
        static_cast<std::size_t>(p.cols()) != classes) {
        throw ShapeMismatch(fmt::format(
            "classifier returned a ({}, {}) matrix, expected ({}, {})",
            p.rows(), p.cols(), rows, classes));
    }
    validate_probabilities(p);
}

}  // namespace rfmc::model
