/// @file src/ensemble/ensembler.cpp
/// @brief Arithmetic and renormalised (log-domain) geometric bagging.

#include "rfmc/ensembler.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace rfmc::ensemble {

// ─── BagMethod strings ────────────────────────────────────────────────────────

const char* to_string(BagMethod method) noexcept {
    switch (method) {
        case BagMethod::Geometric:  return "geometric";
        case BagMethod::Arithmetic: return "arithmetic";
    }
    return "unknown";
}

std::optional<BagMethod> parse_bag_method(std::string_view text) noexcept {
    if (text == "geometric")  return BagMethod::Geometric;
    if (text == "arithmetic") return BagMethod::Arithmetic;
    return std::nullopt;
}

// ─── check_shapes ─────────────────────────────────────────────────────────────

void Ensembler::check_shapes(std::span<const ProbabilityMatrix> predictions) {
    if (predictions.empty()) {
        throw EmptySource("no predictions to bag");
    }
    const auto rows = predictions.front().rows();
    const auto cols = predictions.front().cols();
    for (std::size_t k = 1; k < predictions.size(); ++k) {
        if (predictions[k].rows() != rows || predictions[k].cols() != cols) {
            throw ShapeMismatch(fmt::format(
                "prediction {} is ({}, {}), prediction 0 is ({}, {})",
                k, predictions[k].rows(), predictions[k].cols(), rows, cols));
        }
    }
}

// ─── arithmetic_mean ──────────────────────────────────────────────────────────

ProbabilityMatrix Ensembler::arithmetic_mean(std::span<const ProbabilityMatrix> predictions) {
    check_shapes(predictions);

    ProbabilityMatrix sum = predictions.front();
    for (std::size_t k = 1; k < predictions.size(); ++k) {
        sum += predictions[k];
    }
    return sum / static_cast<double>(predictions.size());
}

// ─── geometric_mean ───────────────────────────────────────────────────────────

ProbabilityMatrix Ensembler::geometric_mean(std::span<const ProbabilityMatrix> predictions) {
    check_shapes(predictions);

    const double inv_k = 1.0 / static_cast<double>(predictions.size());
    const Eigen::Index rows = predictions.front().rows();
    const Eigen::Index cols = predictions.front().cols();

    // Mean log-probability; -inf marks a class vetoed by an exact zero.
    constexpr double VETO = -std::numeric_limits<double>::infinity();
    Eigen::MatrixXd log_mean = Eigen::MatrixXd::Zero(rows, cols);
    for (Eigen::Index m = 0; m < rows; ++m) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            double acc = 0.0;
            for (const ProbabilityMatrix& p : predictions) {
                if (p(m, c) == 0.0) {
                    acc = VETO;
                    break;
                }
                acc += std::log(p(m, c));
            }
            log_mean(m, c) = (acc == VETO) ? VETO : acc * inv_k;
        }
    }

    ProbabilityMatrix out(rows, cols);
    for (Eigen::Index m = 0; m < rows; ++m) {
        const double peak = log_mean.row(m).maxCoeff();
        if (peak == VETO) {
            // Every class vetoed: no preference survives.
            out.row(m).setConstant(1.0 / static_cast<double>(cols));
            continue;
        }
        for (Eigen::Index c = 0; c < cols; ++c) {
            out(m, c) = (log_mean(m, c) == VETO) ? 0.0 : std::exp(log_mean(m, c) - peak);
        }
        out.row(m) /= out.row(m).sum();
    }
    return out;
}

// ─── bag ──────────────────────────────────────────────────────────────────────

ProbabilityMatrix Ensembler::bag(std::span<const ProbabilityMatrix> predictions,
                                 BagMethod method) {
    switch (method) {
        case BagMethod::Geometric:  return geometric_mean(predictions);
        case BagMethod::Arithmetic: return arithmetic_mean(predictions);
    }
    throw InvalidArgument("unknown bagging method");
}

}  // namespace rfmc::ensemble
