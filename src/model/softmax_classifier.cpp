/// @file src/model/softmax_classifier.cpp
/// @brief MomentSoftmaxClassifier — moment features + multinomial logistic
///        regression trained by full-batch gradient descent.

#include "rfmc/softmax_classifier.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace rfmc::model {

// ─── features ─────────────────────────────────────────────────────────────────

Eigen::MatrixXd MomentSoftmaxClassifier::features(const SignalBatch& batch) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(batch.size()),
                        static_cast<Eigen::Index>(NUM_FEATURES));

    for (std::size_t n = 0; n < batch.size(); ++n) {
        for (std::size_t c = 0; c < constants::NUM_CHANNELS; ++c) {
            const auto x = batch.channel(n, c);
            const double mu  = x.mean();
            const double var = (x.array() - mu).square().mean();
            const double m4  = (x.array() - mu).square().square().mean();
            const double sd  = std::sqrt(var);

            // Flat channel: kurtosis undefined.
            const double kurt = (sd < constants::FLAT_STDDEV_THRESHOLD)
                                    ? 0.0 : m4 / (var * var);

            const auto row = static_cast<Eigen::Index>(n);
            const auto col = static_cast<Eigen::Index>(c * FEATURES_PER_CHANNEL);
            out(row, col + 0) = mu;
            out(row, col + 1) = sd;
            out(row, col + 2) = x.cwiseAbs().mean();
            out(row, col + 3) = kurt;
        }
    }
    return out;
}

// ─── forward ──────────────────────────────────────────────────────────────────

ProbabilityMatrix MomentSoftmaxClassifier::forward(const Eigen::MatrixXd& z) const {
    Eigen::MatrixXd logits = z * weights_;
    logits.rowwise() += bias_;

    for (Eigen::Index m = 0; m < logits.rows(); ++m) {
        // Subtract the row max so exp() cannot overflow.
        const double peak = logits.row(m).maxCoeff();
        logits.row(m) = (logits.row(m).array() - peak).exp().matrix();
        logits.row(m) /= logits.row(m).sum();
    }
    return logits;
}

// ─── fit ──────────────────────────────────────────────────────────────────────

TrainingHistory MomentSoftmaxClassifier::fit(const SignalBatch& batch,
                                             const LabelMatrix& labels,
                                             const TrainConfig& config) {
    if (batch.empty()) {
        throw EmptySource("cannot fit on an empty batch");
    }
    if (static_cast<std::size_t>(labels.rows()) != batch.size()) {
        throw ShapeMismatch(fmt::format(
            "{} label rows for {} signals", labels.rows(), batch.size()));
    }
    if (labels.cols() == 0) {
        throw InvalidArgument("label matrix has no class columns");
    }
    if (config.epochs == 0) {
        throw InvalidArgument("epochs must be positive");
    }
    if (!(config.learning_rate > 0.0)) {
        throw InvalidArgument(fmt::format(
            "learning rate {} must be positive", config.learning_rate));
    }

    // ── Standardise features ──────────────────────────────────────────────────
    const Eigen::MatrixXd raw = features(batch);
    mean_ = raw.colwise().mean();
    const Eigen::MatrixXd centred = raw.rowwise() - mean_;
    scale_ = (centred.array().square().colwise().mean()).sqrt().matrix();
    for (Eigen::Index f = 0; f < scale_.size(); ++f) {
        if (scale_(f) < constants::FLAT_STDDEV_THRESHOLD) {
            scale_(f) = 1.0;
        }
    }
    const Eigen::MatrixXd z = (centred.array().rowwise() / scale_.array()).matrix();

    // ── Gradient descent ──────────────────────────────────────────────────────
    const auto num_classes = labels.cols();
    weights_ = Eigen::MatrixXd::Zero(z.cols(), num_classes);
    bias_    = Eigen::RowVectorXd::Zero(num_classes);

    const double inv_n = 1.0 / static_cast<double>(batch.size());
    TrainingHistory history;
    history.loss.reserve(config.epochs);

    double      best = std::numeric_limits<double>::infinity();
    std::size_t wait = 0;

    for (std::size_t epoch = 0; epoch < config.epochs; ++epoch) {
        const ProbabilityMatrix p = forward(z);

        // Mean cross-entropy of the true class.
        const Eigen::ArrayXXd clipped = p.array().max(constants::LOG_LOSS_EPSILON);
        const double loss = -(labels.array() * clipped.log()).sum() * inv_n;
        history.loss.push_back(loss);

        const Eigen::MatrixXd grad = (p - labels) * inv_n;
        weights_ -= config.learning_rate * (z.transpose() * grad);
        bias_    -= config.learning_rate * grad.colwise().sum();

        if (loss < best - constants::EARLY_STOP_MIN_DELTA) {
            best = loss;
            wait = 0;
        } else if (config.patience > 0 && ++wait >= config.patience) {
            break;
        }
    }

    return history;
}

// ─── predict ──────────────────────────────────────────────────────────────────

ProbabilityMatrix MomentSoftmaxClassifier::predict(const SignalBatch& batch) const {
    if (!trained()) {
        throw InvalidArgument("classifier has not been trained");
    }
    if (batch.empty()) {
        return ProbabilityMatrix(0, weights_.cols());
    }
    const Eigen::MatrixXd centred = features(batch).rowwise() - mean_;
    const Eigen::MatrixXd z = (centred.array().rowwise() / scale_.array()).matrix();
    return forward(z);
}

}  // namespace rfmc::model
