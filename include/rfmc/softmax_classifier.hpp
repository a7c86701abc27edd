#pragma once

/// @file include/rfmc/softmax_classifier.hpp
/// @brief MomentSoftmaxClassifier — baseline ClassifierPort implementation.
///
/// # Module: Moment Softmax Classifier
///
/// ## Responsibility
/// Provide a small, dependency-free classifier so the full pipeline can be
/// exercised without an external neural network. Any ClassifierPort
/// implementation can replace it.
///
/// ## Model
/// 1. Feature map: for each of the two channels of a sample
///      [ mean(x), stddev(x), mean(|x|), kurtosis(x) ]
///    giving 8 features. Kurtosis is m₄ / σ⁴ and is 0 for a flat channel.
/// 2. Features are standardised with the training-set mean and stddev.
/// 3. Multinomial logistic regression:
///      P = softmax(Z · W + b)
///    trained by full-batch gradient descent on the mean cross-entropy.
///
/// ## Training Loop
/// One gradient step per epoch. The loss recorded for an epoch is the loss
/// before that epoch's update. Training stops early once the loss has not
/// improved by more than EARLY_STOP_MIN_DELTA for `patience` epochs.
///
/// ## Guarantees
/// - Deterministic: weights start at zero, no randomness
/// - predict() rows sum to 1 (softmax)

#include "rfmc/classifier.hpp"

namespace rfmc::model {

class MomentSoftmaxClassifier final : public ClassifierPort {
public:
    /// Feature count per channel (mean, stddev, mean |x|, kurtosis).
    static constexpr std::size_t FEATURES_PER_CHANNEL = 4;

    /// Total feature count per sample.
    static constexpr std::size_t NUM_FEATURES =
        FEATURES_PER_CHANNEL * constants::NUM_CHANNELS;

    MomentSoftmaxClassifier() = default;

    /// # Throws
    /// EmptySource on an empty batch, ShapeMismatch if label rows differ from
    /// the batch size, InvalidArgument for zero classes, zero epochs or a
    /// non-positive learning rate.
    TrainingHistory fit(const SignalBatch& batch,
                        const LabelMatrix& labels,
                        const TrainConfig& config) override;

    /// # Throws
    /// InvalidArgument if called before fit().
    [[nodiscard]] ProbabilityMatrix predict(const SignalBatch& batch) const override;

    [[nodiscard]] bool trained() const noexcept { return weights_.size() > 0; }

    /// Raw (unstandardised) N × NUM_FEATURES feature matrix of `batch`.
    [[nodiscard]] static Eigen::MatrixXd features(const SignalBatch& batch);

private:
    /// Row-wise softmax of Z · W + b, with the row max subtracted first.
    [[nodiscard]] ProbabilityMatrix forward(const Eigen::MatrixXd& z) const;

    Eigen::MatrixXd    weights_;  ///< NUM_FEATURES × C
    Eigen::RowVectorXd bias_;     ///< 1 × C
    Eigen::RowVectorXd mean_;     ///< Feature means from training
    Eigen::RowVectorXd scale_;    ///< Feature stddevs (1 where flat)
};

}  // namespace rfmc::model
