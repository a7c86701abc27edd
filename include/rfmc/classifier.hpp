#pragma once

/// @file include/rfmc/classifier.hpp
/// @brief ClassifierPort — the boundary to any per-representation model.
///
/// # Module: Classifier Port
///
/// ## Responsibility
/// Describe the capability the ensemble depends on without fixing how it is
/// implemented. One instance is trained per representation (IQ, FFT, AP);
/// the pipeline only ever sees batches going in and probability matrices
/// coming out.
///
/// ## Contract
/// - `fit(batch, onehot, config)`: train on N samples with an (N, C) one-hot
///   label matrix; returns the per-epoch loss record.
/// - `predict(batch)`: for M samples return an (M, C) row-stochastic matrix.
/// - Persistence of trained state is the implementation's concern.
///
/// ## NOT Responsible For
/// - Network architecture, optimiser or device placement
/// - Thread safety: the pipeline gives each instance to exactly one thread

#include "rfmc/constants.hpp"
#include "rfmc/types.hpp"

#include <cstddef>
#include <vector>

namespace rfmc::model {

/// Training hyper-parameters handed to ClassifierPort::fit.
struct TrainConfig {
    std::size_t epochs        = constants::DEFAULT_EPOCHS;
    std::size_t patience      = constants::DEFAULT_PATIENCE;  ///< 0 disables early stop
    double      learning_rate = constants::DEFAULT_LEARNING_RATE;
};

/// Per-classifier metrics record (loss per epoch).
struct TrainingHistory {
    std::vector<double> loss;  ///< Training loss after each epoch

    [[nodiscard]] std::size_t epochs_run() const noexcept { return loss.size(); }

    /// Index of the lowest training loss. 0 for an empty history.
    [[nodiscard]] std::size_t best_epoch() const noexcept;

    /// Last recorded training loss, 0.0 for an empty history.
    [[nodiscard]] double final_loss() const noexcept;
};

/// Abstract classifier over one signal representation.
class ClassifierPort {
public:
    virtual ~ClassifierPort() = default;

    /// Train on `batch` with one-hot `labels` (rows aligned with the batch).
    virtual TrainingHistory fit(const SignalBatch& batch,
                                const LabelMatrix& labels,
                                const TrainConfig& config) = 0;

    /// Class probabilities for every sample of `batch`.
    [[nodiscard]] virtual ProbabilityMatrix predict(const SignalBatch& batch) const = 0;
};

/// Check that every row of `p` is a distribution over its columns.
///
/// # Throws
/// InvalidProbability on a non-finite entry, an entry outside [0, 1], or a
/// row whose sum differs from 1 by more than PROBABILITY_SUM_TOLERANCE.
void validate_probabilities(const ProbabilityMatrix& p);

/// Check a prediction against the shape the caller expects, then its values.
///
/// # Throws
/// ShapeMismatch unless `p` is exactly (rows, classes); InvalidProbability
/// as for validate_probabilities().
void validate_prediction(const ProbabilityMatrix& p,
                         std::size_t rows,
                         std::size_t classes);

}  // namespace rfmc::model
