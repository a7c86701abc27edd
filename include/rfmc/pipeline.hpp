#pragma once

/// @file include/rfmc/pipeline.hpp
/// @brief Pipeline — end-to-end orchestration of the representation ensemble.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Wire the core stages into one run:
///   class sources → SignalRepository → Normalizer →
///   make_representations (IQ, FFT, AP) → split_dataset →
///   3 × ClassifierPort (fit + predict, in parallel) →
///   Scorer per representation → Ensembler (geometric and arithmetic) →
///   Scorer per ensemble → PipelineReport
///
/// ## Usage
/// ```cpp
/// auto sources = SyntheticSource::generate(SyntheticConfig{});
/// ClassifierSet models = ClassifierSet::make<MomentSoftmaxClassifier>();
/// Pipeline pipeline;
/// PipelineReport report = pipeline.run(sources, models);
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Concurrency
/// The three fit/predict jobs are independent and run on their own threads
/// (std::async). All three are joined before ensembling; if any job threw,
/// the first failure in IQ, FFT, AP order is rethrown after every job has
/// finished.
///
/// ## Guarantees
/// - Input sources and classifiers are only read / trained, never replaced
/// - No process-wide state: every run is fully described by its arguments
/// - Progress lines go to stderr only when `PipelineConfig::verbose` is set

#include "rfmc/classifier.hpp"
#include "rfmc/constants.hpp"
#include "rfmc/ensembler.hpp"
#include "rfmc/normalizer.hpp"
#include "rfmc/scorer.hpp"
#include "rfmc/signal_repository.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace rfmc::core {

// ─── PipelineConfig ───────────────────────────────────────────────────────────

/// Configuration parameters for one pipeline run.
struct PipelineConfig {
    /// Row-wise normalization applied to the raw IQ batch.
    dsp::NormalizerConfig normalizer{};

    /// Fraction of samples held out for scoring.
    double test_fraction = constants::DEFAULT_TEST_FRACTION;

    /// Seed of the shared train/test shuffle.
    std::uint64_t seed = constants::DEFAULT_SPLIT_SEED;

    /// Ensemble reported as the headline result.
    ensemble::BagMethod bag_method = ensemble::BagMethod::Geometric;

    /// Hyper-parameters forwarded to every ClassifierPort::fit.
    model::TrainConfig train{};

    /// If true, emit per-stage progress to stderr.
    bool verbose = false;
};

// ─── ClassifierSet ────────────────────────────────────────────────────────────

/// One classifier per representation.
struct ClassifierSet {
    std::unique_ptr<model::ClassifierPort> iq;
    std::unique_ptr<model::ClassifierPort> fft;
    std::unique_ptr<model::ClassifierPort> ap;

    /// Classifier responsible for `r`. Null if unset.
    [[nodiscard]] model::ClassifierPort* get(Representation r) const noexcept;

    /// Three default-constructed instances of `T`.
    template <typename T>
    [[nodiscard]] static ClassifierSet make() {
        return ClassifierSet{
            .iq  = std::make_unique<T>(),
            .fft = std::make_unique<T>(),
            .ap  = std::make_unique<T>(),
        };
    }
};

// ─── Report ───────────────────────────────────────────────────────────────────

/// Outcome for one representation's classifier.
struct MemberResult {
    Representation           representation = Representation::IQ;
    model::TrainingHistory   history;     ///< Loss per epoch from fit()
    ProbabilityMatrix        prediction;  ///< (test_size, num_classes)
    ensemble::Score          score;       ///< Against the test labels
};

/// Final comparative report of a run.
struct PipelineReport {
    std::array<MemberResult, 3> members;     ///< IQ, FFT, AP in that order
    ensemble::Score             geometric;   ///< Geometric-bagged ensemble
    ensemble::Score             arithmetic;  ///< Arithmetic-bagged ensemble
    ensemble::BagMethod         selected = ensemble::BagMethod::Geometric;  ///< Headline bagging method
    ProbabilityMatrix           ensemble_prediction;  ///< Bagged with `selected`
    LabelVector                 test_labels;
    std::size_t                 train_size  = 0;
    std::size_t                 test_size   = 0;
    std::size_t                 num_classes = 0;

    /// Score of the `selected` ensemble.
    [[nodiscard]] const ensemble::Score& ensemble_score() const noexcept;

    /// Result for representation `r`.
    [[nodiscard]] const MemberResult& member(Representation r) const noexcept;

    /// Formatted comparison table.
    [[nodiscard]] std::string to_string() const;
};

// ─── Pipeline ─────────────────────────────────────────────────────────────────

class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = PipelineConfig{});

    /// Load `sources`, then run as below.
    [[nodiscard]] PipelineReport run(std::span<const data::ClassSource> sources,
                                     ClassifierSet& classifiers) const;

    /// Run every stage after loading on an already labelled batch.
    ///
    /// # Throws
    /// InvalidArgument if a classifier is missing or `dataset.num_classes`
    /// is zero, plus anything a stage or classifier raises.
    [[nodiscard]] PipelineReport run(const data::LabelledBatch& dataset,
                                     ClassifierSet& classifiers) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    /// Write a progress line to stderr when verbose.
    void log(const std::string& message) const;

    PipelineConfig config_;
};

}  // namespace rfmc::core
