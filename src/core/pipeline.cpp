/// @file src/core/pipeline.cpp
/// @brief Pipeline — normalize, represent, split, fan out, bag, score.

#include "rfmc/pipeline.hpp"
#include "rfmc/errors.hpp"
#include "rfmc/labels.hpp"
#include "rfmc/splitter.hpp"
#include "rfmc/transform.hpp"

#include <fmt/format.h>

#include <exception>
#include <future>
#include <utility>
#include <vector>

namespace rfmc::core {

namespace {

/// Index of `r` in report / classifier order.
std::size_t slot(Representation r) noexcept {
    switch (r) {
        case Representation::IQ:  return 0;
        case Representation::FFT: return 1;
        case Representation::AP:  return 2;
    }
    return 0;
}

}  // namespace

// ─── ClassifierSet ────────────────────────────────────────────────────────────

model::ClassifierPort* ClassifierSet::get(Representation r) const noexcept {
    switch (r) {
        case Representation::IQ:  return iq.get();
        case Representation::FFT: return fft.get();
        case Representation::AP:  return ap.get();
    }
    return nullptr;
}

// ─── PipelineReport ───────────────────────────────────────────────────────────

const ensemble::Score& PipelineReport::ensemble_score() const noexcept {
    return selected == ensemble::BagMethod::Geometric ? geometric : arithmetic;
}

const MemberResult& PipelineReport::member(Representation r) const noexcept {
    return members[slot(r)];
}

std::string PipelineReport::to_string() const {
    std::string out = fmt::format(
        "┌──────────────────────────────────────────────────────────────┐\n"
        "│          Representation Ensemble — Side-by-Side              │\n"
        "│  train={:<6d} test={:<6d} classes={:<3d} bag={:<10s}         │\n"
        "├────────────────────┬──────────┬──────────┬──────────┬────────┤\n"
        "│ Model              │  Score   │ LogLoss  │ Accuracy │ Epochs │\n"
        "├────────────────────┼──────────┼──────────┼──────────┼────────┤\n",
        train_size, test_size, num_classes, ensemble::to_string(selected));

    for (const MemberResult& m : members) {
        out += fmt::format(
            "│ {:<18s} │ {:8.4f} │ {:8.4f} │ {:7.2f}% │ {:6d} │\n",
            rfmc::to_string(m.representation), m.score.bounded_score,
            m.score.log_loss, m.score.accuracy * 100.0, m.history.epochs_run());
    }

    out += fmt::format(
        "├────────────────────┼──────────┼──────────┼──────────┼────────┤\n"
        "│ Bagged (geometric) │ {:8.4f} │ {:8.4f} │ {:7.2f}% │      - │\n"
        "│ Bagged (arithmetic)│ {:8.4f} │ {:8.4f} │ {:7.2f}% │      - │\n"
        "└────────────────────┴──────────┴──────────┴──────────┴────────┘",
        geometric.bounded_score, geometric.log_loss, geometric.accuracy * 100.0,
        arithmetic.bounded_score, arithmetic.log_loss, arithmetic.accuracy * 100.0);

    return out;
}

// ─── Pipeline ─────────────────────────────────────────────────────────────────

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config))
{}

void Pipeline::log(const std::string& message) const {
    if (config_.verbose) {
        fmt::print(stderr, "[rfmc] {}\n", message);
    }
}

PipelineReport Pipeline::run(std::span<const data::ClassSource> sources,
                             ClassifierSet& classifiers) const {
    const data::LabelledBatch dataset = data::SignalRepository::load(sources);
    log(fmt::format("loaded {} signals of length {} in {} classes",
                    dataset.signals.size(), dataset.signals.length(),
                    dataset.num_classes));
    return run(dataset, classifiers);
}

PipelineReport Pipeline::run(const data::LabelledBatch& dataset,
                             ClassifierSet& classifiers) const {
    for (Representation r : ALL_REPRESENTATIONS) {
        if (classifiers.get(r) == nullptr) {
            throw InvalidArgument(fmt::format(
                "no classifier supplied for the {} representation", rfmc::to_string(r)));
        }
    }
    if (dataset.num_classes == 0) {
        throw InvalidArgument("dataset declares zero classes");
    }
    if (dataset.labels.size() != dataset.signals.size()) {
        throw ShapeMismatch(fmt::format(
            "{} labels for {} signals", dataset.labels.size(), dataset.signals.size()));
    }
    const std::size_t num_classes = dataset.num_classes;

    // ── Step 1: Normalize ─────────────────────────────────────────────────────
    const dsp::Normalizer normalizer(config_.normalizer);
    const SignalBatch iq = normalizer.normalize(dataset.signals);
    log(fmt::format("normalized with {} norm", dsp::to_string(config_.normalizer.norm)));

    // ── Step 2: Representations ───────────────────────────────────────────────
    const dsp::RepresentationSet reps = dsp::make_representations(iq);
    log("built IQ, FFT and AP representations");

    // ── Step 3: Shared split ──────────────────────────────────────────────────
    const data::DatasetSplit split = data::split_dataset(
        reps, dataset.labels, config_.test_fraction, config_.seed);
    const LabelMatrix train_onehot = model::onehot(split.train_labels, num_classes);
    log(fmt::format("split {} train / {} test (seed {})",
                    split.train_labels.size(), split.test_labels.size(), config_.seed));

    // ── Step 4: Fan out fit + predict ─────────────────────────────────────────
    struct JobResult {
        model::TrainingHistory history;
        ProbabilityMatrix      prediction;
    };

    std::vector<std::future<JobResult>> jobs;
    jobs.reserve(3);
    for (Representation r : ALL_REPRESENTATIONS) {
        model::ClassifierPort* clf = classifiers.get(r);
        const SignalBatch& train = split.train.get(r);
        const SignalBatch& test  = split.test.get(r);
        jobs.push_back(std::async(std::launch::async,
            [this, clf, &train, &test, &train_onehot, num_classes]() {
                JobResult res;
                res.history    = clf->fit(train, train_onehot, config_.train);
                res.prediction = clf->predict(test);
                model::validate_prediction(res.prediction, test.size(), num_classes);
                return res;
            }));
    }

    // Join every job before surfacing a failure.
    std::vector<JobResult>    results(jobs.size());
    std::exception_ptr        failure;
    for (std::size_t k = 0; k < jobs.size(); ++k) {
        try {
            results[k] = jobs[k].get();
        } catch (const std::exception&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    log("all classifiers trained");

    // ── Step 5: Score members ─────────────────────────────────────────────────
    PipelineReport report;
    std::vector<ProbabilityMatrix> predictions;
    predictions.reserve(results.size());

    for (Representation r : ALL_REPRESENTATIONS) {
        JobResult& res = results[slot(r)];
        MemberResult& m = report.members[slot(r)];
        m.representation = r;
        m.score      = ensemble::Scorer::score(split.test_labels, res.prediction, num_classes);
        m.history    = std::move(res.history);
        m.prediction = std::move(res.prediction);
        predictions.push_back(m.prediction);
        log(fmt::format("{}: {}", rfmc::to_string(r), m.score.to_string()));
    }

    // ── Step 6: Bag and score ensembles ───────────────────────────────────────
    const ProbabilityMatrix geo =
        ensemble::Ensembler::bag(predictions, ensemble::BagMethod::Geometric);
    const ProbabilityMatrix arith =
        ensemble::Ensembler::bag(predictions, ensemble::BagMethod::Arithmetic);

    report.geometric   = ensemble::Scorer::score(split.test_labels, geo, num_classes);
    report.arithmetic  = ensemble::Scorer::score(split.test_labels, arith, num_classes);
    report.selected    = config_.bag_method;
    report.ensemble_prediction =
        (config_.bag_method == ensemble::BagMethod::Geometric) ? geo : arith;
    report.test_labels = split.test_labels;
    report.train_size  = split.train_labels.size();
    report.test_size   = split.test_labels.size();
    report.num_classes = num_classes;

    log(fmt::format("ensemble ({}): {}", ensemble::to_string(report.selected),
                    report.ensemble_score().to_string()));
    return report;
}

}  // namespace rfmc::core
