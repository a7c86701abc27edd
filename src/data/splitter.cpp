/// @file src/data/splitter.cpp
/// @brief DatasetSplitter — seeded Fisher–Yates partition and gather helpers.

#include "rfmc/splitter.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <utility>

namespace rfmc::data {

namespace {

/// Uniform draw in [0, bound) by rejection sampling. Precondition: bound > 0.
std::uint64_t draw_below(std::mt19937_64& rng, std::uint64_t bound) {
    constexpr std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    // Largest multiple of `bound` representable; draws above it are biased.
    const std::uint64_t limit = max - (max % bound);
    std::uint64_t x = rng();
    while (x >= limit) {
        x = rng();
    }
    return x % bound;
}

}  // namespace

// ─── DatasetSplitter ──────────────────────────────────────────────────────────

std::size_t DatasetSplitter::test_count(std::size_t n, double test_fraction) noexcept {
    if (n < 2) {
        return 0;
    }
    const auto raw = static_cast<std::size_t>(
        std::llround(static_cast<double>(n) * test_fraction));
    return std::clamp<std::size_t>(raw, 1, n - 1);
}

IndexVector DatasetSplitter::iota(std::size_t n) {
    IndexVector v(n);
    std::iota(v.begin(), v.end(), std::size_t{0});
    return v;
}

SplitIndices DatasetSplitter::split(std::span<const std::size_t> indices,
                                    double test_fraction,
                                    std::uint64_t seed) {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw InvalidArgument(fmt::format(
            "test fraction {} outside (0, 1)", test_fraction));
    }
    if (indices.size() < 2) {
        throw EmptySource(fmt::format(
            "cannot split {} indices into non-empty train and test sets",
            indices.size()));
    }

    IndexVector perm(indices.begin(), indices.end());
    std::mt19937_64 rng(seed);
    for (std::size_t i = perm.size() - 1; i > 0; --i) {
        const auto j = static_cast<std::size_t>(draw_below(rng, i + 1));
        std::swap(perm[i], perm[j]);
    }

    const std::size_t n_test = test_count(perm.size(), test_fraction);
    const auto cut = perm.begin() + static_cast<std::ptrdiff_t>(n_test);

    return SplitIndices{
        .train = IndexVector(cut, perm.end()),
        .test  = IndexVector(perm.begin(), cut),
    };
}

SplitIndices DatasetSplitter::split(std::size_t n,
                                    double test_fraction,
                                    std::uint64_t seed) {
    const IndexVector all = iota(n);
    return split(all, test_fraction, seed);
}

// ─── take ─────────────────────────────────────────────────────────────────────

SignalBatch take(const SignalBatch& batch, std::span<const std::size_t> indices) {
    if (batch.length() == 0) {
        if (!indices.empty()) {
            throw ShapeMismatch("cannot gather rows from an empty batch");
        }
        return batch;
    }

    RowMatrix rows(static_cast<Eigen::Index>(indices.size()), batch.data().cols());
    for (std::size_t k = 0; k < indices.size(); ++k) {
        if (indices[k] >= batch.size()) {
            throw ShapeMismatch(fmt::format(
                "index {} out of range for batch of {} signals",
                indices[k], batch.size()));
        }
        rows.row(static_cast<Eigen::Index>(k)) =
            batch.data().row(static_cast<Eigen::Index>(indices[k]));
    }
    return SignalBatch(std::move(rows), batch.length());
}

LabelVector take(const LabelVector& labels, std::span<const std::size_t> indices) {
    LabelVector out;
    out.reserve(indices.size());
    for (std::size_t idx : indices) {
        if (idx >= labels.size()) {
            throw ShapeMismatch(fmt::format(
                "index {} out of range for {} labels", idx, labels.size()));
        }
        out.push_back(labels[idx]);
    }
    return out;
}

// ─── split_dataset ────────────────────────────────────────────────────────────

DatasetSplit split_dataset(const dsp::RepresentationSet& reps,
                           const LabelVector& labels,
                           double test_fraction,
                           std::uint64_t seed) {
    const std::size_t n = labels.size();
    for (Representation r : ALL_REPRESENTATIONS) {
        const SignalBatch& batch = reps.get(r);
        if (batch.size() != n) {
            throw ShapeMismatch(fmt::format(
                "{} batch has {} signals but there are {} labels",
                to_string(r), batch.size(), n));
        }
    }
    if (reps.fft.length() != reps.iq.length() || reps.ap.length() != reps.iq.length()) {
        throw ShapeMismatch("representations disagree on signal length");
    }

    SplitIndices parts = DatasetSplitter::split(n, test_fraction, seed);

    DatasetSplit out{
        .train = {
            .iq  = take(reps.iq,  parts.train),
            .fft = take(reps.fft, parts.train),
            .ap  = take(reps.ap,  parts.train),
        },
        .test = {
            .iq  = take(reps.iq,  parts.test),
            .fft = take(reps.fft, parts.test),
            .ap  = take(reps.ap,  parts.test),
        },
        .train_labels = take(labels, parts.train),
        .test_labels  = take(labels, parts.test),
        .indices      = {},
    };
    out.indices = std::move(parts);
    return out;
}

}  // namespace rfmc::data
