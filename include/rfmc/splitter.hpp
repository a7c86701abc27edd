#pragma once

/// @file include/rfmc/splitter.hpp
/// @brief DatasetSplitter — seeded train/test partition shared by every
///        representation.
///
/// # Module: Dataset Splitter
///
/// ## Responsibility
/// Partition the index range of a dataset into train and test sets, and apply
/// one partition identically to the IQ, FFT and AP batches and to the label
/// vector. Using the same index lists everywhere is what keeps sample n of
/// every representation attached to label n.
///
/// ## Partition Rule
///   test_count = round(N · test_fraction), clamped to [1, N − 1]
///   permutation = Fisher–Yates shuffle of `indices` driven by
///                 std::mt19937_64(seed)
///   test  = permutation[0 .. test_count)
///   train = permutation[test_count .. N)
///
/// The bounded draw inside the shuffle is implemented here rather than via
/// std::uniform_int_distribution, whose output differs between standard
/// library vendors; partitions are identical on every platform.
///
/// ## Errors
/// - InvalidArgument — test_fraction outside the open interval (0, 1)
/// - EmptySource     — fewer than two indices (a side would be empty)
/// - ShapeMismatch   — gather index out of range, or representation /
///                     label counts disagree

#include "rfmc/transform.hpp"
#include "rfmc/types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace rfmc::data {

using IndexVector = std::vector<std::size_t>;

/// A train/test partition of an index range.
struct SplitIndices {
    IndexVector train;
    IndexVector test;
};

class DatasetSplitter {
public:
    /// Partition `indices` into train and test sets.
    ///
    /// # Guarantees
    /// - Deterministic: same indices, fraction and seed → same partition
    /// - train ∪ test == indices, train ∩ test == ∅
    [[nodiscard]] static SplitIndices split(std::span<const std::size_t> indices,
                                            double test_fraction,
                                            std::uint64_t seed);

    /// Convenience overload splitting 0..n-1.
    [[nodiscard]] static SplitIndices split(std::size_t n,
                                            double test_fraction,
                                            std::uint64_t seed);

    /// round(n · test_fraction) clamped to [1, n − 1]; 0 when n < 2.
    [[nodiscard]] static std::size_t test_count(std::size_t n,
                                                double test_fraction) noexcept;

    /// The sequence 0, 1, …, n-1.
    [[nodiscard]] static IndexVector iota(std::size_t n);
};

// ─── Gather helpers ───────────────────────────────────────────────────────────

/// Rows of `batch` at `indices`, in index order.
[[nodiscard]] SignalBatch take(const SignalBatch& batch,
                               std::span<const std::size_t> indices);

/// Entries of `labels` at `indices`, in index order.
[[nodiscard]] LabelVector take(const LabelVector& labels,
                               std::span<const std::size_t> indices);

// ─── Whole-dataset split ──────────────────────────────────────────────────────

/// All representations and labels partitioned by one SplitIndices.
struct DatasetSplit {
    dsp::RepresentationSet train;
    dsp::RepresentationSet test;
    LabelVector            train_labels;
    LabelVector            test_labels;
    SplitIndices           indices;
};

/// Split every member of `reps` and `labels` with the same partition.
///
/// # Throws
/// ShapeMismatch if the three representations and the labels do not all
/// have the same sample count; see DatasetSplitter::split for the rest.
[[nodiscard]] DatasetSplit split_dataset(const dsp::RepresentationSet& reps,
                                         const LabelVector& labels,
                                         double test_fraction,
                                         std::uint64_t seed);

}  // namespace rfmc::data
