#pragma once

/// @file include/rfmc/labels.hpp
/// @brief Label encoding between integer LabelVectors and classifier matrices.

#include "rfmc/types.hpp"

namespace rfmc::model {

/// One-hot encode: out(n, c) = 1 if labels[n] == c else 0.
///
/// # Throws
/// InvalidArgument if `num_classes` is zero; DimensionMismatch if any label
/// lies outside [0, num_classes).
[[nodiscard]] LabelMatrix onehot(const LabelVector& labels, std::size_t num_classes);

/// Row-wise argmax of a probability matrix. Ties resolve to the lowest class.
[[nodiscard]] LabelVector argmax(const ProbabilityMatrix& probabilities);

}  // namespace rfmc::model
