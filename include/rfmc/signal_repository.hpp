#pragma once

/// @file include/rfmc/signal_repository.hpp
/// @brief SignalRepository — concatenates per-class sources into one labelled
///        batch.
///
/// # Module: Signal Repository
///
/// ## Responsibility
/// Turn an ordered list of per-class signal sources into a single SignalBatch
/// plus a LabelVector. Class i contributes its Nᵢ signals in source order and
/// label i is repeated exactly Nᵢ times, so label n always describes signal n.
///
/// ## Errors
/// - EmptySource   — no sources, or a class source with zero signals
/// - ShapeMismatch — a signal whose length differs from the first signal
///
/// ## NOT Responsible For
/// - Reading files (see data_loader.hpp)
/// - Normalization (see normalizer.hpp)

#include "rfmc/types.hpp"

#include <span>
#include <vector>

namespace rfmc::data {

/// One class's signals, each a 2 × L array.
using ClassSource = std::vector<Signal>;

/// A batch with its positionally aligned labels.
struct LabelledBatch {
    SignalBatch signals;
    LabelVector labels;

    /// Number of classes the batch was built from.
    std::size_t num_classes = 0;
};

class SignalRepository {
public:
    /// Concatenate `sources` into one labelled batch.
    ///
    /// # Returns
    /// LabelledBatch with `signals.size() == labels.size() == ΣNᵢ` and
    /// `num_classes == sources.size()`.
    [[nodiscard]] static LabelledBatch load(std::span<const ClassSource> sources);
};

}  // namespace rfmc::data
