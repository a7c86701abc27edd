#pragma once

/// @file include/rfmc/normalizer.hpp
/// @brief Normalizer — row-wise rescaling of a SignalBatch.
///
/// # Module: Normalizer
///
/// ## Responsibility
/// Rescale every sample of an IQ batch by its own norm before it reaches the
/// representation transforms, so that amplitude differences between samples
/// do not bias the FFT and AP views.
///
/// ## Norms
/// For a row x (the whole 2L sample, or one length-L channel):
///   l1:  x / Σ|xᵢ|
///   l2:  x / √(Σxᵢ²)
///   max: x / max|xᵢ|
///
/// ## Scope
/// - Sample  (default): the 2L values of a sample share one norm, preserving
///   the I/Q ratio.
/// - Channel: I and Q are divided by their own norms.
///
/// ## Edge Cases
/// - Zero norm (all-zero row): throws DegenerateSignal naming the sample.
///   Finite rows near the overflow or underflow limits are scaled, not
///   rejected.
///   The output never contains NaN or Inf.
/// - Non-finite input values: throws DegenerateSignal.
/// - Empty batch: returns an empty batch of the same length.
///
/// ## Guarantees
/// - Stateless: normalize() is const and safe to call concurrently
/// - Input batch is never modified

#include "rfmc/types.hpp"

#include <optional>
#include <string_view>

namespace rfmc::dsp {

/// Row norm used by the Normalizer.
enum class NormKind {
    L1,
    L2,
    Max,
};

/// Granularity at which the norm is computed.
enum class NormScope {
    Sample,
    Channel,
};

/// "l1", "l2" or "max".
[[nodiscard]] const char* to_string(NormKind kind) noexcept;

/// Parse "l1" / "l2" / "max". Returns `nullopt` for anything else.
[[nodiscard]] std::optional<NormKind> parse_norm_kind(std::string_view text) noexcept;

/// Configuration for the Normalizer.
struct NormalizerConfig {
    NormKind  norm  = NormKind::L2;
    NormScope scope = NormScope::Sample;
};

class Normalizer {
public:
    explicit Normalizer(NormalizerConfig config = NormalizerConfig{}) noexcept;

    /// Return a normalized copy of `batch`.
    ///
    /// # Throws
    /// DegenerateSignal on a zero-norm or non-finite row.
    [[nodiscard]] SignalBatch normalize(const SignalBatch& batch) const;

    /// Norm of `values` under `kind` (l2 via stableNorm). 0.0 when empty.
    [[nodiscard]] static double norm(const Eigen::Ref<const Eigen::RowVectorXd>& values,
                                     NormKind kind);

    [[nodiscard]] const NormalizerConfig& config() const noexcept { return config_; }

private:
    NormalizerConfig config_;
};

}  // namespace rfmc::dsp
