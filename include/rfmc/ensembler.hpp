#pragma once

/// @file include/rfmc/ensembler.hpp
/// @brief Ensembler — bagging of per-representation probability matrices.
///
/// # Module: Ensembler
///
/// ## Responsibility
/// Combine K probability matrices of identical shape (M, C), one per
/// trained classifier, into a single (M, C) prediction.
///
/// ## Methods
/// - Arithmetic:  out[m, c] = (1/K) · Σₖ Pₖ[m, c]
///   Rows stay row-stochastic because every input row sums to 1.
///
/// - Geometric:   g[m, c]   = (Πₖ Pₖ[m, c])^(1/K)
///                out[m, c] = g[m, c] / Σ_c' g[m, c']
///   The geometric mean of distributions is not itself a distribution, so
///   each row is renormalised. g is evaluated as exp((1/K) · Σₖ ln Pₖ[m, c])
///   shifted by the row maximum, so small but nonzero probabilities never
///   underflow into a veto.
///
/// ## Geometric Veto
/// A single classifier assigning exactly 0 to a class forces that class to 0
/// in the geometric ensemble, however confident the others are:
///   [0.0, 1.0] ⊕ [0.9, 0.1]  →  geometric  [0.0, 1.0]
///                             →  arithmetic [0.45, 0.55]
/// If every class of a row is vetoed (row sum 0), the row becomes the uniform
/// distribution 1/C.
///
/// ## Errors
/// - EmptySource   — no matrices
/// - ShapeMismatch — matrices of differing shape

#include "rfmc/types.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace rfmc::ensemble {

/// Aggregation rule used by Ensembler::bag.
enum class BagMethod {
    Geometric,
    Arithmetic,
};

/// "geometric" or "arithmetic".
[[nodiscard]] const char* to_string(BagMethod method) noexcept;

/// Parse "geometric" / "arithmetic". Returns `nullopt` for anything else.
[[nodiscard]] std::optional<BagMethod> parse_bag_method(std::string_view text) noexcept;

/// Stateless bagging utilities.
class Ensembler {
public:
    /// Combine `predictions` with `method`.
    [[nodiscard]] static ProbabilityMatrix bag(std::span<const ProbabilityMatrix> predictions,
                                               BagMethod method);

    /// Element-wise mean.
    [[nodiscard]] static ProbabilityMatrix
    arithmetic_mean(std::span<const ProbabilityMatrix> predictions);

    /// Element-wise K-th root of the product, rows renormalised.
    [[nodiscard]] static ProbabilityMatrix
    geometric_mean(std::span<const ProbabilityMatrix> predictions);

private:
    /// Throws EmptySource / ShapeMismatch as documented above.
    static void check_shapes(std::span<const ProbabilityMatrix> predictions);
};

}  // namespace rfmc::ensemble
