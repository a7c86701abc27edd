/// @file src/dsp/normalizer.cpp
/// @brief Normalizer — row-wise l1 / l2 / max rescaling.
///
/// Each normalize() call:
///   1. Copies the input batch
///   2. For every sample (or every channel, per scope) computes the norm
///   3. Rejects zero-norm and non-finite rows with DegenerateSignal
///   4. Divides the row by its norm in place on the copy
///
/// l2 uses Eigen's stableNorm(), which rescales internally, so finite rows
/// with values near the overflow or underflow limits keep a nonzero norm.

#include "rfmc/normalizer.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace rfmc::dsp {

// ─── NormKind strings ─────────────────────────────────────────────────────────

const char* to_string(NormKind kind) noexcept {
    switch (kind) {
        case NormKind::L1:  return "l1";
        case NormKind::L2:  return "l2";
        case NormKind::Max: return "max";
    }
    return "unknown";
}

std::optional<NormKind> parse_norm_kind(std::string_view text) noexcept {
    if (text == "l1")  return NormKind::L1;
    if (text == "l2")  return NormKind::L2;
    if (text == "max") return NormKind::Max;
    return std::nullopt;
}

// ─── Constructor ──────────────────────────────────────────────────────────────

Normalizer::Normalizer(NormalizerConfig config) noexcept
    : config_(config) {}

// ─── norm ─────────────────────────────────────────────────────────────────────

double Normalizer::norm(const Eigen::Ref<const Eigen::RowVectorXd>& values, NormKind kind) {
    if (values.size() == 0) {
        return 0.0;
    }
    switch (kind) {
        case NormKind::L1:  return values.lpNorm<1>();
        case NormKind::L2:  return values.stableNorm();
        case NormKind::Max: return values.lpNorm<Eigen::Infinity>();
    }
    return 0.0;
}

// ─── normalize ────────────────────────────────────────────────────────────────

SignalBatch Normalizer::normalize(const SignalBatch& batch) const {
    SignalBatch out = batch;
    if (out.empty()) {
        return out;
    }

    const auto length = static_cast<Eigen::Index>(out.length());
    const auto total  = static_cast<Eigen::Index>(constants::NUM_CHANNELS) * length;
    // Sample scope treats the whole 2L row as one vector.
    const Eigen::Index width    = (config_.scope == NormScope::Sample) ? total : length;
    const Eigen::Index segments = total / width;

    for (std::size_t n = 0; n < out.size(); ++n) {
        auto row = out.data().row(static_cast<Eigen::Index>(n));
        for (Eigen::Index seg = 0; seg < segments; ++seg) {
            auto values = row.segment(seg * width, width);

            if (!values.allFinite()) {
                throw DegenerateSignal(fmt::format(
                    "sample {} contains non-finite values", n));
            }

            const double peak = values.lpNorm<Eigen::Infinity>();
            if (!(peak > 0.0)) {
                throw DegenerateSignal(fmt::format(
                    "sample {}{} has zero {} norm", n,
                    config_.scope == NormScope::Channel
                        ? fmt::format(" channel {}", seg) : std::string{},
                    to_string(config_.norm)));
            }

            double nrm = norm(values, config_.norm);
            if (!std::isfinite(nrm)) {
                // l1 of values near DBL_MAX: bring the peak to 1 first.
                values /= peak;
                nrm = norm(values, config_.norm);
            }
            values /= nrm;
        }
    }

    return out;
}

}  // namespace rfmc::dsp
