#pragma once

/// @file include/rfmc/synthetic.hpp
/// @brief SyntheticSource — seeded generator of labelled modulated signals.
///
/// # Module: Synthetic Source
///
/// ## Responsibility
/// Produce per-class ClassSources of baseband signals for demos, tests and
/// benchmarks when no captured dataset is at hand.
///
/// ## Signal Model
/// For each signal of class `mod`:
///   1. Draw ⌈L / sps⌉ symbols uniformly from the unit-energy constellation
///      of `mod`.
///   2. Hold each symbol for `samples_per_symbol` samples (rectangular pulse).
///   3. Rotate by a carrier offset: s[t] · e^{j·2π·f·t}, f in cycles/sample.
///   4. Add complex white Gaussian noise with per-component variance
///      1 / (2 · 10^(snr_db / 10)).
///
/// ## Guarantees
/// - Deterministic for a given config (one std::mt19937_64 seeded with `seed`)
/// - Every signal has shape (2, length)

#include "rfmc/constants.hpp"
#include "rfmc/signal_repository.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace rfmc::data {

/// Digital modulation schemes the generator can synthesise.
enum class Modulation {
    BPSK,
    QPSK,
    PSK8,
    QAM16,
};

/// "BPSK", "QPSK", "8PSK" or "16QAM".
[[nodiscard]] const char* to_string(Modulation mod) noexcept;

/// Case-sensitive inverse of to_string.
[[nodiscard]] std::optional<Modulation> parse_modulation(std::string_view text) noexcept;

/// Generator settings. One class per entry of `classes`, in order.
struct SyntheticConfig {
    std::vector<Modulation> classes = {Modulation::BPSK, Modulation::QPSK, Modulation::QAM16};
    std::size_t   length             = constants::REFERENCE_SIGNAL_LENGTH;
    std::size_t   signals_per_class  = constants::DEFAULT_SIGNALS_PER_CLASS;
    std::size_t   samples_per_symbol = constants::DEFAULT_SAMPLES_PER_SYMBOL;
    double        snr_db             = constants::DEFAULT_SNR_DB;
    double        carrier_offset     = 0.0;  ///< cycles per sample
    std::uint64_t seed               = constants::DEFAULT_SYNTHETIC_SEED;
};

class SyntheticSource {
public:
    /// Generate one ClassSource per configured modulation.
    ///
    /// # Throws
    /// EmptySource if `classes` is empty; InvalidArgument if length,
    /// signals_per_class or samples_per_symbol is zero, or snr_db /
    /// carrier_offset is not finite.
    [[nodiscard]] static std::vector<ClassSource> generate(const SyntheticConfig& config);
};

}  // namespace rfmc::data
