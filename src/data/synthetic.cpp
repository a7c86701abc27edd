/// @file src/data/synthetic.cpp
/// @brief SyntheticSource — PSK / QAM baseband generator with AWGN.

#include "rfmc/synthetic.hpp"
#include "rfmc/errors.hpp"

#include <cmath>
#include <complex>
#include <numbers>
#include <random>
#include <utility>

namespace rfmc::data {

namespace {

using Complex = std::complex<double>;

/// Constellation size of `mod`.
std::uint64_t order(Modulation mod) noexcept {
    switch (mod) {
        case Modulation::BPSK:  return 2;
        case Modulation::QPSK:  return 4;
        case Modulation::PSK8:  return 8;
        case Modulation::QAM16: return 16;
    }
    return 2;
}

/// Unit-average-energy constellation point `k` of `mod`.
Complex symbol(Modulation mod, std::uint64_t k) noexcept {
    switch (mod) {
        case Modulation::BPSK:
            return {k == 0 ? 1.0 : -1.0, 0.0};
        case Modulation::QPSK: {
            const double a = 1.0 / std::numbers::sqrt2;
            return {(k & 1U) ? -a : a, (k & 2U) ? -a : a};
        }
        case Modulation::PSK8:
            return std::polar(1.0, 2.0 * std::numbers::pi * static_cast<double>(k) / 8.0);
        case Modulation::QAM16: {
            // Levels {-3, -1, 1, 3}; mean energy 10.
            static constexpr double LEVELS[] = {-3.0, -1.0, 1.0, 3.0};
            const double scale = 1.0 / std::sqrt(10.0);
            return {LEVELS[k & 3U] * scale, LEVELS[(k >> 2) & 3U] * scale};
        }
    }
    return {1.0, 0.0};
}

}  // namespace

// ─── Modulation strings ───────────────────────────────────────────────────────

const char* to_string(Modulation mod) noexcept {
    switch (mod) {
        case Modulation::BPSK:  return "BPSK";
        case Modulation::QPSK:  return "QPSK";
        case Modulation::PSK8:  return "8PSK";
        case Modulation::QAM16: return "16QAM";
    }
    return "Unknown";
}

std::optional<Modulation> parse_modulation(std::string_view text) noexcept {
    for (Modulation m : {Modulation::BPSK, Modulation::QPSK,
                         Modulation::PSK8, Modulation::QAM16}) {
        if (text == to_string(m)) {
            return m;
        }
    }
    return std::nullopt;
}

// ─── SyntheticSource::generate ────────────────────────────────────────────────

std::vector<ClassSource> SyntheticSource::generate(const SyntheticConfig& config) {
    if (config.classes.empty()) {
        throw EmptySource("no modulation classes configured");
    }
    if (config.length == 0 || config.signals_per_class == 0 ||
        config.samples_per_symbol == 0) {
        throw InvalidArgument(
            "length, signals_per_class and samples_per_symbol must be positive");
    }
    if (!std::isfinite(config.snr_db) || !std::isfinite(config.carrier_offset)) {
        throw InvalidArgument("snr_db and carrier_offset must be finite");
    }

    std::mt19937_64 rng(config.seed);
    const double snr_linear = std::pow(10.0, config.snr_db / 10.0);
    std::normal_distribution<double> noise(0.0, std::sqrt(1.0 / (2.0 * snr_linear)));

    const auto length = static_cast<Eigen::Index>(config.length);
    const double omega = 2.0 * std::numbers::pi * config.carrier_offset;

    std::vector<ClassSource> sources;
    sources.reserve(config.classes.size());

    for (Modulation mod : config.classes) {
        ClassSource source;
        source.reserve(config.signals_per_class);
        const std::uint64_t m = order(mod);

        for (std::size_t s = 0; s < config.signals_per_class; ++s) {
            Signal sig(2, length);
            Complex current{};
            for (Eigen::Index t = 0; t < length; ++t) {
                if (static_cast<std::size_t>(t) % config.samples_per_symbol == 0) {
                    current = symbol(mod, rng() % m);
                }
                const Complex rotated =
                    current * std::polar(1.0, omega * static_cast<double>(t));
                sig(0, t) = rotated.real() + noise(rng);
                sig(1, t) = rotated.imag() + noise(rng);
            }
            source.push_back(std::move(sig));
        }
        sources.push_back(std::move(source));
    }

    return sources;
}

}  // namespace rfmc::data
