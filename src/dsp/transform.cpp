/// @file src/dsp/transform.cpp
/// @brief IQ → FFT and IQ → AP representation transforms.
///
/// The DFT is Eigen's FFT module (kissfft backend), which handles any
/// positive length. A fresh Eigen::FFT object is created per call because
/// it caches plans internally and is not safe to share between threads.

#include "rfmc/transform.hpp"

#include <unsupported/Eigen/FFT>

#include <cmath>
#include <numbers>

namespace rfmc::dsp {

namespace {

/// Copy channel pair (I, Q) of sample `n` into a complex vector.
void load_complex(const SignalBatch& batch, std::size_t n, ComplexVector& out) {
    const auto re = batch.channel(n, 0);
    const auto im = batch.channel(n, 1);
    for (Eigen::Index t = 0; t < re.size(); ++t) {
        out[static_cast<std::size_t>(t)] = {re(t), im(t)};
    }
}

/// Write a complex vector back as (real, imaginary) channels of sample `n`.
void store_complex(const ComplexVector& in, std::size_t n, SignalBatch& batch) {
    auto re = batch.channel(n, 0);
    auto im = batch.channel(n, 1);
    for (Eigen::Index t = 0; t < re.size(); ++t) {
        re(t) = in[static_cast<std::size_t>(t)].real();
        im(t) = in[static_cast<std::size_t>(t)].imag();
    }
}

}  // namespace

// ─── Shift helpers ────────────────────────────────────────────────────────────

ComplexVector fft_shift(std::span<const std::complex<double>> spectrum) {
    const std::size_t len  = spectrum.size();
    ComplexVector out(len);
    const std::size_t half = len / 2;
    for (std::size_t i = 0; i < len; ++i) {
        out[(i + half) % len] = spectrum[i];
    }
    return out;
}

ComplexVector ifft_shift(std::span<const std::complex<double>> spectrum) {
    const std::size_t len  = spectrum.size();
    ComplexVector out(len);
    const std::size_t half = len / 2;
    for (std::size_t i = 0; i < len; ++i) {
        out[i] = spectrum[(i + half) % len];
    }
    return out;
}

// ─── to_fft ───────────────────────────────────────────────────────────────────

SignalBatch to_fft(const SignalBatch& iq) {
    if (iq.empty()) {
        return iq;
    }

    const std::size_t len = iq.length();
    SignalBatch out(iq.size(), len);

    Eigen::FFT<double> fft;
    ComplexVector time(len);
    ComplexVector freq(len);

    for (std::size_t n = 0; n < iq.size(); ++n) {
        load_complex(iq, n, time);
        fft.fwd(freq.data(), time.data(), static_cast<Eigen::Index>(len));
        store_complex(fft_shift(freq), n, out);
    }

    return out;
}

// ─── inverse_fft ──────────────────────────────────────────────────────────────

SignalBatch inverse_fft(const SignalBatch& spectrum) {
    if (spectrum.empty()) {
        return spectrum;
    }

    const std::size_t len = spectrum.length();
    SignalBatch out(spectrum.size(), len);

    Eigen::FFT<double> fft;  // scaled inverse (1/L) by default
    ComplexVector freq(len);
    ComplexVector time(len);

    for (std::size_t n = 0; n < spectrum.size(); ++n) {
        load_complex(spectrum, n, freq);
        const ComplexVector unshifted = ifft_shift(freq);
        fft.inv(time.data(), unshifted.data(), static_cast<Eigen::Index>(len));
        store_complex(time, n, out);
    }

    return out;
}

// ─── to_ap ────────────────────────────────────────────────────────────────────

SignalBatch to_ap(const SignalBatch& iq) {
    if (iq.empty()) {
        return iq;
    }

    SignalBatch out(iq.size(), iq.length());

    for (std::size_t n = 0; n < iq.size(); ++n) {
        const auto i_ch = iq.channel(n, 0);
        const auto q_ch = iq.channel(n, 1);
        auto amp   = out.channel(n, 0);
        auto phase = out.channel(n, 1);

        for (Eigen::Index t = 0; t < i_ch.size(); ++t) {
            amp(t) = std::hypot(i_ch(t), q_ch(t));

            double p = std::atan2(q_ch(t), i_ch(t));
            // atan2(-0.0, x<0) yields exactly -π; the range is (−π, π].
            if (p == -std::numbers::pi) {
                p = std::numbers::pi;
            }
            phase(t) = p;
        }
    }

    return out;
}

// ─── transform ────────────────────────────────────────────────────────────────

SignalBatch transform(const SignalBatch& iq, Representation target) {
    switch (target) {
        case Representation::FFT: return to_fft(iq);
        case Representation::AP:  return to_ap(iq);
        case Representation::IQ:  break;
    }
    return iq;
}

// ─── RepresentationSet ────────────────────────────────────────────────────────

const SignalBatch& RepresentationSet::get(Representation r) const noexcept {
    switch (r) {
        case Representation::FFT: return fft;
        case Representation::AP:  return ap;
        case Representation::IQ:  break;
    }
    return iq;
}

RepresentationSet make_representations(const SignalBatch& iq) {
    return RepresentationSet{
        .iq  = iq,
        .fft = to_fft(iq),
        .ap  = to_ap(iq),
    };
}

}  // namespace rfmc::dsp
