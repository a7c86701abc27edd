#pragma once

/// @file include/rfmc/transform.hpp
/// @brief RepresentationTransformer — IQ → FFT and IQ → AP batch transforms.
///
/// # Module: Representation Transformer
///
/// ## Responsibility
/// Derive the two alternative views of a normalized IQ batch that the
/// ensemble trains on. Every transform is a pure function: it reads the input
/// batch and returns a new batch of identical shape (N, 2, L).
///
/// ## FFT Representation
/// For every sample n:
///   z[t]  = I[t] + i·Q[t]                       t = 0..L-1
///   Z[k]  = Σₜ z[t] · e^{-2πi·k·t/L}            (unscaled forward DFT)
///   S     = fftshift(Z)                          zero frequency at index ⌊L/2⌋
///   out   = [Re(S), Im(S)]
///
/// ## AP Representation
/// For every sample n and every time step t:
///   A[t] = √(I[t]² + Q[t]²)          amplitude, ≥ 0
///   φ[t] = atan2(Q[t], I[t])         phase, in (−π, π]
///   out  = [A, φ]
///
/// Amplitude and phase are full time series of length L, one value per time
/// step, not a single value per sample.
///
/// ## Guarantees
/// - Deterministic: identical input produces bit-identical output
/// - No shared state: safe to call concurrently on the same input batch
/// - Input batch is never modified

#include "rfmc/types.hpp"

#include <complex>
#include <span>
#include <vector>

namespace rfmc::dsp {

using ComplexVector = std::vector<std::complex<double>>;

// ─── Shift helpers ────────────────────────────────────────────────────────────

/// Rotate so the zero-frequency bin moves to index ⌊L/2⌋.
/// out[(i + ⌊L/2⌋) mod L] = in[i].
[[nodiscard]] ComplexVector fft_shift(std::span<const std::complex<double>> spectrum);

/// Inverse of fft_shift: out[i] = in[(i + ⌊L/2⌋) mod L].
[[nodiscard]] ComplexVector ifft_shift(std::span<const std::complex<double>> spectrum);

// ─── Batch transforms ─────────────────────────────────────────────────────────

/// Centered DFT of every sample: channel 0 = real part, channel 1 = imaginary.
[[nodiscard]] SignalBatch to_fft(const SignalBatch& iq);

/// Inverse of to_fft: undo the shift, inverse DFT scaled by 1/L, split into
/// I and Q.
[[nodiscard]] SignalBatch inverse_fft(const SignalBatch& spectrum);

/// Per-time-step amplitude (channel 0) and phase (channel 1).
[[nodiscard]] SignalBatch to_ap(const SignalBatch& iq);

/// Dispatch on `target`. IQ returns a copy of the input.
[[nodiscard]] SignalBatch transform(const SignalBatch& iq, Representation target);

// ─── RepresentationSet ────────────────────────────────────────────────────────

/// The three views of one physical batch. Index n refers to the same signal
/// in every member.
struct RepresentationSet {
    SignalBatch iq;
    SignalBatch fft;
    SignalBatch ap;

    [[nodiscard]] const SignalBatch& get(Representation r) const noexcept;
};

/// Build all three representations from one normalized IQ batch.
[[nodiscard]] RepresentationSet make_representations(const SignalBatch& iq);

}  // namespace rfmc::dsp
