/// @file tests/dsp/test_transform.cpp
/// @brief Unit tests for the IQ → FFT and IQ → AP representation transforms.
///
/// Test categories:
///   - Centered DFT of a known length-4 signal
///   - fft_shift / ifft_shift index semantics for even and odd lengths
///   - FFT → inverse FFT round trip
///   - Amplitude / phase evaluated at every time step
///   - Phase range (−π, π], with −π folded to +π
///   - RepresentationSet lookup and empty batches

#include <gtest/gtest.h>
#include "rfmc/constants.hpp"
#include "rfmc/transform.hpp"

#include <cmath>
#include <complex>
#include <numbers>

using namespace rfmc;
using namespace rfmc::dsp;

namespace {

constexpr double PI = std::numbers::pi;

/// Single-sample batch from explicit I and Q channels.
SignalBatch one_signal(std::initializer_list<double> i, std::initializer_list<double> q) {
    SignalBatch b(1, i.size());
    std::size_t t = 0;
    for (double v : i) b.at(0, 0, t++) = v;
    t = 0;
    for (double v : q) b.at(0, 1, t++) = v;
    return b;
}

}  // namespace

// ─── FFT ─────────────────────────────────────────────────────────────────────

TEST(ToFft, KnownLength4Spectrum) {
    // DFT of [1,2,3,4] is [10, −2+2j, −2, −2−2j]; centered: [X2, X3, X0, X1].
    const SignalBatch out = to_fft(one_signal({1, 2, 3, 4}, {0, 0, 0, 0}));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out.length(), 4u);

    const double re[] = {-2.0, -2.0, 10.0, -2.0};
    const double im[] = { 0.0, -2.0,  0.0,  2.0};
    for (std::size_t k = 0; k < 4; ++k) {
        EXPECT_NEAR(out.at(0, 0, k), re[k], 1e-12) << "bin " << k;
        EXPECT_NEAR(out.at(0, 1, k), im[k], 1e-12) << "bin " << k;
    }
}

TEST(ToFft, ImpulseHasFlatSpectrum) {
    const SignalBatch out = to_fft(one_signal({1, 0, 0, 0, 0}, {0, 0, 0, 0, 0}));
    for (std::size_t k = 0; k < 5; ++k) {
        EXPECT_NEAR(out.at(0, 0, k), 1.0, 1e-12);
        EXPECT_NEAR(out.at(0, 1, k), 0.0, 1e-12);
    }
}

TEST(ToFft, ToneLandsInShiftedBin) {
    // e^{j·2π·t/8}: bin 1, which sits at index 1 + 8/2 after the shift.
    SignalBatch b(1, 8);
    for (std::size_t t = 0; t < 8; ++t) {
        b.at(0, 0, t) = std::cos(2.0 * PI * static_cast<double>(t) / 8.0);
        b.at(0, 1, t) = std::sin(2.0 * PI * static_cast<double>(t) / 8.0);
    }
    const SignalBatch out = to_fft(b);
    for (std::size_t k = 0; k < 8; ++k) {
        const double mag = std::hypot(out.at(0, 0, k), out.at(0, 1, k));
        EXPECT_NEAR(mag, k == 5 ? 8.0 : 0.0, 1e-9) << "bin " << k;
    }
}

TEST(ToFft, ReferenceLengthTonesAtPinnedBins) {
    // L = 1024: DC sits at index 512; bin +37 at 549, bin −100 at 412.
    constexpr std::size_t L = constants::REFERENCE_SIGNAL_LENGTH;
    SignalBatch b(2, L);
    for (std::size_t t = 0; t < L; ++t) {
        const double up   =  2.0 * PI * 37.0  * static_cast<double>(t) / static_cast<double>(L);
        const double down = -2.0 * PI * 100.0 * static_cast<double>(t) / static_cast<double>(L);
        b.at(0, 0, t) = std::cos(up);
        b.at(0, 1, t) = std::sin(up);
        b.at(1, 0, t) = std::cos(down);
        b.at(1, 1, t) = std::sin(down);
    }
    const SignalBatch out = to_fft(b);
    ASSERT_EQ(out.length(), L);

    const std::size_t peak[] = {L / 2 + 37, L / 2 - 100};
    for (std::size_t n = 0; n < 2; ++n) {
        for (std::size_t k = 0; k < L; ++k) {
            const double mag = std::hypot(out.at(n, 0, k), out.at(n, 1, k));
            EXPECT_NEAR(mag, k == peak[n] ? static_cast<double>(L) : 0.0, 1e-7)
                << "sample " << n << " bin " << k;
        }
    }
}

TEST(ToFft, PreservesShapeAndSampleOrder) {
    SignalBatch b(3, 16);
    for (std::size_t n = 0; n < 3; ++n) {
        b.at(n, 0, 0) = static_cast<double>(n + 1);  // impulse of height n+1
    }
    const SignalBatch out = to_fft(b);
    EXPECT_EQ(out.size(), 3u);
    EXPECT_EQ(out.length(), 16u);
    for (std::size_t n = 0; n < 3; ++n) {
        EXPECT_NEAR(out.at(n, 0, 7), static_cast<double>(n + 1), 1e-12);
    }
}

TEST(ShiftHelpers, MatchCenteredOrdering) {
    const ComplexVector even = {0.0, 1.0, 2.0, 3.0};
    const ComplexVector odd  = {0.0, 1.0, 2.0, 3.0, 4.0};

    const ComplexVector se = fft_shift(even);
    const ComplexVector so = fft_shift(odd);
    EXPECT_EQ(se, (ComplexVector{2.0, 3.0, 0.0, 1.0}));
    EXPECT_EQ(so, (ComplexVector{3.0, 4.0, 0.0, 1.0, 2.0}));

    EXPECT_EQ(ifft_shift(se), even);
    EXPECT_EQ(ifft_shift(so), odd);
}

TEST(InverseFft, RoundTripRecoversSignal) {
    SignalBatch b(2, 7);
    for (std::size_t n = 0; n < 2; ++n) {
        for (std::size_t t = 0; t < 7; ++t) {
            b.at(n, 0, t) = std::sin(0.3 * static_cast<double>(t + n));
            b.at(n, 1, t) = std::cos(1.1 * static_cast<double>(t) - static_cast<double>(n));
        }
    }
    const SignalBatch back = inverse_fft(to_fft(b));
    EXPECT_TRUE(back.data().isApprox(b.data(), 1e-9));
}

// ─── AP ──────────────────────────────────────────────────────────────────────

TEST(ToAp, ComputedAtEveryTimeStep) {
    const SignalBatch out = to_ap(one_signal({1, 0, -1, 0}, {0, 1, 0, -1}));
    const double phase[] = {0.0, PI / 2.0, PI, -PI / 2.0};
    for (std::size_t t = 0; t < 4; ++t) {
        EXPECT_NEAR(out.at(0, 0, t), 1.0, 1e-12) << "t=" << t;
        EXPECT_NEAR(out.at(0, 1, t), phase[t], 1e-12) << "t=" << t;
    }
}

TEST(ToAp, AmplitudeVariesPerSample) {
    const SignalBatch out = to_ap(one_signal({3, 0, 1, 5}, {4, 2, 0, 12}));
    const double amp[] = {5.0, 2.0, 1.0, 13.0};
    for (std::size_t t = 0; t < 4; ++t) {
        EXPECT_DOUBLE_EQ(out.at(0, 0, t), amp[t]);
    }
}

TEST(ToAp, NegativeZeroImaginaryFoldsToPlusPi) {
    const SignalBatch out = to_ap(one_signal({-1.0, -1.0}, {-0.0, 0.0}));
    EXPECT_DOUBLE_EQ(out.at(0, 1, 0), PI);
    EXPECT_DOUBLE_EQ(out.at(0, 1, 1), PI);
}

TEST(ToAp, OriginHasZeroAmplitudeAndPhase) {
    const SignalBatch out = to_ap(one_signal({0.0}, {0.0}));
    EXPECT_DOUBLE_EQ(out.at(0, 0, 0), 0.0);
    EXPECT_DOUBLE_EQ(out.at(0, 1, 0), 0.0);
}

TEST(ToAp, Deterministic) {
    const SignalBatch in = one_signal({0.3, -0.7, 0.1}, {-0.2, 0.9, -0.4});
    EXPECT_TRUE(to_ap(in).data() == to_ap(in).data());
}

// ─── RepresentationSet ───────────────────────────────────────────────────────

TEST(Representations, SetHoldsAllThree) {
    const SignalBatch iq = one_signal({1, 2, 3, 4}, {0, 1, 0, 1});
    const RepresentationSet reps = make_representations(iq);

    EXPECT_TRUE(reps.get(Representation::IQ).data() == iq.data());
    EXPECT_TRUE(reps.get(Representation::FFT).data() == to_fft(iq).data());
    EXPECT_TRUE(reps.get(Representation::AP).data() == to_ap(iq).data());
    EXPECT_TRUE(transform(iq, Representation::IQ).data() == iq.data());
}

TEST(Representations, EmptyBatchStaysEmpty) {
    const RepresentationSet reps = make_representations(SignalBatch{});
    EXPECT_TRUE(reps.iq.empty());
    EXPECT_TRUE(reps.fft.empty());
    EXPECT_TRUE(reps.ap.empty());
}
