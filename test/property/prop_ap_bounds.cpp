/**
 * @file  prop_ap_bounds.cpp
 * @brief Property: ∀ IQ: amplitude ≥ 0, phase ∈ (−π, π], and (A, φ) recovers (I, Q)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_ap_bounds
 *
 * Mathematical basis:
 *   A[t] = √(I[t]² + Q[t]²),  φ[t] = atan2(Q[t], I[t])
 *   I[t] = A[t]·cos φ[t],     Q[t] = A[t]·sin φ[t]
 *
 * Failure modes this test guards against:
 *   • Phase reported as exactly −π (half-open range violated)
 *   • AP computed once per signal instead of per time step
 *   • NaN from hypot/atan2 on signed zeros
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

#include "rfmc/transform.hpp"

using namespace rfmc;
using namespace rfmc::dsp;

namespace {

/// Batch of one signal from generated I/Q values mapped into [−10, 10].
SignalBatch batch_from(const std::vector<double>& raw_i, const std::vector<double>& raw_q) {
    const std::size_t len = std::min(raw_i.size(), raw_q.size());
    SignalBatch b(1, len);
    for (std::size_t t = 0; t < len; ++t) {
        b.at(0, 0, t) = 10.0 * std::tanh(raw_i[t]);
        b.at(0, 1, t) = 10.0 * std::tanh(raw_q[t]);
    }
    return b;
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: ranges ──────────────────────────────────────────────────
    ok &= rc::check(
        "ap_bounds: amplitude >= 0 and phase in (-pi, pi]",
        []() {
            const auto raw_i = *rc::gen::nonEmpty<std::vector<double>>();
            const auto raw_q = *rc::gen::container<std::vector<double>>(
                raw_i.size(), rc::gen::arbitrary<double>());

            const SignalBatch iq = batch_from(raw_i, raw_q);
            RC_PRE(iq.data().allFinite());
            const SignalBatch ap = to_ap(iq);

            for (std::size_t t = 0; t < ap.length(); ++t) {
                RC_ASSERT(ap.at(0, 0, t) >= 0.0);
                RC_ASSERT(ap.at(0, 1, t) > -std::numbers::pi);
                RC_ASSERT(ap.at(0, 1, t) <= std::numbers::pi);
            }
        }
    );

    // ── Property 2: polar round trip per time step ──────────────────────────
    ok &= rc::check(
        "ap_bounds: A cos(phi), A sin(phi) recovers I, Q at every step",
        []() {
            const auto len = *rc::gen::inRange<std::size_t>(1, 64);
            const auto raw_i = *rc::gen::container<std::vector<double>>(
                len, rc::gen::map(rc::gen::inRange(-1000, 1000),
                                  [](int v) { return v / 100.0; }));
            const auto raw_q = *rc::gen::container<std::vector<double>>(
                len, rc::gen::map(rc::gen::inRange(-1000, 1000),
                                  [](int v) { return v / 100.0; }));

            const SignalBatch iq = batch_from(raw_i, raw_q);
            const SignalBatch ap = to_ap(iq);
            for (std::size_t t = 0; t < len; ++t) {
                const double a = ap.at(0, 0, t);
                const double p = ap.at(0, 1, t);
                RC_ASSERT(std::abs(a * std::cos(p) - iq.at(0, 0, t)) < 1e-9);
                RC_ASSERT(std::abs(a * std::sin(p) - iq.at(0, 1, t)) < 1e-9);
            }
        }
    );

    // ── Property 3: determinism ─────────────────────────────────────────────
    ok &= rc::check(
        "ap_bounds: to_ap is deterministic",
        []() {
            const auto len = *rc::gen::inRange<std::size_t>(1, 32);
            const auto raw = *rc::gen::container<std::vector<double>>(
                len, rc::gen::map(rc::gen::inRange(-500, 500),
                                  [](int v) { return v / 50.0; }));
            const SignalBatch iq = batch_from(raw, raw);
            RC_ASSERT(to_ap(iq).data() == to_ap(iq).data());
        }
    );

    return ok ? 0 : 1;
}
