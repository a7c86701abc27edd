/**
 * @file  fuzz_signal_loader.cpp
 * @brief libFuzzer target for the CSV SignalLoader and the transforms behind it
 *
 * Build:
 *   cmake -DRFMC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_signal_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_signal_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed signal:
 *      a. has the same length as the first one
 *      b. has length ≥ 1
 *      c. holds only finite values
 *   3. If at least one signal is parsed, normalization either succeeds with
 *      finite output or raises DegenerateSignal; AP amplitudes are ≥ 0 and
 *      phases lie in (−π, π].
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "-inf" tokens
 *     • Odd field counts, empty fields, trailing commas
 *     • Mixed line endings (LF, CRLF)
 *     • Exponential notation: "1e308", "1e-308"
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <string_view>
#include <vector>

#include "rfmc/data_loader.hpp"
#include "rfmc/errors.hpp"
#include "rfmc/normalizer.hpp"
#include "rfmc/signal_repository.hpp"
#include "rfmc/transform.hpp"

using namespace rfmc;
using namespace rfmc::data;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const ClassSource signals = SignalLoader::parse_csv_string(input);
    if (signals.empty()) {
        return 0;
    }

    // Invariant 2: uniform, non-empty, finite
    const Eigen::Index length = signals.front().cols();
    assert(length >= 1);
    for (const Signal& s : signals) {
        assert(s.cols() == length);
        assert(s.allFinite());
    }

    const std::vector<ClassSource> sources = {signals};
    const LabelledBatch dataset = SignalRepository::load(sources);

    SignalBatch normalized;
    try {
        normalized = dsp::Normalizer{}.normalize(dataset.signals);
    } catch (const DegenerateSignal&) {
        // Only an all-zero row is degenerate once parsing guaranteed finite values.
        bool has_zero_row = false;
        for (Eigen::Index n = 0; n < dataset.signals.data().rows(); ++n) {
            has_zero_row = has_zero_row || dataset.signals.data().row(n).isZero(0.0);
        }
        assert(has_zero_row);
        (void)has_zero_row;
        return 0;
    }
    assert(normalized.data().allFinite());

    // Invariant 3: AP ranges
    const SignalBatch ap = dsp::to_ap(normalized);
    for (std::size_t n = 0; n < ap.size(); ++n) {
        for (std::size_t t = 0; t < ap.length(); ++t) {
            assert(ap.at(n, 0, t) >= 0.0);
            assert(ap.at(n, 1, t) >  -std::numbers::pi);
            assert(ap.at(n, 1, t) <=  std::numbers::pi);
        }
    }

    const SignalBatch fft = dsp::to_fft(normalized);
    assert(fft.size() == normalized.size());
    (void)fft;

    return 0;
}
