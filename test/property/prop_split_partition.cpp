/**
 * @file  prop_split_partition.cpp
 * @brief Property: ∀ N ≥ 2, f ∈ (0,1), seed: split(N, f, seed) partitions 0..N−1
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_split_partition
 *
 * Invariants:
 *   train ∪ test = {0, …, N−1},  train ∩ test = ∅
 *   |test| = clamp(round(N·f), 1, N−1)
 *   same seed → identical partition
 *
 * A partition that drops or duplicates an index would silently misalign
 * labels with samples in one of the three representations.
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cstdint>
#include <vector>

#include "rfmc/splitter.hpp"
#include "rfmc/transform.hpp"

using namespace rfmc;
using namespace rfmc::data;

int main() {
    bool ok = true;

    // ── Property 1: disjoint and exhaustive ─────────────────────────────────
    ok &= rc::check(
        "split_partition: train and test partition 0..N-1",
        [](std::uint64_t seed) {
            const auto n = *rc::gen::inRange<std::size_t>(2, 2000);
            const double f = *rc::gen::inRange(1, 999) / 1000.0;

            const SplitIndices s = DatasetSplitter::split(n, f, seed);
            RC_ASSERT(s.train.size() + s.test.size() == n);
            RC_ASSERT(s.test.size() == DatasetSplitter::test_count(n, f));
            RC_ASSERT(!s.train.empty());
            RC_ASSERT(!s.test.empty());

            std::vector<bool> seen(n, false);
            for (std::size_t i : s.train) {
                RC_ASSERT(i < n);
                RC_ASSERT(!seen[i]);
                seen[i] = true;
            }
            for (std::size_t i : s.test) {
                RC_ASSERT(i < n);
                RC_ASSERT(!seen[i]);
                seen[i] = true;
            }
            RC_ASSERT(std::all_of(seen.begin(), seen.end(), [](bool b) { return b; }));
        }
    );

    // ── Property 2: determinism ─────────────────────────────────────────────
    ok &= rc::check(
        "split_partition: same seed gives the same partition",
        [](std::uint64_t seed) {
            const auto n = *rc::gen::inRange<std::size_t>(2, 500);
            const SplitIndices a = DatasetSplitter::split(n, 0.25, seed);
            const SplitIndices b = DatasetSplitter::split(n, 0.25, seed);
            RC_ASSERT(a.train == b.train);
            RC_ASSERT(a.test == b.test);
        }
    );

    // ── Property 3: label alignment survives split_dataset ──────────────────
    ok &= rc::check(
        "split_partition: every split row keeps its own label",
        [](std::uint64_t seed) {
            const auto n = *rc::gen::inRange<std::size_t>(2, 120);
            SignalBatch iq(n, 4);
            LabelVector labels(n);
            for (std::size_t i = 0; i < n; ++i) {
                iq.channel(i, 0).setConstant(static_cast<double>(i) + 1.0);
                iq.channel(i, 1).setConstant(-static_cast<double>(i) - 1.0);
                labels[i] = static_cast<int>(i);
            }
            const DatasetSplit split =
                split_dataset(dsp::make_representations(iq), labels, 0.3, seed);

            for (std::size_t k = 0; k < split.train_labels.size(); ++k) {
                RC_ASSERT(split.train.iq.at(k, 0, 3) ==
                          static_cast<double>(split.train_labels[k]) + 1.0);
            }
            for (std::size_t k = 0; k < split.test_labels.size(); ++k) {
                RC_ASSERT(split.test.iq.at(k, 1, 0) ==
                          -static_cast<double>(split.test_labels[k]) - 1.0);
            }
        }
    );

    return ok ? 0 : 1;
}
