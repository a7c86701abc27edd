/// @file src/data/signal_repository.cpp
/// @brief SignalRepository — per-class concatenation and label assignment.

#include "rfmc/signal_repository.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

namespace rfmc::data {

LabelledBatch SignalRepository::load(std::span<const ClassSource> sources) {
    if (sources.empty()) {
        throw EmptySource("no class sources supplied");
    }

    // ── Validate every class before allocating ────────────────────────────────
    std::size_t total  = 0;
    Eigen::Index length = -1;
    for (std::size_t cls = 0; cls < sources.size(); ++cls) {
        const ClassSource& source = sources[cls];
        if (source.empty()) {
            throw EmptySource(fmt::format("class {} yields zero signals", cls));
        }
        for (std::size_t i = 0; i < source.size(); ++i) {
            const Eigen::Index cols = source[i].cols();
            if (length < 0) {
                length = cols;
            }
            if (cols == 0 || cols != length) {
                throw ShapeMismatch(fmt::format(
                    "class {} signal {} has shape (2, {}), expected (2, {})",
                    cls, i, cols, length));
            }
        }
        total += source.size();
    }

    // ── Concatenate in source order ───────────────────────────────────────────
    LabelledBatch out{
        .signals     = SignalBatch(total, static_cast<std::size_t>(length)),
        .labels      = {},
        .num_classes = sources.size(),
    };
    out.labels.reserve(total);

    std::size_t row = 0;
    for (std::size_t cls = 0; cls < sources.size(); ++cls) {
        for (const Signal& s : sources[cls]) {
            out.signals.channel(row, 0) = s.row(0);
            out.signals.channel(row, 1) = s.row(1);
            out.labels.push_back(static_cast<int>(cls));
            ++row;
        }
    }

    return out;
}

}  // namespace rfmc::data
