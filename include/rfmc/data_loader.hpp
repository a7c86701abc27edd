#pragma once

/// @file include/rfmc/data_loader.hpp
/// @brief CSV loader for per-class signal files.
///
/// # Module: SignalLoader
///
/// ## Responsibility
/// Parse a CSV file holding the signals of one modulation class into a
/// ClassSource. Malformed or non-finite rows are skipped; the loader never
/// crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// # optional comment lines
/// i0,i1,...,i(L-1),q0,q1,...,q(L-1)
/// i0,i1,...,i(L-1),q0,q1,...,q(L-1)
/// ```
/// One signal per line, 2L comma-separated values: the in-phase channel
/// followed by the quadrature channel. L is fixed by the first valid row;
/// rows of any other width are skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened
/// - Every returned signal has the same length
/// - Does not modify any file or external state

#include "rfmc/signal_repository.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rfmc::data {

class SignalLoader {
public:
    /// Load one class's signals from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty source if the file holds no valid rows
    /// - Parsed signals otherwise, skipping malformed rows
    [[nodiscard]] static std::optional<ClassSource>
    load_csv(const std::string& filepath) noexcept;

    /// Parse signals from CSV-formatted text (same format as `load_csv`).
    [[nodiscard]] static ClassSource
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Parse one row into a 2 × L signal.
    ///
    /// Returns `nullopt` for blank/comment lines, an odd or zero value
    /// count, unparsable tokens and non-finite values.
    [[nodiscard]] static std::optional<Signal>
    parse_row(std::string_view line) noexcept;
};

}  // namespace rfmc::data
