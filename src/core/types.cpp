/// @file src/core/types.cpp
/// @brief SignalBatch construction and the string tables for shared enums.

#include "rfmc/types.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace rfmc {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Representation r) noexcept {
    switch (r) {
        case Representation::IQ:  return "IQ";
        case Representation::FFT: return "FFT";
        case Representation::AP:  return "AP";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ShapeMismatch:     return "ShapeMismatch";
        case ErrorKind::EmptySource:       return "EmptySource";
        case ErrorKind::DegenerateSignal:  return "DegenerateSignal";
        case ErrorKind::DimensionMismatch: return "DimensionMismatch";
        case ErrorKind::InvalidArgument:   return "InvalidArgument";
        case ErrorKind::InvalidProbability: return "InvalidProbability";
    }
    return "Unknown";
}

// ─── Error ────────────────────────────────────────────────────────────────────

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(fmt::format("{}: {}", to_string(kind), detail))
    , kind_(kind)
{}

// ─── SignalBatch ──────────────────────────────────────────────────────────────

SignalBatch::SignalBatch(std::size_t count, std::size_t length)
    : length_(length)
{
    if (length == 0) {
        throw InvalidArgument("signal length must be positive");
    }
    data_ = RowMatrix::Zero(static_cast<Eigen::Index>(count),
                            static_cast<Eigen::Index>(constants::NUM_CHANNELS * length));
}

SignalBatch::SignalBatch(RowMatrix data, std::size_t length)
    : data_(std::move(data))
    , length_(length)
{
    if (length == 0) {
        throw InvalidArgument("signal length must be positive");
    }
    const auto expected = static_cast<Eigen::Index>(constants::NUM_CHANNELS * length);
    if (data_.cols() != expected) {
        throw ShapeMismatch(fmt::format(
            "batch storage has {} columns, expected {} for length {}",
            data_.cols(), expected, length));
    }
}

Signal SignalBatch::signal(std::size_t n) const {
    Signal s(2, static_cast<Eigen::Index>(length_));
    s.row(0) = channel(n, 0);
    s.row(1) = channel(n, 1);
    return s;
}

}  // namespace rfmc
