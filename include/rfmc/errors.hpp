#pragma once

/// @file include/rfmc/errors.hpp
/// @brief Typed failures raised by the RFMC core.
///
/// Every stage validates its own input contract before computing and raises
/// one of the exceptions below instead of producing numerically invalid
/// output. Failures are deterministic: the same input always fails the same
/// way, so they indicate a caller contract violation, never a transient fault.
///
/// ## Taxonomy
///   - ShapeMismatch      dimension/shape contract violated between arrays
///   - EmptySource        a required input collection is empty
///   - DegenerateSignal   zero-norm or non-finite sample during normalization
///   - DimensionMismatch  label/prediction count mismatch at scoring time
///   - InvalidArgument    configuration value outside its documented range
///   - InvalidProbability prediction entry non-finite or outside [0, 1], or a
///                        row that does not sum to 1
///
/// The core never catches these. The orchestration layer (CLI) decides
/// whether to abort the run.

#include <stdexcept>
#include <string>

namespace rfmc {

/// Discriminator carried by every rfmc::Error.
enum class ErrorKind {
    ShapeMismatch,
    EmptySource,
    DegenerateSignal,
    DimensionMismatch,
    InvalidArgument,
    InvalidProbability,
};

/// Stable name of an ErrorKind, e.g. "ShapeMismatch".
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// Base class of all RFMC failures. `what()` is "<Kind>: <detail>".
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& detail);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ShapeMismatch : public Error {
public:
    explicit ShapeMismatch(const std::string& detail)
        : Error(ErrorKind::ShapeMismatch, detail) {}
};

class EmptySource : public Error {
public:
    explicit EmptySource(const std::string& detail)
        : Error(ErrorKind::EmptySource, detail) {}
};

class DegenerateSignal : public Error {
public:
    explicit DegenerateSignal(const std::string& detail)
        : Error(ErrorKind::DegenerateSignal, detail) {}
};

class DimensionMismatch : public Error {
public:
    explicit DimensionMismatch(const std::string& detail)
        : Error(ErrorKind::DimensionMismatch, detail) {}
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& detail)
        : Error(ErrorKind::InvalidArgument, detail) {}
};

class InvalidProbability : public Error {
public:
    explicit InvalidProbability(const std::string& detail)
        : Error(ErrorKind::InvalidProbability, detail) {}
};

}  // namespace rfmc
