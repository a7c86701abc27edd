#pragma once

/// @file include/rfmc/types.hpp
/// @brief Shared value types for the RF Modulation Classification (RFMC)
///        ensemble.
///
/// All modules include this file. It defines the batch container that carries
/// every signal representation, the label and probability aliases, and the
/// Eigen-based storage behind them.
///
/// ## Memory Layout
/// A SignalBatch of logical shape (N, 2, L) is stored as a row-major
/// N × 2L matrix. Row n is `[ch0(0..L-1), ch1(0..L-1)]`, so sample n,
/// channel c, bin t lives at column `c·L + t`. Every channel is therefore a
/// contiguous run of L doubles and can be viewed without copying.

#include "rfmc/constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace rfmc {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Row-major dynamic matrix used as SignalBatch storage.
using RowMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// One signal: row 0 = in-phase (I), row 1 = quadrature (Q), L columns.
using Signal = Eigen::Matrix<double, 2, Eigen::Dynamic, Eigen::RowMajor>;

/// Read-only view of one channel (L contiguous values).
using ChannelView = Eigen::Map<const Eigen::RowVectorXd>;

/// Mutable view of one channel.
using MutableChannelView = Eigen::Map<Eigen::RowVectorXd>;

/// (M, C) row-stochastic matrix: row m is a distribution over C classes.
using ProbabilityMatrix = Eigen::MatrixXd;

/// (N, C) one-hot encoding of a LabelVector.
using LabelMatrix = Eigen::MatrixXd;

/// N integer class labels in [0, C), aligned with a SignalBatch.
using LabelVector = std::vector<int>;

// ─── Representation ───────────────────────────────────────────────────────────

/// Which transform produced a SignalBatch.
enum class Representation {
    IQ,   ///< In-phase / quadrature (time domain)
    FFT,  ///< Centered DFT, real / imaginary
    AP,   ///< Amplitude / phase (time domain)
};

/// All representations in pipeline order.
inline constexpr Representation ALL_REPRESENTATIONS[] = {
    Representation::IQ, Representation::FFT, Representation::AP};

/// "IQ", "FFT" or "AP".
[[nodiscard]] const char* to_string(Representation r) noexcept;

// ─── SignalBatch ──────────────────────────────────────────────────────────────

/// An ordered collection of N two-channel signals of length L.
///
/// Value type: copying a batch copies its samples. Stages never modify a
/// batch they receive; each returns a freshly built one.
class SignalBatch {
public:
    /// Empty batch (N = 0, L = 0).
    SignalBatch() = default;

    /// Zero-filled batch of `count` signals with `length` samples per channel.
    ///
    /// # Throws
    /// InvalidArgument if `length` is zero.
    SignalBatch(std::size_t count, std::size_t length);

    /// Adopt an N × 2L matrix.
    ///
    /// # Throws
    /// InvalidArgument if `length` is zero, ShapeMismatch if
    /// `data.cols() != 2 · length`.
    SignalBatch(RowMatrix data, std::size_t length);

    /// Number of signals N.
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(data_.rows());
    }

    /// Samples per channel L.
    [[nodiscard]] std::size_t length() const noexcept { return length_; }

    [[nodiscard]] bool empty() const noexcept { return data_.rows() == 0; }

    /// Element (n, c, t). Unchecked.
    [[nodiscard]] double at(std::size_t n, std::size_t c, std::size_t t) const {
        return data_(static_cast<Eigen::Index>(n),
                     static_cast<Eigen::Index>(c * length_ + t));
    }

    [[nodiscard]] double& at(std::size_t n, std::size_t c, std::size_t t) {
        return data_(static_cast<Eigen::Index>(n),
                     static_cast<Eigen::Index>(c * length_ + t));
    }

    /// Contiguous view of channel `c` of sample `n`. Unchecked.
    [[nodiscard]] ChannelView channel(std::size_t n, std::size_t c) const {
        return ChannelView(data_.data() + offset(n, c),
                           static_cast<Eigen::Index>(length_));
    }

    [[nodiscard]] MutableChannelView channel(std::size_t n, std::size_t c) {
        return MutableChannelView(data_.data() + offset(n, c),
                                  static_cast<Eigen::Index>(length_));
    }

    /// Copy of sample `n` as a 2 × L signal.
    [[nodiscard]] Signal signal(std::size_t n) const;

    /// Underlying N × 2L storage.
    [[nodiscard]] const RowMatrix& data() const noexcept { return data_; }
    [[nodiscard]] RowMatrix&       data()       noexcept { return data_; }

private:
    [[nodiscard]] std::size_t offset(std::size_t n, std::size_t c) const noexcept {
        return n * constants::NUM_CHANNELS * length_ + c * length_;
    }

    RowMatrix   data_;
    std::size_t length_ = 0;
};

}  // namespace rfmc
