#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/rfmc/constants.hpp
/// @brief Signal-shape, numeric and training constants for the RFMC system.

namespace rfmc::constants {

// ─── Signal Shape ─────────────────────────────────────────────────────────────

/// Channels per signal: in-phase (0) and quadrature (1).
static constexpr std::size_t NUM_CHANNELS = 2;

/// Samples per channel in the reference configuration.
static constexpr std::size_t REFERENCE_SIGNAL_LENGTH = 1024;

/// Modulation classes in the reference task.
static constexpr std::size_t REFERENCE_NUM_CLASSES = 3;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Probability floor applied before taking the log in log-loss.
/// A prediction of exactly 0 for the true class costs -ln(1e-15) ≈ 34.54.
static constexpr double LOG_LOSS_EPSILON = 1e-15;

/// Upper bound of the bounded score: score = SCORE_SCALE / (1 + logLoss).
static constexpr double SCORE_SCALE = 100.0;

/// Largest accepted |row sum − 1| of a probability matrix.
static constexpr double PROBABILITY_SUM_TOLERANCE = 1e-6;

/// Standard deviation below which a feature is treated as constant.
static constexpr double FLAT_STDDEV_THRESHOLD = 1e-12;

// ─── Dataset Split ────────────────────────────────────────────────────────────

/// Default fraction of samples held out for testing.
static constexpr double DEFAULT_TEST_FRACTION = 0.2;

/// Default seed for the train/test shuffle.
static constexpr std::uint64_t DEFAULT_SPLIT_SEED = 42;

// ─── Classifier Training ──────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_EPOCHS = 200;

/// Epochs without improvement before early stopping.
static constexpr std::size_t DEFAULT_PATIENCE = 10;

static constexpr double DEFAULT_LEARNING_RATE = 0.5;

/// Minimum loss decrease that counts as an improvement for early stopping.
static constexpr double EARLY_STOP_MIN_DELTA = 1e-6;

// ─── Synthetic Data ───────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_SIGNALS_PER_CLASS = 200;
static constexpr std::size_t DEFAULT_SAMPLES_PER_SYMBOL = 8;
static constexpr double      DEFAULT_SNR_DB = 10.0;
static constexpr std::uint64_t DEFAULT_SYNTHETIC_SEED = 7;

}  // namespace rfmc::constants
